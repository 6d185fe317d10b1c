#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace eos {

// Raised by the sharing schemes.
class SecretSharingError : public std::runtime_error {
 public:
  enum class Code {
    kInsufficientShares,
    kInvalidShares,
    // Operation is structurally unsupported by the scheme.
    kReconstructionFailed,
    kInvalidInput
  };

  explicit SecretSharingError(Code code);
  SecretSharingError(Code code, const std::string& detail);

  [[nodiscard]] Code code() const { return code_; }

 private:
  Code code_;
};

// Raised by the executor, the operation modes and the local session. Scheme
// failures are wrapped with code kSecretSharing and keep their cause.
class ExecutionError : public std::runtime_error {
 public:
  enum class Code {
    kSecretSharing,
    kInvalidInput,
    kCommunication,
    kVerificationFailed,
    kCircuit
  };

  explicit ExecutionError(Code code);
  ExecutionError(Code code, const std::string& detail);
  explicit ExecutionError(const SecretSharingError& cause);

  [[nodiscard]] Code code() const { return code_; }
  [[nodiscard]] std::optional<SecretSharingError::Code> cause() const {
    return cause_;
  }

 private:
  Code code_;
  std::optional<SecretSharingError::Code> cause_;
};

std::string describe(SecretSharingError::Code code);
std::string describe(ExecutionError::Code code);

};  // namespace eos
