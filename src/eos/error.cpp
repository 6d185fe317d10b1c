#include "error.h"

namespace eos {

std::string describe(SecretSharingError::Code code) {
  switch (code) {
    case SecretSharingError::Code::kInsufficientShares:
      return "Insufficient shares for reconstruction";
    case SecretSharingError::Code::kInvalidShares:
      return "Invalid shares provided";
    case SecretSharingError::Code::kReconstructionFailed:
      return "Secret reconstruction failed";
    case SecretSharingError::Code::kInvalidInput:
      return "Invalid sharing parameters";
  }
  return "Unknown secret sharing error";
}

std::string describe(ExecutionError::Code code) {
  switch (code) {
    case ExecutionError::Code::kSecretSharing:
      return "Secret sharing error";
    case ExecutionError::Code::kInvalidInput:
      return "Invalid input provided";
    case ExecutionError::Code::kCommunication:
      return "Communication error between parties";
    case ExecutionError::Code::kVerificationFailed:
      return "Circuit execution verification failed";
    case ExecutionError::Code::kCircuit:
      return "Circuit error";
  }
  return "Unknown execution error";
}

SecretSharingError::SecretSharingError(Code code)
    : std::runtime_error(describe(code)), code_(code) {}

SecretSharingError::SecretSharingError(Code code, const std::string& detail)
    : std::runtime_error(describe(code) + ": " + detail), code_(code) {}

ExecutionError::ExecutionError(Code code)
    : std::runtime_error(describe(code)), code_(code) {}

ExecutionError::ExecutionError(Code code, const std::string& detail)
    : std::runtime_error(describe(code) + ": " + detail), code_(code) {}

ExecutionError::ExecutionError(const SecretSharingError& cause)
    : std::runtime_error(describe(Code::kSecretSharing) + ": " + cause.what()),
      code_(Code::kSecretSharing),
      cause_(cause.code()) {}

};  // namespace eos
