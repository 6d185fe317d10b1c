#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "error.h"
#include "executor.h"

namespace eos {

// Estimated cost of a communication pattern. The constants behind it are
// design parameters, not measurements.
struct CommunicationComplexity {
  size_t rounds{0};
  size_t bytes_per_round{0};
  uint64_t latency_ms{0};

  [[nodiscard]] size_t totalBytes() const { return rounds * bytes_per_round; }
  [[nodiscard]] uint64_t totalLatencyMs() const {
    return static_cast<uint64_t>(rounds) * latency_ms;
  }

  friend std::ostream& operator<<(std::ostream& os,
                                  const CommunicationComplexity& cc);
};

struct CommunicationPattern {
  enum class Kind { kMinimal, kFull };

  Kind kind{Kind::kMinimal};
  // kMinimal
  size_t max_rounds{0};
  size_t batch_size{0};
  // kFull
  size_t parallelism_degree{0};
  bool use_optimized_protocols{false};

  static CommunicationPattern minimal(size_t max_rounds, size_t batch_size);
  static CommunicationPattern full(size_t parallelism_degree,
                                   bool use_optimized_protocols);

  [[nodiscard]] CommunicationComplexity getCommunicationComplexity() const;

  friend std::ostream& operator<<(std::ostream& os,
                                  const CommunicationPattern& pattern);
};

// Policy governing how much interaction a gate sequence may use. Concrete
// modes decide how circuit instances are grouped into communication rounds;
// the evaluation itself is delegated to the executor.
class OperationMode {
 public:
  virtual ~OperationMode() = default;

  [[nodiscard]] virtual CommunicationPattern getCommunicationPattern() const = 0;
  [[nodiscard]] virtual std::string name() const = 0;

  // Number of circuit instances completed in each communication round for
  // num_shares input shares, inputs_per_instance of them per instance. A
  // round may complete no instance. Throws
  // ExecutionError::Code::kCommunication when the policy does not allow
  // enough rounds.
  [[nodiscard]] virtual std::vector<size_t> planBatches(
      size_t num_shares, size_t inputs_per_instance) const = 0;

  template <class SS>
  std::vector<typename SS::share_t> executeCircuit(
      ExecCircuit<SS>& exec,
      const std::vector<typename SS::share_t>& inputs) const {
    auto k = exec.inputsPerInstance();
    if (inputs.size() % k != 0) {
      throw ExecutionError(ExecutionError::Code::kInvalidInput,
                           std::to_string(inputs.size()) +
                               " input shares for instances of " +
                               std::to_string(k));
    }

    // Fails before any gate runs if the round budget is too small.
    auto batches = planBatches(inputs.size(), k);
    auto bytes_per_round =
        getCommunicationPattern().getCommunicationComplexity().bytes_per_round;

    auto start = std::chrono::steady_clock::now();
    std::vector<typename SS::share_t> outputs;
    size_t off = 0;
    for (auto count : batches) {
      exec.recordCommunication(1, bytes_per_round);
      if (count == 0) {
        continue;
      }
      std::vector<typename SS::share_t> batch(inputs.begin() + off,
                                              inputs.begin() + off + count * k);
      auto res = exec.executeCircuit(batch);
      outputs.insert(outputs.end(), res.begin(), res.end());
      off += count * k;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    exec.recordTime(static_cast<uint64_t>(elapsed.count()));

    return outputs;
  }

  template <class SS>
  bool verifyExecution(const ExecCircuit<SS>& exec,
                       const std::vector<Field>& inputs,
                       const std::vector<Field>& outputs) const {
    return exec.verifyExecution(inputs, outputs);
  }
};

// Parties work independently and communicate in a bounded number of batched
// rounds.
class IsolationMode : public OperationMode {
  // 0 = no communication, 1 = minimal, 2 = moderate, 3+ = relaxed.
  uint8_t isolation_level_;
  size_t max_communication_rounds_;

 public:
  IsolationMode(uint8_t isolation_level, size_t max_communication_rounds);

  [[nodiscard]] uint8_t isolationLevel() const { return isolation_level_; }
  [[nodiscard]] size_t maxCommunicationRounds() const {
    return max_communication_rounds_;
  }

  [[nodiscard]] bool isCommunicationAllowed(size_t round) const;
  [[nodiscard]] size_t getMaxBatchSize() const;

  [[nodiscard]] CommunicationPattern getCommunicationPattern() const override;
  [[nodiscard]] std::string name() const override;
  [[nodiscard]] std::vector<size_t> planBatches(
      size_t num_shares, size_t inputs_per_instance) const override;
};

// Parties communicate freely, optionally splitting the work into parallel
// partitions.
class CollaborationMode : public OperationMode {
  // 1 = basic, 2 = enhanced, 3 = full.
  uint8_t collaboration_level_;
  bool use_optimized_protocols_;
  bool enable_parallel_processing_;

 public:
  CollaborationMode(uint8_t collaboration_level, bool use_optimized_protocols,
                    bool enable_parallel_processing);

  [[nodiscard]] uint8_t collaborationLevel() const {
    return collaboration_level_;
  }
  [[nodiscard]] bool parallelProcessingEnabled() const {
    return enable_parallel_processing_;
  }

  [[nodiscard]] size_t getParallelismDegree() const;
  [[nodiscard]] bool shouldUseOptimizedProtocols() const;

  [[nodiscard]] CommunicationPattern getCommunicationPattern() const override;
  [[nodiscard]] std::string name() const override;
  [[nodiscard]] std::vector<size_t> planBatches(
      size_t num_shares, size_t inputs_per_instance) const override;

 private:
  [[nodiscard]] std::vector<size_t> planParallel(size_t num_instances) const;
  [[nodiscard]] std::vector<size_t> planSequential(size_t num_instances) const;
};

};  // namespace eos
