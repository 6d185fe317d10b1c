#include "modes.h"

#include <algorithm>

namespace eos {

std::ostream& operator<<(std::ostream& os, const CommunicationComplexity& cc) {
  os << "rounds: " << cc.rounds << "\n";
  os << "bytes per round: " << cc.bytes_per_round << "\n";
  os << "latency per round: " << cc.latency_ms << " ms\n";
  os << "total bytes: " << cc.totalBytes() << "\n";
  os << "total latency: " << cc.totalLatencyMs() << " ms\n";
  return os;
}

CommunicationPattern CommunicationPattern::minimal(size_t max_rounds,
                                                   size_t batch_size) {
  CommunicationPattern res;
  res.kind = Kind::kMinimal;
  res.max_rounds = max_rounds;
  res.batch_size = batch_size;
  return res;
}

CommunicationPattern CommunicationPattern::full(size_t parallelism_degree,
                                                bool use_optimized_protocols) {
  CommunicationPattern res;
  res.kind = Kind::kFull;
  res.parallelism_degree = parallelism_degree;
  res.use_optimized_protocols = use_optimized_protocols;
  return res;
}

CommunicationComplexity CommunicationPattern::getCommunicationComplexity()
    const {
  CommunicationComplexity res;
  switch (kind) {
    case Kind::kMinimal: {
      res.rounds = max_rounds;
      res.bytes_per_round = 1024;
      res.latency_ms = 10;
      break;
    }

    case Kind::kFull: {
      size_t base_bytes = use_optimized_protocols ? 2048 : 4096;
      // Extra rounds for coordination between partitions.
      res.rounds = parallelism_degree * 2;
      res.bytes_per_round = base_bytes * parallelism_degree;
      res.latency_ms = 5;
      break;
    }
  }
  return res;
}

std::ostream& operator<<(std::ostream& os,
                         const CommunicationPattern& pattern) {
  switch (pattern.kind) {
    case CommunicationPattern::Kind::kMinimal:
      os << "Minimal { max_rounds: " << pattern.max_rounds
         << ", batch_size: " << pattern.batch_size << " }";
      break;

    case CommunicationPattern::Kind::kFull:
      os << "Full { parallelism_degree: " << pattern.parallelism_degree
         << ", use_optimized_protocols: " << std::boolalpha
         << pattern.use_optimized_protocols << std::noboolalpha << " }";
      break;
  }
  return os;
}

IsolationMode::IsolationMode(uint8_t isolation_level,
                             size_t max_communication_rounds)
    : isolation_level_(isolation_level),
      max_communication_rounds_(max_communication_rounds) {}

bool IsolationMode::isCommunicationAllowed(size_t round) const {
  return round < max_communication_rounds_ && isolation_level_ > 0;
}

size_t IsolationMode::getMaxBatchSize() const {
  switch (isolation_level_) {
    case 0:
      return 1;
    case 1:
      return 10;
    case 2:
      return 100;
    default:
      return 1000;
  }
}

CommunicationPattern IsolationMode::getCommunicationPattern() const {
  return CommunicationPattern::minimal(max_communication_rounds_,
                                       getMaxBatchSize());
}

std::string IsolationMode::name() const { return "isolation"; }

std::vector<size_t> IsolationMode::planBatches(
    size_t num_shares, size_t inputs_per_instance) const {
  // Each round carries batch_size input shares. An instance is evaluated in
  // the round that delivers its last share.
  auto batch_size = getMaxBatchSize();
  std::vector<size_t> batches;
  for (size_t done = 0, round = 0; done < num_shares; ++round) {
    if (!isCommunicationAllowed(round)) {
      throw ExecutionError(
          ExecutionError::Code::kCommunication,
          "round " + std::to_string(round) + " not allowed at isolation level " +
              std::to_string(isolation_level_) + " with " +
              std::to_string(max_communication_rounds_) + " rounds");
    }
    auto end = std::min(done + batch_size, num_shares);
    batches.push_back(end / inputs_per_instance - done / inputs_per_instance);
    done = end;
  }
  return batches;
}

CollaborationMode::CollaborationMode(uint8_t collaboration_level,
                                     bool use_optimized_protocols,
                                     bool enable_parallel_processing)
    : collaboration_level_(collaboration_level),
      use_optimized_protocols_(use_optimized_protocols),
      enable_parallel_processing_(enable_parallel_processing) {}

size_t CollaborationMode::getParallelismDegree() const {
  if (!enable_parallel_processing_) {
    return 1;
  }

  switch (collaboration_level_) {
    case 1:
      return 2;
    case 2:
      return 4;
    case 3:
      return 8;
    default:
      return 1;
  }
}

bool CollaborationMode::shouldUseOptimizedProtocols() const {
  return use_optimized_protocols_ && collaboration_level_ >= 2;
}

CommunicationPattern CollaborationMode::getCommunicationPattern() const {
  return CommunicationPattern::full(getParallelismDegree(),
                                    shouldUseOptimizedProtocols());
}

std::string CollaborationMode::name() const { return "collaboration"; }

std::vector<size_t> CollaborationMode::planBatches(
    size_t num_shares, size_t inputs_per_instance) const {
  auto num_instances = num_shares / inputs_per_instance;
  if (enable_parallel_processing_) {
    return planParallel(num_instances);
  }
  return planSequential(num_instances);
}

std::vector<size_t> CollaborationMode::planParallel(
    size_t num_instances) const {
  // Contiguous partitions whose sizes differ by at most one.
  auto parts = getParallelismDegree();
  std::vector<size_t> batches;
  for (size_t i = 0; i < parts; ++i) {
    auto count = num_instances / parts + (i < num_instances % parts ? 1 : 0);
    if (count != 0) {
      batches.push_back(count);
    }
  }
  return batches;
}

std::vector<size_t> CollaborationMode::planSequential(
    size_t num_instances) const {
  if (num_instances == 0) {
    return {};
  }
  return {num_instances};
}

};  // namespace eos
