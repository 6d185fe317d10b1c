#include "executor.h"

namespace eos {

void ExecutionStats::merge(const ExecutionStats& other) {
  num_add_gates += other.num_add_gates;
  num_mul_gates += other.num_mul_gates;
  communication_rounds += other.communication_rounds;
  bytes_communicated += other.bytes_communicated;
  execution_time_ms += other.execution_time_ms;
}

std::ostream& operator<<(std::ostream& os, const ExecutionStats& stats) {
  os << "add gates: " << stats.num_add_gates << "\n";
  os << "mul gates: " << stats.num_mul_gates << "\n";
  os << "communication rounds: " << stats.communication_rounds << "\n";
  os << "bytes communicated: " << stats.bytes_communicated << "\n";
  os << "execution time: " << stats.execution_time_ms << " ms\n";
  return os;
}

};  // namespace eos
