#include "circuit.h"

namespace eos::utils {

Gate::Gate(GateType type, wire_t out) : type(type), out(out) {}

FIn2Gate::FIn2Gate(GateType type, wire_t in1, wire_t in2, wire_t out)
    : Gate(type, out), in1(in1), in2(in2) {}

std::vector<wire_t> LevelOrderedCircuit::inputWires() const {
  std::vector<wire_t> res;
  if (gates_by_level.empty()) {
    return res;
  }

  // Input gates have depth 0.
  for (const auto& gate : gates_by_level[0]) {
    if (gate->type == GateType::kInp) {
      res.push_back(gate->out);
    }
  }
  return res;
}

std::ostream& operator<<(std::ostream& os, GateType type) {
  switch (type) {
    case kInp:
      os << "Input";
      break;

    case kAdd:
      os << "Addition";
      break;

    case kSub:
      os << "Subtraction";
      break;

    case kMul:
      os << "Multiplication";
      break;

    case kConstAdd:
      os << "Addition with constant";
      break;

    case kConstMul:
      os << "Multiplication with constant";
      break;

    case kLinComb:
      os << "Linear combination";
      break;

    default:
      os << "Invalid";
      break;
  }

  return os;
}

std::ostream& operator<<(std::ostream& os, const LevelOrderedCircuit& circ) {
  for (size_t i = 0; i < GateType::NumGates; ++i) {
    os << static_cast<GateType>(i) << ": " << circ.count[i] << "\n";
  }
  os << "Total: " << circ.num_gates << "\n";
  os << "Depth: " << (circ.gates_by_level.size() - 1) << "\n";
  return os;
}

};  // namespace eos::utils
