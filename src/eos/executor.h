#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "error.h"
#include "preproc.h"
#include "sharing.h"
#include "utils/circuit.h"
#include "utils/types.h"

namespace eos {

struct ExecutionStats {
  size_t num_add_gates{0};
  size_t num_mul_gates{0};
  size_t communication_rounds{0};
  size_t bytes_communicated{0};
  uint64_t execution_time_ms{0};

  void merge(const ExecutionStats& other);

  friend std::ostream& operator<<(std::ostream& os, const ExecutionStats& stats);
};

// One party's view of an MPC session over the sharing scheme SS. Gates are
// local operations on this party's shares; interaction between parties is
// driven from outside (see OperationMode and LocalSession).
template <class SS>
class ExecCircuit {
 public:
  using share_t = typename SS::share_t;

 private:
  size_t party_id_;
  size_t num_parties_;
  SS scheme_;
  std::optional<utils::LevelOrderedCircuit> circ_;
  std::vector<utils::wire_t> input_wires_;
  ExecutionStats stats_;

  template <class Fn>
  static auto wrapSharing(Fn&& fn) -> decltype(fn()) {
    try {
      return fn();
    } catch (const SecretSharingError& e) {
      throw ExecutionError(e);
    }
  }

  std::vector<share_t> evaluateInstance(const std::vector<share_t>& inputs) {
    const auto& circ = *circ_;
    std::vector<share_t> wires(circ.num_wires);
    size_t next_input = 0;

    for (const auto& level : circ.gates_by_level) {
      for (const auto& gate : level) {
        switch (gate->type) {
          case utils::GateType::kInp: {
            wires[gate->out] = inputs[next_input++];
            break;
          }

          case utils::GateType::kAdd: {
            auto* g = static_cast<utils::FIn2Gate*>(gate.get());
            wires[g->out] = addGate(wires[g->in1], wires[g->in2]);
            break;
          }

          case utils::GateType::kSub: {
            auto* g = static_cast<utils::FIn2Gate*>(gate.get());
            wires[g->out] = subGate(wires[g->in1], wires[g->in2]);
            break;
          }

          case utils::GateType::kMul: {
            auto* g = static_cast<utils::FIn2Gate*>(gate.get());
            wires[g->out] = mulGate(wires[g->in1], wires[g->in2]);
            break;
          }

          case utils::GateType::kConstAdd: {
            auto* g = static_cast<utils::ConstOpGate<Field>*>(gate.get());
            wires[g->out] = constAddGate(wires[g->in], g->cval);
            break;
          }

          case utils::GateType::kConstMul: {
            auto* g = static_cast<utils::ConstOpGate<Field>*>(gate.get());
            wires[g->out] = scalarMulGate(wires[g->in], g->cval);
            break;
          }

          case utils::GateType::kLinComb: {
            auto* g = static_cast<utils::LinCombGate<Field>*>(gate.get());
            std::vector<share_t> terms;
            terms.reserve(g->in.size());
            for (auto wid : g->in) {
              terms.push_back(wires[wid]);
            }
            wires[g->out] = linearCombinationGate(terms, g->coeffs);
            break;
          }

          default: {
            throw ExecutionError(ExecutionError::Code::kCircuit,
                                 "invalid gate type");
          }
        }
      }
    }

    std::vector<share_t> outputs;
    outputs.reserve(circ.outputs.size());
    for (auto wid : circ.outputs) {
      outputs.push_back(wires[wid]);
    }
    return outputs;
  }

 public:
  ExecCircuit(size_t party_id, size_t num_parties, SS scheme = SS{})
      : party_id_(party_id),
        num_parties_(num_parties),
        scheme_(std::move(scheme)) {
    if (party_id_ >= num_parties_) {
      throw ExecutionError(ExecutionError::Code::kInvalidInput,
                           "party id " + std::to_string(party_id_) +
                               " out of range for " +
                               std::to_string(num_parties_) + " parties");
    }
  }

  [[nodiscard]] size_t partyId() const { return party_id_; }
  [[nodiscard]] size_t numParties() const { return num_parties_; }
  [[nodiscard]] const SS& scheme() const { return scheme_; }

  void setCircuit(utils::LevelOrderedCircuit circ) {
    auto input_wires = circ.inputWires();
    if (input_wires.empty()) {
      throw ExecutionError(ExecutionError::Code::kCircuit,
                           "circuit has no input gates");
    }
    circ_ = std::move(circ);
    input_wires_ = std::move(input_wires);
  }

  [[nodiscard]] bool hasCircuit() const { return circ_.has_value(); }

  // Input shares consumed by one evaluation of the circuit. Without a
  // circuit every share is its own instance.
  [[nodiscard]] size_t inputsPerInstance() const {
    return circ_ ? input_wires_.size() : 1;
  }

  // Share a secret among all parties of the session.
  std::vector<share_t> inputSecret(const Field& secret, size_t threshold,
                                   emp::PRG& prg) {
    return wrapSharing(
        [&]() { return SS::shareSecret(secret, threshold, num_parties_, prg); });
  }

  share_t addGate(const share_t& left, const share_t& right) {
    auto res = wrapSharing([&]() { return SS::addShares(left, right); });
    stats_.num_add_gates++;
    return res;
  }

  share_t subGate(const share_t& left, const share_t& right) {
    auto res = wrapSharing([&]() { return SS::subShares(left, right); });
    stats_.num_add_gates++;
    return res;
  }

  // Naive product of the share values. For Shamir sharing the result has
  // doubled degree; for additive sharing this always fails.
  share_t mulGate(const share_t& left, const share_t& right) {
    auto res = wrapSharing([&]() { return SS::mulShares(left, right); });
    stats_.num_mul_gates++;
    return res;
  }

  share_t scalarMulGate(const share_t& share, const Field& scalar) {
    return SS::scalarMulShare(share, scalar);
  }

  share_t constAddGate(const share_t& share, const Field& cval) {
    return SS::addConstant(share, cval);
  }

  share_t linearCombinationGate(const std::vector<share_t>& shares,
                                const std::vector<Field>& coeffs) {
    if (shares.size() != coeffs.size()) {
      throw ExecutionError(ExecutionError::Code::kInvalidInput,
                           "got " + std::to_string(shares.size()) +
                               " shares and " + std::to_string(coeffs.size()) +
                               " coefficients");
    }
    if (shares.empty()) {
      throw ExecutionError(ExecutionError::Code::kInvalidInput,
                           "empty linear combination");
    }

    auto res = scalarMulGate(shares[0], coeffs[0]);
    for (size_t i = 1; i < shares.size(); ++i) {
      res = addGate(res, scalarMulGate(shares[i], coeffs[i]));
    }
    return res;
  }

  // This party's share of x - a, opened by all parties before beaverMulGate.
  share_t beaverMaskGate(const share_t& x, const share_t& a) {
    return wrapSharing([&]() { return SS::subShares(x, a); });
  }

  // Product from a Beaver triple and the opened d = x - a, e = y - b:
  // xy = c + d * b + e * a + d * e. Keeps the degree of the inputs.
  share_t beaverMulGate(const BeaverTriple<share_t>& triple, const Field& d,
                        const Field& e) {
    auto res = wrapSharing([&]() {
      auto acc = SS::addShares(triple.c, SS::scalarMulShare(triple.b, d));
      acc = SS::addShares(acc, SS::scalarMulShare(triple.a, e));
      return SS::addConstant(acc, d * e);
    });
    stats_.num_mul_gates++;
    return res;
  }

  Field revealSecret(const std::vector<share_t>& shares) const {
    return wrapSharing([&]() { return SS::reconstructSecret(shares); });
  }

  // Evaluate the loaded circuit on consecutive tuples of this party's input
  // shares and concatenate the output shares. Without a circuit nothing is
  // evaluated.
  std::vector<share_t> executeCircuit(const std::vector<share_t>& inputs) {
    if (!circ_) {
      return {};
    }

    auto k = input_wires_.size();
    if (inputs.size() % k != 0) {
      throw ExecutionError(ExecutionError::Code::kInvalidInput,
                           std::to_string(inputs.size()) +
                               " input shares for a circuit with " +
                               std::to_string(k) + " inputs");
    }

    std::vector<share_t> outputs;
    for (size_t off = 0; off < inputs.size(); off += k) {
      std::vector<share_t> instance(inputs.begin() + off,
                                    inputs.begin() + off + k);
      auto res = evaluateInstance(instance);
      outputs.insert(outputs.end(), res.begin(), res.end());
    }
    return outputs;
  }

  // Check revealed outputs against a plaintext evaluation of the loaded
  // circuit. Trivially true when no circuit is loaded.
  [[nodiscard]] bool verifyExecution(const std::vector<Field>& inputs,
                                     const std::vector<Field>& outputs) const {
    if (!circ_) {
      return true;
    }

    auto k = input_wires_.size();
    if (inputs.size() % k != 0) {
      throw ExecutionError(ExecutionError::Code::kInvalidInput,
                           std::to_string(inputs.size()) +
                               " inputs for a circuit with " +
                               std::to_string(k) + " inputs");
    }

    std::vector<Field> expected;
    for (size_t off = 0; off < inputs.size(); off += k) {
      std::unordered_map<utils::wire_t, Field> instance;
      for (size_t i = 0; i < k; ++i) {
        instance[input_wires_[i]] = inputs[off + i];
      }
      auto res = utils::evaluate<Field>(*circ_, instance);
      expected.insert(expected.end(), res.begin(), res.end());
    }
    return expected == outputs;
  }

  [[nodiscard]] const ExecutionStats& stats() const { return stats_; }

  void recordCommunication(size_t rounds, size_t bytes) {
    stats_.communication_rounds += rounds;
    stats_.bytes_communicated += bytes;
  }

  void recordTime(uint64_t ms) { stats_.execution_time_ms += ms; }

  void resetStats() { stats_ = ExecutionStats{}; }
};

};  // namespace eos
