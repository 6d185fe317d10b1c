#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "error.h"
#include "executor.h"
#include "modes.h"
#include "preproc.h"
#include "rand_gen_pool.h"
#include "utils/circuit.h"
#include "utils/helpers.h"

namespace eos {

enum class MulStrategy {
  // Local product of share values; see ShamirSecretSharing::mulShares.
  kNaive,
  // Degree-preserving product using dealer generated Beaver triples.
  kBeaver
};

// Simulates all parties of a session in one process. Each party is an
// independent ExecCircuit; values only move between parties when the session
// deals inputs, opens Beaver differences or reveals outputs.
template <class SS>
class LocalSession {
 public:
  using share_t = typename SS::share_t;

 private:
  size_t nP_;
  size_t threshold_;
  MulStrategy strategy_;
  RandGenPool rgen_;
  utils::LevelOrderedCircuit circ_;
  std::vector<ExecCircuit<SS>> parties_;
  // wires_[pid][w] is party pid's share of wire w.
  std::vector<std::vector<share_t>> wires_;

  void multiplyNaive(const std::vector<utils::FIn2Gate*>& gates) {
    for (size_t pid = 0; pid < nP_; ++pid) {
      auto& wires = wires_[pid];
      for (const auto* g : gates) {
        wires[g->out] = parties_[pid].mulGate(wires[g->in1], wires[g->in2]);
      }
    }
  }

  // All multiplications of a level share one opening round.
  void multiplyBeaver(const std::vector<utils::FIn2Gate*>& gates) {
    auto triples =
        dealTriples<SS>(gates.size(), threshold_, nP_, rgen_.triples());

    std::vector<Field> d(gates.size());
    std::vector<Field> e(gates.size());
    for (size_t k = 0; k < gates.size(); ++k) {
      const auto* g = gates[k];
      std::vector<share_t> d_sh;
      std::vector<share_t> e_sh;
      d_sh.reserve(nP_);
      e_sh.reserve(nP_);
      for (size_t pid = 0; pid < nP_; ++pid) {
        d_sh.push_back(
            parties_[pid].beaverMaskGate(wires_[pid][g->in1], triples[k][pid].a));
        e_sh.push_back(
            parties_[pid].beaverMaskGate(wires_[pid][g->in2], triples[k][pid].b));
      }
      d[k] = parties_[0].revealSecret(d_sh);
      e[k] = parties_[0].revealSecret(e_sh);
    }

    // Every party sends its two masked shares per gate to every other party.
    auto bytes = 2 * gates.size() * (nP_ - 1) * utils::fieldBytes();
    for (size_t pid = 0; pid < nP_; ++pid) {
      parties_[pid].recordCommunication(1, bytes);
      for (size_t k = 0; k < gates.size(); ++k) {
        wires_[pid][gates[k]->out] =
            parties_[pid].beaverMulGate(triples[k][pid], d[k], e[k]);
      }
    }
  }

  Field open(const std::vector<share_t>& shares) {
    return parties_[0].revealSecret(shares);
  }

 public:
  LocalSession(size_t num_parties, size_t threshold,
               utils::LevelOrderedCircuit circ,
               MulStrategy strategy = MulStrategy::kNaive, uint64_t seed = 200)
      : nP_(num_parties),
        threshold_(threshold),
        strategy_(strategy),
        rgen_(seed),
        circ_(std::move(circ)),
        wires_(num_parties, std::vector<share_t>(circ_.num_wires)) {
    if (nP_ == 0) {
      throw ExecutionError(ExecutionError::Code::kInvalidInput,
                           "session without parties");
    }

    parties_.reserve(nP_);
    for (size_t pid = 0; pid < nP_; ++pid) {
      parties_.emplace_back(pid, nP_);
      parties_.back().setCircuit(circ_);
    }
  }

  [[nodiscard]] size_t numParties() const { return nP_; }
  [[nodiscard]] size_t threshold() const { return threshold_; }

  ExecCircuit<SS>& party(size_t pid) { return parties_.at(pid); }

  // Dealer shares every input wire among all parties.
  void setInputs(const std::unordered_map<utils::wire_t, Field>& inputs) {
    auto input_wires = circ_.inputWires();
    if (inputs.size() != input_wires.size()) {
      throw ExecutionError(ExecutionError::Code::kInvalidInput,
                           "expected " + std::to_string(input_wires.size()) +
                               " inputs but received " +
                               std::to_string(inputs.size()));
    }

    for (auto w : input_wires) {
      auto it = inputs.find(w);
      if (it == inputs.end()) {
        throw ExecutionError(ExecutionError::Code::kInvalidInput,
                             "missing value for input wire " +
                                 std::to_string(w));
      }
      auto shares = parties_[0].inputSecret(it->second, threshold_,
                                            rgen_.inputs());
      for (size_t pid = 0; pid < nP_; ++pid) {
        wires_[pid][w] = shares[pid];
      }
    }
  }

  void evaluateGatesAtDepth(size_t depth) {
    const auto& level = circ_.gates_by_level[depth];

    // Multiplications only read wires of lower levels, so they can run
    // before the linear gates of this level.
    std::vector<utils::FIn2Gate*> mul_gates;
    for (const auto& gate : level) {
      if (gate->type == utils::GateType::kMul) {
        mul_gates.push_back(static_cast<utils::FIn2Gate*>(gate.get()));
      }
    }
    if (!mul_gates.empty()) {
      if (strategy_ == MulStrategy::kBeaver) {
        multiplyBeaver(mul_gates);
      } else {
        multiplyNaive(mul_gates);
      }
    }

    for (size_t pid = 0; pid < nP_; ++pid) {
      auto& exec = parties_[pid];
      auto& wires = wires_[pid];
      for (const auto& gate : level) {
        switch (gate->type) {
          case utils::GateType::kInp:
          case utils::GateType::kMul:
            break;

          case utils::GateType::kAdd: {
            auto* g = static_cast<utils::FIn2Gate*>(gate.get());
            wires[g->out] = exec.addGate(wires[g->in1], wires[g->in2]);
            break;
          }

          case utils::GateType::kSub: {
            auto* g = static_cast<utils::FIn2Gate*>(gate.get());
            wires[g->out] = exec.subGate(wires[g->in1], wires[g->in2]);
            break;
          }

          case utils::GateType::kConstAdd: {
            auto* g = static_cast<utils::ConstOpGate<Field>*>(gate.get());
            wires[g->out] = exec.constAddGate(wires[g->in], g->cval);
            break;
          }

          case utils::GateType::kConstMul: {
            auto* g = static_cast<utils::ConstOpGate<Field>*>(gate.get());
            wires[g->out] = exec.scalarMulGate(wires[g->in], g->cval);
            break;
          }

          case utils::GateType::kLinComb: {
            auto* g = static_cast<utils::LinCombGate<Field>*>(gate.get());
            std::vector<share_t> terms;
            terms.reserve(g->in.size());
            for (auto wid : g->in) {
              terms.push_back(wires[wid]);
            }
            wires[g->out] = exec.linearCombinationGate(terms, g->coeffs);
            break;
          }

          default: {
            throw ExecutionError(ExecutionError::Code::kCircuit,
                                 "invalid gate type");
          }
        }
      }
    }
  }

  // Reveal every output wire from the shares of all parties.
  std::vector<Field> getOutputs() {
    std::vector<Field> outputs;
    outputs.reserve(circ_.outputs.size());
    for (auto w : circ_.outputs) {
      std::vector<share_t> shares;
      shares.reserve(nP_);
      for (size_t pid = 0; pid < nP_; ++pid) {
        shares.push_back(wires_[pid][w]);
      }
      outputs.push_back(open(shares));
    }
    return outputs;
  }

  std::vector<Field> evaluateCircuit(
      const std::unordered_map<utils::wire_t, Field>& inputs) {
    setInputs(inputs);
    for (size_t depth = 0; depth < circ_.gates_by_level.size(); ++depth) {
      evaluateGatesAtDepth(depth);
    }
    return getOutputs();
  }

  // Evaluate many instances of the circuit with every party driven by the
  // given mode. instances holds the plaintext inputs of consecutive instances
  // in input wire order. Multiplications take the naive path.
  std::vector<Field> runWithMode(const OperationMode& mode,
                                 const std::vector<Field>& instances) {
    auto k = parties_[0].inputsPerInstance();
    if (instances.size() % k != 0) {
      throw ExecutionError(ExecutionError::Code::kInvalidInput,
                           std::to_string(instances.size()) +
                               " inputs for a circuit with " +
                               std::to_string(k) + " inputs");
    }

    std::vector<std::vector<share_t>> party_inputs(nP_);
    for (const auto& val : instances) {
      auto shares = parties_[0].inputSecret(val, threshold_, rgen_.inputs());
      for (size_t pid = 0; pid < nP_; ++pid) {
        party_inputs[pid].push_back(shares[pid]);
      }
    }

    std::vector<std::vector<share_t>> party_outputs(nP_);
    for (size_t pid = 0; pid < nP_; ++pid) {
      party_outputs[pid] = mode.executeCircuit(parties_[pid], party_inputs[pid]);
    }

    std::vector<Field> outputs;
    outputs.reserve(party_outputs[0].size());
    for (size_t i = 0; i < party_outputs[0].size(); ++i) {
      std::vector<share_t> shares;
      shares.reserve(nP_);
      for (size_t pid = 0; pid < nP_; ++pid) {
        shares.push_back(party_outputs[pid][i]);
      }
      outputs.push_back(open(shares));
    }

    if (!mode.verifyExecution(parties_[0], instances, outputs)) {
      throw ExecutionError(ExecutionError::Code::kVerificationFailed,
                           "outputs differ from plaintext evaluation in " +
                               mode.name() + " mode");
    }

    return outputs;
  }

  [[nodiscard]] ExecutionStats stats() const {
    ExecutionStats res;
    for (const auto& exec : parties_) {
      res.merge(exec.stats());
    }
    return res;
  }
};

};  // namespace eos
