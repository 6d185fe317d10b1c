#pragma once
#include <emp-tool/emp-tool.h>

#include <cstdint>

namespace eos {

// Collection of PRGs used by a simulated session. Each stream is derived from
// the same seed with a distinct id so that dealing inputs and dealing triples
// do not perturb each other.
class RandGenPool {
  emp::PRG k_inputs;
  emp::PRG k_triples;

 public:
  explicit RandGenPool(uint64_t seed = 200);

  emp::PRG& inputs();
  emp::PRG& triples();
};

};  // namespace eos
