#include "rand_gen_pool.h"

namespace eos {

RandGenPool::RandGenPool(uint64_t seed) {
  auto seed_block = emp::makeBlock(seed, 0);
  k_inputs.reseed(&seed_block, 0);
  k_triples.reseed(&seed_block, 1);
}

emp::PRG& RandGenPool::inputs() { return k_inputs; }

emp::PRG& RandGenPool::triples() { return k_triples; }

};  // namespace eos
