#pragma once

#include <emp-tool/emp-tool.h>

#include <cstddef>
#include <utility>
#include <vector>

#include "sharing.h"
#include "utils/helpers.h"

namespace eos {

// One party's share of a multiplication triple (a, b, c = a * b).
template <class S>
struct BeaverTriple {
  S a{};
  S b{};
  S c{};

  BeaverTriple() = default;
  BeaverTriple(S a, S b, S c)
      : a(std::move(a)), b(std::move(b)), c(std::move(c)) {}
};

// Trusted dealer for multiplication triples. Entry i of the result belongs to
// party i.
template <class SS>
std::vector<BeaverTriple<typename SS::share_t>> dealTriple(size_t threshold,
                                                           size_t num_parties,
                                                           emp::PRG& prg) {
  auto a = utils::randomField(prg);
  auto b = utils::randomField(prg);
  auto a_sh = SS::shareSecret(a, threshold, num_parties, prg);
  auto b_sh = SS::shareSecret(b, threshold, num_parties, prg);
  auto c_sh = SS::shareSecret(a * b, threshold, num_parties, prg);

  std::vector<BeaverTriple<typename SS::share_t>> res;
  res.reserve(num_parties);
  for (size_t i = 0; i < num_parties; ++i) {
    res.emplace_back(a_sh[i], b_sh[i], c_sh[i]);
  }
  return res;
}

// Triples for a batch of multiplications; res[k][i] is party i's share of the
// k-th triple.
template <class SS>
std::vector<std::vector<BeaverTriple<typename SS::share_t>>> dealTriples(
    size_t count, size_t threshold, size_t num_parties, emp::PRG& prg) {
  std::vector<std::vector<BeaverTriple<typename SS::share_t>>> res;
  res.reserve(count);
  for (size_t k = 0; k < count; ++k) {
    res.push_back(dealTriple<SS>(threshold, num_parties, prg));
  }
  return res;
}

};  // namespace eos
