#pragma once

#include <emp-tool/emp-tool.h>

#include <cstddef>
#include <utility>
#include <vector>

#include "error.h"
#include "utils/helpers.h"
#include "utils/types.h"

namespace eos {

using utils::Field;

// Key type of schemes without verification material.
struct NoKey {};

// Evaluation of the sharing polynomial at x = index. Indices start at 1.
class ShamirShare {
  size_t index_{0};
  Field value_;

 public:
  ShamirShare() = default;
  explicit ShamirShare(size_t index, Field value)
      : index_{index}, value_{std::move(value)} {}

  [[nodiscard]] size_t index() const { return index_; }

  Field& valueAt() { return value_; }
  [[nodiscard]] Field valueAt() const { return value_; }
};

// Additive contribution of party party_id. Party ids start at 0.
class AdditiveShare {
  size_t party_id_{0};
  Field value_;

 public:
  AdditiveShare() = default;
  explicit AdditiveShare(size_t party_id, Field value)
      : party_id_{party_id}, value_{std::move(value)} {}

  [[nodiscard]] size_t partyId() const { return party_id_; }

  Field& valueAt() { return value_; }
  [[nodiscard]] Field valueAt() const { return value_; }
};

// Threshold sharing over a random polynomial of degree threshold - 1.
//
// Every operation is static; an instance only names the scheme.
class ShamirSecretSharing {
 public:
  using share_t = ShamirShare;
  using secret_key_t = NoKey;

  static std::vector<ShamirShare> shareSecret(const Field& secret,
                                              size_t threshold,
                                              size_t num_parties,
                                              emp::PRG& prg);

  // Lagrange interpolation at x = 0. Fewer than threshold shares give an
  // unrelated value; this cannot be detected locally.
  static Field reconstructSecret(const std::vector<ShamirShare>& shares);

  // No key material, always true.
  static bool verifyShare(const ShamirShare& share, const NoKey& key);

  static ShamirShare addShares(const ShamirShare& lhs, const ShamirShare& rhs);
  static ShamirShare subShares(const ShamirShare& lhs, const ShamirShare& rhs);

  // NB: multiplies the values only. The result lies on a polynomial of twice
  // the degree and needs 2 * (threshold - 1) + 1 shares to reconstruct. Use
  // ExecCircuit::beaverMulGate to stay at the original degree.
  static ShamirShare mulShares(const ShamirShare& lhs, const ShamirShare& rhs);

  static ShamirShare scalarMulShare(const ShamirShare& share,
                                    const Field& scalar);

  // Public constant shifts the constant term, so every party adds it.
  static ShamirShare addConstant(const ShamirShare& share, const Field& cval);
};

// n-out-of-n sharing: the shares sum to the secret.
class AdditiveSecretSharing {
 public:
  using share_t = AdditiveShare;
  using secret_key_t = NoKey;

  // threshold is ignored.
  static std::vector<AdditiveShare> shareSecret(const Field& secret,
                                                size_t threshold,
                                                size_t num_parties,
                                                emp::PRG& prg);

  // Sum of all values. Correct only when every party's share is present.
  static Field reconstructSecret(const std::vector<AdditiveShare>& shares);

  // No key material, always true.
  static bool verifyShare(const AdditiveShare& share, const NoKey& key);

  static AdditiveShare addShares(const AdditiveShare& lhs,
                                 const AdditiveShare& rhs);
  static AdditiveShare subShares(const AdditiveShare& lhs,
                                 const AdditiveShare& rhs);

  // Always throws kReconstructionFailed: the product of two additively
  // shared values cannot be computed locally.
  static AdditiveShare mulShares(const AdditiveShare& lhs,
                                 const AdditiveShare& rhs);

  static AdditiveShare scalarMulShare(const AdditiveShare& share,
                                      const Field& scalar);

  // Only party 0 adds the constant.
  static AdditiveShare addConstant(const AdditiveShare& share,
                                   const Field& cval);
};

};  // namespace eos
