#include "sharing.h"

#include <NTL/ZZ_p.h>

#include <string>

namespace eos {

namespace {

void checkSameIndex(const ShamirShare& lhs, const ShamirShare& rhs) {
  if (lhs.index() != rhs.index()) {
    throw SecretSharingError(SecretSharingError::Code::kInvalidShares,
                             "share indices " + std::to_string(lhs.index()) +
                                 " and " + std::to_string(rhs.index()) +
                                 " differ");
  }
}

void checkSameParty(const AdditiveShare& lhs, const AdditiveShare& rhs) {
  if (lhs.partyId() != rhs.partyId()) {
    throw SecretSharingError(SecretSharingError::Code::kInvalidShares,
                             "party ids " + std::to_string(lhs.partyId()) +
                                 " and " + std::to_string(rhs.partyId()) +
                                 " differ");
  }
}

};  // namespace

std::vector<ShamirShare> ShamirSecretSharing::shareSecret(const Field& secret,
                                                          size_t threshold,
                                                          size_t num_parties,
                                                          emp::PRG& prg) {
  if (num_parties == 0 || threshold == 0 || threshold > num_parties) {
    throw SecretSharingError(
        SecretSharingError::Code::kInvalidInput,
        "threshold " + std::to_string(threshold) + " with " +
            std::to_string(num_parties) + " parties");
  }

  // coeffs[0] is the secret.
  std::vector<Field> coeffs(threshold);
  coeffs[0] = secret;
  for (size_t i = 1; i < threshold; ++i) {
    utils::randomizeZZp(prg, coeffs[i]);
  }

  std::vector<ShamirShare> shares;
  shares.reserve(num_parties);
  for (size_t i = 1; i <= num_parties; ++i) {
    auto x = utils::fieldFromIndex(i);
    // Horner's rule.
    Field y = coeffs[threshold - 1];
    for (size_t k = threshold - 1; k > 0; --k) {
      y = y * x + coeffs[k - 1];
    }
    shares.emplace_back(i, y);
  }

  return shares;
}

Field ShamirSecretSharing::reconstructSecret(
    const std::vector<ShamirShare>& shares) {
  if (shares.empty()) {
    throw SecretSharingError(SecretSharingError::Code::kInsufficientShares);
  }

  Field result;
  for (size_t i = 0; i < shares.size(); ++i) {
    Field num;
    Field den;
    NTL::set(num);
    NTL::set(den);

    auto xi = utils::fieldFromIndex(shares[i].index());
    for (size_t j = 0; j < shares.size(); ++j) {
      if (i == j) {
        continue;
      }
      auto xj = utils::fieldFromIndex(shares[j].index());
      num *= -xj;
      den *= xi - xj;
    }

    if (NTL::IsZero(den)) {
      throw SecretSharingError(SecretSharingError::Code::kInvalidShares,
                               "duplicate share index " +
                                   std::to_string(shares[i].index()));
    }

    result += shares[i].valueAt() * num * NTL::inv(den);
  }

  return result;
}

bool ShamirSecretSharing::verifyShare(const ShamirShare& /*share*/,
                                      const NoKey& /*key*/) {
  return true;
}

ShamirShare ShamirSecretSharing::addShares(const ShamirShare& lhs,
                                           const ShamirShare& rhs) {
  checkSameIndex(lhs, rhs);
  return ShamirShare(lhs.index(), lhs.valueAt() + rhs.valueAt());
}

ShamirShare ShamirSecretSharing::subShares(const ShamirShare& lhs,
                                           const ShamirShare& rhs) {
  checkSameIndex(lhs, rhs);
  return ShamirShare(lhs.index(), lhs.valueAt() - rhs.valueAt());
}

ShamirShare ShamirSecretSharing::mulShares(const ShamirShare& lhs,
                                           const ShamirShare& rhs) {
  checkSameIndex(lhs, rhs);
  return ShamirShare(lhs.index(), lhs.valueAt() * rhs.valueAt());
}

ShamirShare ShamirSecretSharing::scalarMulShare(const ShamirShare& share,
                                                const Field& scalar) {
  return ShamirShare(share.index(), share.valueAt() * scalar);
}

ShamirShare ShamirSecretSharing::addConstant(const ShamirShare& share,
                                             const Field& cval) {
  return ShamirShare(share.index(), share.valueAt() + cval);
}

std::vector<AdditiveShare> AdditiveSecretSharing::shareSecret(
    const Field& secret, size_t /*threshold*/, size_t num_parties,
    emp::PRG& prg) {
  if (num_parties == 0) {
    throw SecretSharingError(SecretSharingError::Code::kInvalidInput,
                             "no parties");
  }

  std::vector<AdditiveShare> shares;
  shares.reserve(num_parties);

  Field sum;
  for (size_t i = 0; i < num_parties - 1; ++i) {
    auto val = utils::randomField(prg);
    sum += val;
    shares.emplace_back(i, val);
  }
  shares.emplace_back(num_parties - 1, secret - sum);

  return shares;
}

Field AdditiveSecretSharing::reconstructSecret(
    const std::vector<AdditiveShare>& shares) {
  if (shares.empty()) {
    throw SecretSharingError(SecretSharingError::Code::kInsufficientShares);
  }

  Field sum;
  for (const auto& share : shares) {
    sum += share.valueAt();
  }
  return sum;
}

bool AdditiveSecretSharing::verifyShare(const AdditiveShare& /*share*/,
                                        const NoKey& /*key*/) {
  return true;
}

AdditiveShare AdditiveSecretSharing::addShares(const AdditiveShare& lhs,
                                               const AdditiveShare& rhs) {
  checkSameParty(lhs, rhs);
  return AdditiveShare(lhs.partyId(), lhs.valueAt() + rhs.valueAt());
}

AdditiveShare AdditiveSecretSharing::subShares(const AdditiveShare& lhs,
                                               const AdditiveShare& rhs) {
  checkSameParty(lhs, rhs);
  return AdditiveShare(lhs.partyId(), lhs.valueAt() - rhs.valueAt());
}

AdditiveShare AdditiveSecretSharing::mulShares(const AdditiveShare& /*lhs*/,
                                               const AdditiveShare& /*rhs*/) {
  throw SecretSharingError(SecretSharingError::Code::kReconstructionFailed,
                           "multiplication is not local for additive shares");
}

AdditiveShare AdditiveSecretSharing::scalarMulShare(const AdditiveShare& share,
                                                    const Field& scalar) {
  return AdditiveShare(share.partyId(), share.valueAt() * scalar);
}

AdditiveShare AdditiveSecretSharing::addConstant(const AdditiveShare& share,
                                                 const Field& cval) {
  if (share.partyId() != 0) {
    return share;
  }
  return AdditiveShare(share.partyId(), share.valueAt() + cval);
}

};  // namespace eos
