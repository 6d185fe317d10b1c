#define BOOST_TEST_MODULE sharing
#include <emp-tool/emp-tool.h>
#include <eos/error.h>
#include <eos/sharing.h>
#include <utils/helpers.h>

#include <boost/test/data/monomorphic.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/included/unit_test.hpp>
#include <vector>

using namespace eos;
namespace bdata = boost::unit_test::data;
constexpr int TEST_DATA_MAX_VAL = 1000;

struct GlobalFixture {
  GlobalFixture() { utils::initField(); }
};

BOOST_GLOBAL_FIXTURE(GlobalFixture);

namespace {

Field toField(int val) { return NTL::conv<Field>(val); }

template <class Fn>
void checkSharingError(Fn fn, SecretSharingError::Code code) {
  BOOST_CHECK_EXCEPTION(fn(), SecretSharingError,
                        [code](const SecretSharingError& e) {
                          return e.code() == code;
                        });
}

};  // namespace

BOOST_AUTO_TEST_SUITE(shamir)

BOOST_DATA_TEST_CASE(share_and_reconstruct,
                     bdata::random(0, TEST_DATA_MAX_VAL) ^
                         bdata::xrange<size_t>(1, 51),
                     input, nP) {
  auto seed = emp::makeBlock(100, nP);
  emp::PRG prg(&seed);
  auto secret = toField(input);

  for (size_t threshold = 1; threshold <= nP; ++threshold) {
    auto shares = ShamirSecretSharing::shareSecret(secret, threshold, nP, prg);
    BOOST_TEST(shares.size() == nP);

    std::vector<ShamirShare> head(shares.begin(), shares.begin() + threshold);
    BOOST_TEST(ShamirSecretSharing::reconstructSecret(head) == secret);

    std::vector<ShamirShare> tail(shares.end() - threshold, shares.end());
    BOOST_TEST(ShamirSecretSharing::reconstructSecret(tail) == secret);
  }
}

BOOST_AUTO_TEST_CASE(share_indices) {
  auto seed = emp::makeBlock(100, 200);
  emp::PRG prg(&seed);

  auto shares = ShamirSecretSharing::shareSecret(toField(42), 3, 5, prg);
  BOOST_TEST(shares.size() == 5);
  for (size_t i = 0; i < shares.size(); ++i) {
    BOOST_TEST(shares[i].index() == i + 1);
    BOOST_TEST(ShamirSecretSharing::verifyShare(shares[i], NoKey{}));
  }
}

BOOST_AUTO_TEST_CASE(threshold_subsets) {
  auto seed = emp::makeBlock(100, 200);
  emp::PRG prg(&seed);
  auto secret = toField(42);

  auto shares = ShamirSecretSharing::shareSecret(secret, 3, 5, prg);

  for (size_t i = 0; i < 5; ++i) {
    for (size_t j = i + 1; j < 5; ++j) {
      for (size_t k = j + 1; k < 5; ++k) {
        std::vector<ShamirShare> subset = {shares[i], shares[j], shares[k]};
        BOOST_TEST(ShamirSecretSharing::reconstructSecret(subset) == secret);
      }

      // Below the threshold the interpolated value is unrelated to the secret.
      std::vector<ShamirShare> pair = {shares[i], shares[j]};
      BOOST_TEST(ShamirSecretSharing::reconstructSecret(pair) != secret);
    }
  }
}

BOOST_AUTO_TEST_CASE(threshold_one) {
  auto seed = emp::makeBlock(100, 200);
  emp::PRG prg(&seed);
  auto secret = toField(7);

  auto shares = ShamirSecretSharing::shareSecret(secret, 1, 4, prg);
  for (const auto& share : shares) {
    BOOST_TEST(share.valueAt() == secret);
    BOOST_TEST(ShamirSecretSharing::reconstructSecret({share}) == secret);
  }
}

BOOST_AUTO_TEST_CASE(invalid_parameters) {
  auto seed = emp::makeBlock(100, 200);
  emp::PRG prg(&seed);

  checkSharingError(
      [&]() { ShamirSecretSharing::shareSecret(toField(1), 6, 5, prg); },
      SecretSharingError::Code::kInvalidInput);
  checkSharingError(
      [&]() { ShamirSecretSharing::shareSecret(toField(1), 0, 5, prg); },
      SecretSharingError::Code::kInvalidInput);
  checkSharingError(
      [&]() { ShamirSecretSharing::shareSecret(toField(1), 1, 0, prg); },
      SecretSharingError::Code::kInvalidInput);
}

BOOST_AUTO_TEST_CASE(reconstruct_errors) {
  auto seed = emp::makeBlock(100, 200);
  emp::PRG prg(&seed);

  checkSharingError([]() { ShamirSecretSharing::reconstructSecret({}); },
                    SecretSharingError::Code::kInsufficientShares);

  auto shares = ShamirSecretSharing::shareSecret(toField(9), 2, 3, prg);
  std::vector<ShamirShare> dup = {shares[0], shares[1], shares[0]};
  checkSharingError(
      [&]() { ShamirSecretSharing::reconstructSecret(dup); },
      SecretSharingError::Code::kInvalidShares);
}

BOOST_DATA_TEST_CASE(linear_operations,
                     bdata::random(0, TEST_DATA_MAX_VAL) ^
                         bdata::random(0, TEST_DATA_MAX_VAL) ^
                         bdata::random(0, TEST_DATA_MAX_VAL) ^
                         bdata::xrange(5),
                     input_a, input_b, scalar, idx) {
  auto seed = emp::makeBlock(100, idx);
  emp::PRG prg(&seed);
  size_t nP = 5;
  size_t threshold = 3;
  auto a = toField(input_a);
  auto b = toField(input_b);
  auto c = toField(scalar);

  auto a_sh = ShamirSecretSharing::shareSecret(a, threshold, nP, prg);
  auto b_sh = ShamirSecretSharing::shareSecret(b, threshold, nP, prg);

  std::vector<ShamirShare> sum;
  std::vector<ShamirShare> diff;
  std::vector<ShamirShare> scaled;
  std::vector<ShamirShare> shifted;
  for (size_t i = 0; i < nP; ++i) {
    sum.push_back(ShamirSecretSharing::addShares(a_sh[i], b_sh[i]));
    diff.push_back(ShamirSecretSharing::subShares(a_sh[i], b_sh[i]));
    scaled.push_back(ShamirSecretSharing::scalarMulShare(a_sh[i], c));
    shifted.push_back(ShamirSecretSharing::addConstant(a_sh[i], c));
  }

  BOOST_TEST(ShamirSecretSharing::reconstructSecret(sum) == a + b);
  BOOST_TEST(ShamirSecretSharing::reconstructSecret(diff) == a - b);
  BOOST_TEST(ShamirSecretSharing::reconstructSecret(scaled) == a * c);
  BOOST_TEST(ShamirSecretSharing::reconstructSecret(shifted) == a + c);
}

BOOST_AUTO_TEST_CASE(local_multiplication_doubles_degree) {
  auto seed = emp::makeBlock(100, 200);
  emp::PRG prg(&seed);
  auto a = toField(6);
  auto b = toField(7);

  // Degree 2 inputs give a degree 4 product which needs all 5 shares.
  auto a_sh = ShamirSecretSharing::shareSecret(a, 3, 5, prg);
  auto b_sh = ShamirSecretSharing::shareSecret(b, 3, 5, prg);
  std::vector<ShamirShare> prod;
  for (size_t i = 0; i < 5; ++i) {
    prod.push_back(ShamirSecretSharing::mulShares(a_sh[i], b_sh[i]));
  }

  BOOST_TEST(ShamirSecretSharing::reconstructSecret(prod) == a * b);

  std::vector<ShamirShare> partial(prod.begin(), prod.begin() + 3);
  BOOST_TEST(ShamirSecretSharing::reconstructSecret(partial) != a * b);
}

BOOST_AUTO_TEST_CASE(index_mismatch) {
  ShamirShare lhs(1, toField(3));
  ShamirShare rhs(2, toField(4));

  checkSharingError([&]() { ShamirSecretSharing::addShares(lhs, rhs); },
                    SecretSharingError::Code::kInvalidShares);
  checkSharingError([&]() { ShamirSecretSharing::subShares(lhs, rhs); },
                    SecretSharingError::Code::kInvalidShares);
  checkSharingError([&]() { ShamirSecretSharing::mulShares(lhs, rhs); },
                    SecretSharingError::Code::kInvalidShares);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(additive)

BOOST_DATA_TEST_CASE(share_and_reconstruct,
                     bdata::random(0, TEST_DATA_MAX_VAL) ^
                         bdata::xrange<size_t>(1, 21),
                     input, nP) {
  auto seed = emp::makeBlock(100, 200);
  emp::PRG prg(&seed);
  auto secret = toField(input);

  auto shares = AdditiveSecretSharing::shareSecret(secret, 0, nP, prg);
  BOOST_TEST(shares.size() == nP);
  for (size_t i = 0; i < nP; ++i) {
    BOOST_TEST(shares[i].partyId() == i);
    BOOST_TEST(AdditiveSecretSharing::verifyShare(
        shares[i], AdditiveSecretSharing::secret_key_t{}));
  }

  Field sum;
  for (const auto& share : shares) {
    sum += share.valueAt();
  }
  BOOST_TEST(sum == secret);
  BOOST_TEST(AdditiveSecretSharing::reconstructSecret(shares) == secret);
}

BOOST_AUTO_TEST_CASE(missing_share) {
  auto seed = emp::makeBlock(100, 200);
  emp::PRG prg(&seed);
  auto secret = toField(42);

  auto shares = AdditiveSecretSharing::shareSecret(secret, 3, 5, prg);
  shares.pop_back();
  BOOST_TEST(AdditiveSecretSharing::reconstructSecret(shares) != secret);
}

BOOST_AUTO_TEST_CASE(single_party) {
  auto seed = emp::makeBlock(100, 200);
  emp::PRG prg(&seed);
  auto secret = toField(42);

  auto shares = AdditiveSecretSharing::shareSecret(secret, 1, 1, prg);
  BOOST_TEST(shares.size() == 1);
  BOOST_TEST(shares[0].valueAt() == secret);
}

BOOST_AUTO_TEST_CASE(invalid_parameters) {
  auto seed = emp::makeBlock(100, 200);
  emp::PRG prg(&seed);

  checkSharingError(
      [&]() { AdditiveSecretSharing::shareSecret(toField(1), 1, 0, prg); },
      SecretSharingError::Code::kInvalidInput);
  checkSharingError([]() { AdditiveSecretSharing::reconstructSecret({}); },
                    SecretSharingError::Code::kInsufficientShares);
}

BOOST_DATA_TEST_CASE(linear_operations,
                     bdata::random(0, TEST_DATA_MAX_VAL) ^
                         bdata::random(0, TEST_DATA_MAX_VAL) ^
                         bdata::random(0, TEST_DATA_MAX_VAL) ^
                         bdata::xrange(5),
                     input_a, input_b, scalar, idx) {
  auto seed = emp::makeBlock(100, idx);
  emp::PRG prg(&seed);
  size_t nP = 4;
  auto a = toField(input_a);
  auto b = toField(input_b);
  auto c = toField(scalar);

  auto a_sh = AdditiveSecretSharing::shareSecret(a, 0, nP, prg);
  auto b_sh = AdditiveSecretSharing::shareSecret(b, 0, nP, prg);

  std::vector<AdditiveShare> sum;
  std::vector<AdditiveShare> diff;
  std::vector<AdditiveShare> scaled;
  std::vector<AdditiveShare> shifted;
  for (size_t i = 0; i < nP; ++i) {
    sum.push_back(AdditiveSecretSharing::addShares(a_sh[i], b_sh[i]));
    diff.push_back(AdditiveSecretSharing::subShares(a_sh[i], b_sh[i]));
    scaled.push_back(AdditiveSecretSharing::scalarMulShare(a_sh[i], c));
    shifted.push_back(AdditiveSecretSharing::addConstant(a_sh[i], c));
  }

  BOOST_TEST(AdditiveSecretSharing::reconstructSecret(sum) == a + b);
  BOOST_TEST(AdditiveSecretSharing::reconstructSecret(diff) == a - b);
  BOOST_TEST(AdditiveSecretSharing::reconstructSecret(scaled) == a * c);
  BOOST_TEST(AdditiveSecretSharing::reconstructSecret(shifted) == a + c);
}

BOOST_AUTO_TEST_CASE(multiplication_unsupported) {
  AdditiveShare lhs(0, toField(3));
  AdditiveShare rhs(0, toField(4));

  checkSharingError([&]() { AdditiveSecretSharing::mulShares(lhs, rhs); },
                    SecretSharingError::Code::kReconstructionFailed);
}

BOOST_AUTO_TEST_CASE(party_mismatch) {
  AdditiveShare lhs(0, toField(3));
  AdditiveShare rhs(1, toField(4));

  checkSharingError([&]() { AdditiveSecretSharing::addShares(lhs, rhs); },
                    SecretSharingError::Code::kInvalidShares);
}

BOOST_AUTO_TEST_SUITE_END()
