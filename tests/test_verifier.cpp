#include <gtest/gtest.h>
#include <stdexcept>
#include "certum/core/certificate.hpp"
#include "certum/core/keys.hpp"
#include "certum/core/verifier.hpp"

using namespace certum::core;

namespace {
  const std::vector<uint8_t> kCanister{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x01, 0x01};

  Certificate sign_tree(HashTree tree, const KeyPair& signer, std::shared_ptr<const Delegation> delegation = nullptr) {
    Certificate certificate;
    certificate.signature = sign_message(signer.privkey_pem, state_root_message(tree.digest()));
    certificate.tree = std::move(tree);
    certificate.delegation = std::move(delegation);
    return certificate;
  }

  HashTree subnet_tree(const std::vector<uint8_t>& subnet_id, const std::vector<uint8_t>& public_key,
                       const std::vector<CanisterRange>& ranges) {
    return HashTree::fork(
      HashTree::labeled("subnet", HashTree::labeled(subnet_id, HashTree::fork(
        HashTree::labeled("canister_ranges", HashTree::leaf(encode_canister_ranges(ranges))),
        HashTree::labeled("public_key", HashTree::leaf(public_key))))),
      HashTree::labeled("time", HashTree::leaf("1")));
  }

  std::shared_ptr<const Delegation> delegate(const std::vector<uint8_t>& subnet_id, Certificate parent) {
    auto delegation = std::make_shared<Delegation>();
    delegation->subnet_id = subnet_id;
    delegation->certificate = std::make_shared<const Certificate>(std::move(parent));
    return delegation;
  }

  HashTree canister_tree(const std::string& time) {
    return HashTree::labeled("canister_id", HashTree::labeled("time", HashTree::leaf(time)));
  }

  class ThrowingScheme : public SignatureScheme {
    public:
      const char* name() const override { return "throwing"; }
      bool verify(std::span<const uint8_t>, std::span<const uint8_t>, std::span<const uint8_t>) const override {
        throw std::runtime_error("backend unavailable");
      }
  };

  std::string text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
  }
}

class VerifierTest : public ::testing::Test {
  protected:
    void SetUp() override {
      ASSERT_TRUE(crypto_init());
      root_ = generate_ed25519_keypair();
      subnet_ = generate_ed25519_keypair();
    }

    // Root-signed delegation handing `subnet_` the given ranges.
    std::shared_ptr<const Delegation> subnet_delegation(const std::vector<CanisterRange>& ranges) {
      return delegate(subnet_id_, sign_tree(subnet_tree(subnet_id_, subnet_.pubkey_der, ranges), root_));
    }

    OpenSslSignatureScheme scheme_;
    KeyPair root_;
    KeyPair subnet_;
    std::vector<uint8_t> subnet_id_{0x5A, 0x01};
    std::vector<CanisterRange> ranges_{CanisterRange{{0x00}, {0x00, 0xFF}}};
};

TEST_F(VerifierTest, RootSignedCertificateVerifies) {
  auto certificate = sign_tree(canister_tree("12345"), root_);
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_);

  ASSERT_TRUE(result.is_valid);
  EXPECT_EQ(result.error, VerificationError::None);
  ASSERT_TRUE(result.tree.has_value());
  EXPECT_EQ(result.tree->digest(), certificate.tree.digest());

  auto lookup = result.tree->lookup_path(make_path({"canister_id", "time"}));
  ASSERT_EQ(lookup.status, LookupStatus::Found);
  EXPECT_EQ(text(lookup.value), "12345");
}

TEST_F(VerifierTest, FlippedSignatureByteIsRejected) {
  auto certificate = sign_tree(canister_tree("12345"), root_);
  certificate.signature[0] ^= 0x01;
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_);
  EXPECT_FALSE(result.is_valid);
  EXPECT_EQ(result.error, VerificationError::SignatureInvalid);
  EXPECT_FALSE(result.tree.has_value());
}

TEST_F(VerifierTest, TreeSwappedAfterSigningIsRejected) {
  auto certificate = sign_tree(canister_tree("12345"), root_);
  certificate.tree = canister_tree("99999");
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_);
  EXPECT_EQ(result.error, VerificationError::SignatureInvalid);
}

TEST_F(VerifierTest, WrongOrGarbageRootKeyIsRejected) {
  auto certificate = sign_tree(canister_tree("12345"), root_);
  EXPECT_EQ(verify_certificate(certificate, kCanister, subnet_.pubkey_der, scheme_).error,
            VerificationError::SignatureInvalid);

  std::vector<uint8_t> garbage{0x01, 0x02, 0x03};
  EXPECT_EQ(verify_certificate(certificate, kCanister, garbage, scheme_).error,
            VerificationError::SignatureInvalid);
}

TEST_F(VerifierTest, SchemeFailureCountsAsInvalidSignature) {
  auto certificate = sign_tree(canister_tree("12345"), root_);
  ThrowingScheme throwing;
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, throwing);
  EXPECT_FALSE(result.is_valid);
  EXPECT_EQ(result.error, VerificationError::SignatureInvalid);
}

TEST_F(VerifierTest, UnsortedTreeIsMalformed) {
  auto unsorted = HashTree::fork(
    HashTree::labeled("time", HashTree::leaf("1")),
    HashTree::labeled("canister", HashTree::leaf("2")));
  auto certificate = sign_tree(unsorted, root_);
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_);
  EXPECT_EQ(result.error, VerificationError::MalformedTree);
}

TEST_F(VerifierTest, EmptySignatureIsMalformed) {
  auto certificate = sign_tree(canister_tree("1"), root_);
  certificate.signature.clear();
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_);
  EXPECT_EQ(result.error, VerificationError::MalformedCertificate);
}

TEST_F(VerifierTest, DelegatedCertificateVerifies) {
  auto certificate = sign_tree(canister_tree("777"), subnet_, subnet_delegation(ranges_));
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_);

  ASSERT_TRUE(result.is_valid) << to_string(result.error);
  auto value = result.tree->lookup_value(make_path({"canister_id", "time"}));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(text(*value), "777");
}

TEST_F(VerifierTest, DelegatedCertificateSignedByRootIsRejected) {
  auto certificate = sign_tree(canister_tree("777"), root_, subnet_delegation(ranges_));
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_);
  EXPECT_EQ(result.error, VerificationError::SignatureInvalid);
}

TEST_F(VerifierTest, ForgedDelegationIsRejected) {
  auto forger = generate_ed25519_keypair();
  auto forged = delegate(subnet_id_, sign_tree(subnet_tree(subnet_id_, subnet_.pubkey_der, ranges_), forger));
  auto certificate = sign_tree(canister_tree("777"), subnet_, forged);
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_);
  EXPECT_EQ(result.error, VerificationError::SignatureInvalid);
}

TEST_F(VerifierTest, CanisterOutsideDelegatedRangesIsRejected) {
  std::vector<CanisterRange> narrow{{{0x00, 0x10}, {0x00, 0x20}}, {{0x00, 0x40}, {0x00, 0x50}}};
  auto certificate = sign_tree(canister_tree("1"), subnet_, subnet_delegation(narrow));

  std::vector<uint8_t> outside{0x00, 0x30};
  EXPECT_EQ(verify_certificate(certificate, outside, root_.pubkey_der, scheme_).error,
            VerificationError::CanisterNotInRange);

  std::vector<uint8_t> at_bound{0x00, 0x50};
  EXPECT_TRUE(verify_certificate(certificate, at_bound, root_.pubkey_der, scheme_).is_valid);
}

TEST_F(VerifierTest, MissingOrInvalidRangesAreMalformed) {
  auto keys_only = HashTree::labeled("subnet", HashTree::labeled(subnet_id_,
    HashTree::labeled("public_key", HashTree::leaf(subnet_.pubkey_der))));
  auto no_ranges = delegate(subnet_id_, sign_tree(keys_only, root_));
  auto certificate = sign_tree(canister_tree("1"), subnet_, no_ranges);
  EXPECT_EQ(verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_).error,
            VerificationError::MalformedCertificate);

  std::vector<CanisterRange> overlapping{{{0x00}, {0x00, 0x90}}, {{0x00, 0x80}, {0x01}}};
  auto bad_ranges = sign_tree(canister_tree("1"), subnet_, subnet_delegation(overlapping));
  EXPECT_EQ(verify_certificate(bad_ranges, kCanister, root_.pubkey_der, scheme_).error,
            VerificationError::MalformedCertificate);
}

TEST_F(VerifierTest, MissingSubnetKeyIsMalformed) {
  auto ranges_only = HashTree::labeled("subnet", HashTree::labeled(subnet_id_,
    HashTree::labeled("canister_ranges", HashTree::leaf(encode_canister_ranges(ranges_)))));
  auto delegation = delegate(subnet_id_, sign_tree(ranges_only, root_));
  auto certificate = sign_tree(canister_tree("1"), subnet_, delegation);
  EXPECT_EQ(verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_).error,
            VerificationError::MalformedCertificate);
}

TEST_F(VerifierTest, NestedDelegationsRespectDepthCap) {
  auto inner = generate_ed25519_keypair();
  std::vector<uint8_t> inner_subnet{0x5A, 0x02};
  auto middle = sign_tree(subnet_tree(inner_subnet, inner.pubkey_der, ranges_), subnet_, subnet_delegation(ranges_));
  auto certificate = sign_tree(canister_tree("1"), inner, delegate(inner_subnet, middle));

  EXPECT_TRUE(verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_).is_valid);

  VerifierConfig shallow;
  shallow.max_delegation_depth = 1;
  EXPECT_EQ(verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_, shallow).error,
            VerificationError::DelegationDepthExceeded);
}

TEST_F(VerifierTest, RangesCheckedAtEveryDelegationLevel) {
  auto inner = generate_ed25519_keypair();
  std::vector<uint8_t> inner_subnet{0x5A, 0x02};
  std::vector<CanisterRange> elsewhere{CanisterRange{{0x00, 0x01}, {0x00, 0x02}}};

  auto nested = [&](const std::vector<CanisterRange>& root_ranges, const std::vector<CanisterRange>& subnet_ranges) {
    auto middle = sign_tree(subnet_tree(inner_subnet, inner.pubkey_der, subnet_ranges), subnet_,
                            subnet_delegation(root_ranges));
    return sign_tree(canister_tree("1"), inner, delegate(inner_subnet, middle));
  };

  // Root grants the canister, the intermediate subnet does not.
  EXPECT_EQ(verify_certificate(nested(ranges_, elsewhere), kCanister, root_.pubkey_der, scheme_).error,
            VerificationError::CanisterNotInRange);
  // Intermediate subnet grants it, but root never delegated it.
  EXPECT_EQ(verify_certificate(nested(elsewhere, ranges_), kCanister, root_.pubkey_der, scheme_).error,
            VerificationError::CanisterNotInRange);
  EXPECT_TRUE(verify_certificate(nested(ranges_, ranges_), kCanister, root_.pubkey_der, scheme_).is_valid);
}

TEST_F(VerifierTest, ChainLongerThanDefaultCapIsRejected) {
  Certificate certificate = sign_tree(canister_tree("0"), root_);
  for (size_t i = 0; i < kDefaultMaxDelegationDepth + 1; ++i) {
    certificate = sign_tree(canister_tree(std::to_string(i + 1)), root_, delegate(subnet_id_, certificate));
  }
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_);
  EXPECT_EQ(result.error, VerificationError::DelegationDepthExceeded);
}

TEST_F(VerifierTest, LookupValueDistinguishesAbsentFromUnknown) {
  auto tree = HashTree::fork(
    HashTree::labeled("a", HashTree::leaf("1")),
    HashTree::labeled("c", HashTree::leaf("3")).prune());
  auto certificate = sign_tree(tree, root_);
  auto result = verify_certificate(certificate, kCanister, root_.pubkey_der, scheme_);
  ASSERT_TRUE(result.is_valid);
  const auto& verified = *result.tree;

  auto found = verified.lookup_value(make_path({"a"}));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(text(*found), "1");
  EXPECT_FALSE(verified.lookup_value(make_path({"0"})).has_value());

  try {
    (void)verified.lookup_value(make_path({"c"}));
    FAIL() << "expected CertificationError";
  } catch (const CertificationError& ex) {
    EXPECT_EQ(ex.code(), VerificationError::LookupInconclusive);
  }
}

TEST_F(VerifierTest, SubtreeUnderPrunedBranchNeverProvesAbsence) {
  auto tree = HashTree::fork(
    HashTree::labeled("a", HashTree::leaf("1")),
    HashTree::labeled("c", HashTree::labeled("x", HashTree::leaf("secret"))).prune());
  auto result = verify_certificate(sign_tree(tree, root_), kCanister, root_.pubkey_der, scheme_);
  ASSERT_TRUE(result.is_valid);
  const auto& verified = *result.tree;

  EXPECT_EQ(verified.lookup_subtree_result(make_path({"c"})).status, LookupStatus::Unknown);
  auto c = verified.lookup_subtree(make_path({"c"}));
  EXPECT_EQ(c.lookup_path(make_path({"x"})).status, LookupStatus::Unknown);
  EXPECT_TRUE(verified.lookup_subtree(make_path({"0"})).is_empty());
}

TEST(StateRootMessage, DomainSeparatedRootHash) {
  Hash256 root{};
  root.fill(0x42);
  auto message = state_root_message(root);
  ASSERT_EQ(message.size(), 1u + 13u + 32u);
  EXPECT_EQ(message[0], 13);
  EXPECT_EQ(std::string(message.begin() + 1, message.begin() + 14), "ic-state-root");
  EXPECT_EQ(message.back(), 0x42);
}
