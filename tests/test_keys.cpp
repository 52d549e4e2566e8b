#include <gtest/gtest.h>
#include <stdexcept>
#include "certum/core/keys.hpp"

using namespace certum::core;

TEST(KeysRoundTrip, SignVerifyOK) {
    ASSERT_TRUE(crypto_init());
    auto key_pair = generate_ed25519_keypair();
    std::string message = "certum test message";
    auto signature = sign_message(key_pair.privkey_pem, message);
    EXPECT_TRUE(verify_message(key_pair.pubkey_der, message, signature));
}

TEST(KeysTamper, VerifyFailsOnWrongMsg) {
    ASSERT_TRUE(crypto_init());
    auto key_pair = generate_ed25519_keypair();
    std::string message = "certum test message";
    auto signature = sign_message(key_pair.privkey_pem, message);
    EXPECT_FALSE(verify_message(key_pair.pubkey_der, "different message", signature));
}

TEST(KeysAltCurve, SignVerify_Prime256v1) {
  ASSERT_TRUE(crypto_init());
  auto key_pair = generate_ec_keypair("prime256v1");
  const std::string message = "curve test";
  auto signature = sign_message(key_pair.privkey_pem, message);
  EXPECT_TRUE(verify_message(key_pair.pubkey_der, message, signature));
}

TEST(KeysMismatch, VerifyFailsWithDifferentPublicKey) {
  ASSERT_TRUE(crypto_init());
  auto key_pair_1 = generate_ed25519_keypair();
  auto key_pair_2 = generate_ed25519_keypair();
  const std::string message = "certum mismatch";
  auto signature = sign_message(key_pair_1.privkey_pem, message);
  EXPECT_FALSE(verify_message(key_pair_2.pubkey_der, message, signature));
}

TEST(KeysTamperSignature, VerifyFailsWhenSignatureAltered) {
  ASSERT_TRUE(crypto_init());
  auto key_pair = generate_ed25519_keypair();
  const std::string message = "certum tamper";
  auto signature = sign_message(key_pair.privkey_pem, message);
  ASSERT_FALSE(signature.empty());
  signature[0] ^= 0x01; // flip one bit
  EXPECT_FALSE(verify_message(key_pair.pubkey_der, message, signature));
}

TEST(KeysInvalidPEM, SignThrowsOnInvalidPrivateKey) {
  ASSERT_TRUE(crypto_init());
  std::vector<uint8_t> bogus_priv{ 'n','o','t','-','a','-','k','e','y' };
  const std::string message = "certum invalid";
  EXPECT_THROW({ auto _ = sign_message(bogus_priv, message); (void)_; }, std::runtime_error);
}

TEST(KeysInvalidDER, VerifyFalseOnGarbageKey) {
  ASSERT_TRUE(crypto_init());
  auto key_pair = generate_ed25519_keypair();
  const std::string message = "certum garbage key";
  auto signature = sign_message(key_pair.privkey_pem, message);

  std::vector<uint8_t> garbage{0x30, 0x03, 0x01, 0x02, 0x03};
  EXPECT_FALSE(verify_message(garbage, message, signature));
  EXPECT_FALSE(verify_message(std::vector<uint8_t>{}, message, signature));

  auto trailing = key_pair.pubkey_der;
  trailing.push_back(0x00);
  EXPECT_FALSE(verify_message(trailing, message, signature));
}

TEST(KeysInvalidSig, VerifyFalseOnTruncatedSignature) {
  ASSERT_TRUE(crypto_init());
  auto key_pair = generate_ec_keypair();
  const std::string message = "certum trunc";
  auto signature = sign_message(key_pair.privkey_pem, message);
  ASSERT_GE(signature.size(), static_cast<size_t>(2));
  signature.resize(signature.size() / 2);
  EXPECT_FALSE(verify_message(key_pair.pubkey_der, message, signature));
}

TEST(SignatureSchemeTest, OpenSslSchemeDelegatesToVerifyMessage) {
  ASSERT_TRUE(crypto_init());
  auto key_pair = generate_ed25519_keypair();
  std::vector<uint8_t> message{'m'};
  auto signature = sign_message(key_pair.privkey_pem, message);

  OpenSslSignatureScheme scheme;
  const SignatureScheme& as_base = scheme;
  EXPECT_TRUE(as_base.verify(key_pair.pubkey_der, message, signature));
  signature.back() ^= 0x80;
  EXPECT_FALSE(as_base.verify(key_pair.pubkey_der, message, signature));
}

TEST(CryptoInit, IdempotentCallsSucceed) {
  EXPECT_TRUE(crypto_init());
  EXPECT_TRUE(crypto_init());
}
