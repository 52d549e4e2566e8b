#pragma once
#include <vector>
#include <cstdint>
#include <string>
#include <span>

#include <certum/core/hash.hpp>

namespace certum::core {
  /**
  * Key pair used to issue test and demo certificates.
  * - privkey_pem: PEM-encoded private key bytes
  * - pubkey_der: DER-encoded SubjectPublicKeyInfo, the form root keys are distributed in
  */
  struct KeyPair {
    std::vector<uint8_t> privkey_pem;
    std::vector<uint8_t> pubkey_der;
  };

/**
 * Initialize crypto subsystem; must be called once at startup.
 * Returns true on success.
 */
 bool crypto_init();

/**
 * Generate a new EC keypair using the named curve (e.g., "prime256v1").
 * Throws std::runtime_error on failure.
 */
 KeyPair generate_ec_keypair(const std::string& curve_name = "prime256v1");

/**
 * Generate a new Ed25519 keypair.
 * Throws std::runtime_error on failure.
 */
 KeyPair generate_ed25519_keypair();

/**
 * Sign raw message bytes using the private key in PEM.
 * EC keys sign a SHA-256 digest (DER signature); Ed25519 signs the message itself.
 */
 std::vector<uint8_t> sign_message(const std::vector<uint8_t>& privkey_pem,
  std::span<const uint8_t> message);

/**
 * Verify a signature against a DER public key and message.
 * Returns false for a bad signature and for an unparsable key alike.
 */
 bool verify_message(std::span<const uint8_t> pubkey_der,
  std::span<const uint8_t> message, std::span<const uint8_t> signature);

/**
 * Signature primitive used by certificate verification.
 * Implementations must report every failure as `false` and be safe to call concurrently.
 */
 class SignatureScheme {
  public:
    virtual ~SignatureScheme() = default;

    virtual const char* name() const = 0;
    virtual bool verify(std::span<const uint8_t> public_key, std::span<const uint8_t> message,
                        std::span<const uint8_t> signature) const = 0;
 };

 // OpenSSL EVP backed scheme for DER SubjectPublicKeyInfo keys (EC, Ed25519).
 class OpenSslSignatureScheme : public SignatureScheme {
  public:
    const char* name() const override { return "openssl-evp"; }
    bool verify(std::span<const uint8_t> public_key, std::span<const uint8_t> message,
                std::span<const uint8_t> signature) const override {
      return verify_message(public_key, message, signature);
    }
 };

/**
 * Convenience overloads for std::string
 */
  inline std::vector<uint8_t> sign_message(const std::vector<uint8_t>& privkey_pem,
    const std::string& message) {
    return sign_message(privkey_pem, std::span<const uint8_t>(
      reinterpret_cast<const uint8_t*>(message.data()), message.size()));
  }

  inline bool verify_message(std::span<const uint8_t> pubkey_der,
    const std::string& message, std::span<const uint8_t> signature) {
    return verify_message(pubkey_der, std::span<const uint8_t>(
      reinterpret_cast<const uint8_t*>(message.data()), message.size()), signature);
  }
}
