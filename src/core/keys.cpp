#include "certum/core/keys.hpp"
#include <openssl/evp.h>
#include <openssl/core_names.h>
#include <openssl/params.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/crypto.h>
#include <openssl/x509.h>

#include <climits>
#include <stdexcept>
#include <memory>

namespace certum::core {

  namespace  {

    void throw_openssl_error(const std::string& context) {
      unsigned long err = ERR_get_error();
      char err_buf[256]{0};
      ERR_error_string_n(err, err_buf, sizeof(err_buf));
      throw std::runtime_error(context + ": " + err_buf);
    }

    using EVP_PKEY_Ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using EVP_PKEY_CTX_Ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
    using EVP_MD_CTX_Ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    // Ed25519 hashes internally and takes no digest.
    const EVP_MD* digest_for(EVP_PKEY* key) {
      return EVP_PKEY_get_base_id(key) == EVP_PKEY_ED25519 ? nullptr : EVP_sha256();
    }

    std::vector<uint8_t> export_private_pem(EVP_PKEY* key) {
      BIO* bio = BIO_new(BIO_s_mem());
      if (!bio) throw_openssl_error("BIO_new");
      std::unique_ptr<BIO, decltype(&BIO_free)> bio_guard(bio, &BIO_free);

      if (PEM_write_bio_PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw_openssl_error("PEM_write_bio_PrivateKey");
      }

      char* data = nullptr;
      long len = BIO_get_mem_data(bio, &data);
      if (len <= 0) throw_openssl_error("BIO_get_mem_data");

      return std::vector<uint8_t>(data, data + len);
    }

    std::vector<uint8_t> export_public_der(EVP_PKEY* key) {
      int len = i2d_PUBKEY(key, nullptr);
      if (len <= 0) throw_openssl_error("i2d_PUBKEY (get length)");
      std::vector<uint8_t> der(static_cast<size_t>(len));
      unsigned char* cursor = der.data();
      if (i2d_PUBKEY(key, &cursor) != len) throw_openssl_error("i2d_PUBKEY");
      return der;
    }

    KeyPair generate_keypair(const char* algorithm, const OSSL_PARAM* params) {
      EVP_PKEY_Ptr key_handle(nullptr, &EVP_PKEY_free);
      EVP_PKEY_CTX_Ptr keygen_ctx(EVP_PKEY_CTX_new_from_name(nullptr, algorithm, nullptr), &EVP_PKEY_CTX_free);
      if (!keygen_ctx) throw_openssl_error("EVP_PKEY_CTX_new_from_name");

      if (EVP_PKEY_keygen_init(keygen_ctx.get()) <= 0) throw_openssl_error("EVP_PKEY_keygen_init");

      if (params && EVP_PKEY_CTX_set_params(keygen_ctx.get(), params) <= 0) {
        throw_openssl_error("EVP_PKEY_CTX_set_params");
      }

      EVP_PKEY* generated_key = nullptr;
      if (EVP_PKEY_keygen(keygen_ctx.get(), &generated_key) <= 0) throw_openssl_error("EVP_PKEY_keygen");
      key_handle.reset(generated_key);

      return {export_private_pem(key_handle.get()), export_public_der(key_handle.get())};
    }
  }

  bool crypto_init() {
    if (OPENSSL_init_crypto(0, nullptr) != 1) {
      return false;
    }
    ERR_load_crypto_strings();
    return true;
  }

  KeyPair generate_ec_keypair(const std::string& curve_name) {
    OSSL_PARAM params[2] = {
      OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
        const_cast<char*>(curve_name.c_str()), 0),
        OSSL_PARAM_construct_end()
    };
    return generate_keypair("EC", params);
  }

  KeyPair generate_ed25519_keypair() {
    return generate_keypair("ED25519", nullptr);
  }

  std::vector<uint8_t> sign_message(const std::vector<uint8_t>& privkey_pem,
    std::span<const uint8_t> message) {
      BIO* bio = BIO_new_mem_buf(privkey_pem.data(), static_cast<int>(privkey_pem.size()));
      if (!bio) throw_openssl_error("BIO_new_mem_buf");
      std::unique_ptr<BIO, decltype(&BIO_free)> bio_guard(bio, &BIO_free);

      EVP_PKEY* raw_key = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
      if (!raw_key) throw_openssl_error("PEM_read_bio_PrivateKey");
      EVP_PKEY_Ptr key_handle(raw_key, &EVP_PKEY_free);

      EVP_MD_CTX_Ptr sign_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (!sign_ctx) throw_openssl_error("EVP_MD_CTX_new");

      if (EVP_DigestSignInit(sign_ctx.get(), nullptr, digest_for(key_handle.get()), nullptr, key_handle.get()) <= 0)
        throw_openssl_error("EVP_DigestSignInit");

      size_t sig_len = 0;
      if (EVP_DigestSign(sign_ctx.get(), nullptr, &sig_len, message.data(), message.size()) <= 0)
        throw_openssl_error("EVP_DigestSign (get length)");

      std::vector<uint8_t> signature(sig_len);
      if (EVP_DigestSign(sign_ctx.get(), signature.data(), &sig_len, message.data(), message.size()) <= 0)
        throw_openssl_error("EVP_DigestSign (get signature)");
      signature.resize(sig_len);

      return signature;
    }

  bool verify_message(std::span<const uint8_t> pubkey_der, std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
      if (pubkey_der.empty() || pubkey_der.size() > static_cast<size_t>(LONG_MAX)) return false;

      const unsigned char* cursor = pubkey_der.data();
      EVP_PKEY* raw_key = d2i_PUBKEY(nullptr, &cursor, static_cast<long>(pubkey_der.size()));
      if (!raw_key) {
        ERR_clear_error();
        return false;
      }
      EVP_PKEY_Ptr key_handle(raw_key, &EVP_PKEY_free);
      // Trailing garbage after the key structure is not a valid key.
      if (cursor != pubkey_der.data() + pubkey_der.size()) return false;

      EVP_MD_CTX_Ptr verify_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (!verify_ctx) return false;

      if (EVP_DigestVerifyInit(verify_ctx.get(), nullptr, digest_for(key_handle.get()), nullptr, key_handle.get()) <= 0) {
        ERR_clear_error();
        return false;
      }

      int result = EVP_DigestVerify(verify_ctx.get(), signature.data(), signature.size(),
                                    message.data(), message.size());
      ERR_clear_error();
      return (result == 1);
    }

  }
