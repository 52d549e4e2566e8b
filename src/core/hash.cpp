#include <certum/core/hash.hpp>
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace certum::core {

  namespace {
    using EVP_MD_CTX_Ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    EVP_MD_CTX_Ptr new_sha256_ctx(const char* context) {
      EVP_MD_CTX_Ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(std::string(context) + ": digest init failed");
      }
      return ctx;
    }

    void digest_update(EVP_MD_CTX* ctx, std::span<const uint8_t> bytes, const char* context) {
      if (EVP_DigestUpdate(ctx, bytes.data(), bytes.size()) != 1) {
        throw std::runtime_error(std::string(context) + ": EVP_DigestUpdate failed");
      }
    }

    Hash256 digest_final(EVP_MD_CTX* ctx, const char* context) {
      Hash256 out{};
      unsigned int len = static_cast<unsigned int>(out.size());
      if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
        throw std::runtime_error(std::string(context) + ": EVP_DigestFinal_ex failed");
      }
      return out;
    }

    int hex_digit(char c) {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      return -1;
    }
  }

  auto to_hex(std::span<const uint8_t> data) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : data) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
  }

  auto from_hex(std::string_view hex) -> std::vector<uint8_t> {
    if (hex.size() % 2 != 0) throw std::invalid_argument("from_hex: odd length");
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
      int hi = hex_digit(hex[i]);
      int lo = hex_digit(hex[i + 1]);
      if (hi < 0 || lo < 0) throw std::invalid_argument("from_hex: invalid digit");
      out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
  }

  auto sha256(std::span<const uint8_t> data) -> Hash256 {
    auto ctx = new_sha256_ctx("sha256");
    digest_update(ctx.get(), data, "sha256");
    return digest_final(ctx.get(), "sha256");
  }

  auto domain_sep(std::string_view tag) -> std::vector<uint8_t> {
    std::vector<uint8_t> out;
    out.reserve(tag.size() + 1);
    out.push_back(static_cast<uint8_t>(tag.size()));
    out.insert(out.end(), tag.begin(), tag.end());
    return out;
  }

  struct DomainHasher::Ctx {
    EVP_MD_CTX_Ptr md;
  };

  DomainHasher::DomainHasher(std::string_view tag)
    : ctx_(std::make_unique<Ctx>(Ctx{new_sha256_ctx("DomainHasher")})) {
    digest_update(ctx_->md.get(), domain_sep(tag), "DomainHasher");
  }

  DomainHasher::~DomainHasher() = default;

  DomainHasher& DomainHasher::update(std::span<const uint8_t> bytes) {
    digest_update(ctx_->md.get(), bytes, "DomainHasher");
    return *this;
  }

  Hash256 DomainHasher::finish() {
    return digest_final(ctx_->md.get(), "DomainHasher");
  }
}
