#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace certum::core {
  using Hash256 = std::array<uint8_t, 32>;

  // Throws std::runtime_error if OpenSSL cannot produce the digest.
  auto sha256(std::span<const uint8_t> data) -> Hash256;

  inline auto sha256(const std::string& data) -> Hash256 {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  }

  // Length-prefixed domain separator: one length byte, then the tag bytes.
  auto domain_sep(std::string_view tag) -> std::vector<uint8_t>;

  /**
   * Incremental SHA-256 over a domain separator followed by any number of parts.
   * Throws std::runtime_error if the digest context cannot be created.
   */
  class DomainHasher {
    public:
      explicit DomainHasher(std::string_view tag);
      ~DomainHasher();

      DomainHasher(const DomainHasher&) = delete;
      DomainHasher& operator=(const DomainHasher&) = delete;

      DomainHasher& update(std::span<const uint8_t> bytes);
      Hash256 finish();

    private:
      struct Ctx;
      std::unique_ptr<Ctx> ctx_;
  };

  auto to_hex(std::span<const uint8_t> data) -> std::string;

  // Accepts upper or lower case; throws std::invalid_argument on odd length or bad digits.
  auto from_hex(std::string_view hex) -> std::vector<uint8_t>;
}
