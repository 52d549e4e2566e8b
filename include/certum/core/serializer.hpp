#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace certum::core {

  struct SerializeError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  enum class CborMajor : uint8_t {
    Unsigned = 0,
    Negative = 1,
    Bytes = 2,
    Text = 3,
    Array = 4,
    Map = 5,
    Tag = 6,
    Simple = 7,
  };

  // Self-describing CBOR tag that prefixes certificates on the wire.
  inline constexpr uint64_t kCborSelfDescribeTag = 55799;

  // Definite-length CBOR encoder; big-endian heads, shortest form.
  class CborWriter {
    public:
      void write_uint(uint64_t value) { write_head(CborMajor::Unsigned, value); }

      void write_bytes(std::span<const uint8_t> bytes) {
        write_head(CborMajor::Bytes, bytes.size());
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
      }
      void write_text(std::string_view str) {
        write_head(CborMajor::Text, str.size());
        buffer_.insert(buffer_.end(), str.begin(), str.end());
      }

      void write_array_header(uint64_t count) { write_head(CborMajor::Array, count); }
      void write_map_header(uint64_t count) { write_head(CborMajor::Map, count); }
      void write_tag(uint64_t tag) { write_head(CborMajor::Tag, tag); }

      // Appends an already encoded item.
      void write_raw(std::span<const uint8_t> bytes) {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
      }

      const std::vector<uint8_t>& buffer() const { return buffer_; }
      std::vector<uint8_t> take() { return std::move(buffer_); }

    private:
      void write_head(CborMajor major, uint64_t value) {
        const auto prefix = static_cast<uint8_t>(static_cast<uint8_t>(major) << 5);
        if (value < 24) {
          buffer_.push_back(static_cast<uint8_t>(prefix | value));
        } else if (value <= 0xFF) {
          buffer_.push_back(prefix | 24);
          write_be_value(static_cast<uint8_t>(value));
        } else if (value <= 0xFFFF) {
          buffer_.push_back(prefix | 25);
          write_be_value(static_cast<uint16_t>(value));
        } else if (value <= 0xFFFFFFFFull) {
          buffer_.push_back(prefix | 26);
          write_be_value(static_cast<uint32_t>(value));
        } else {
          buffer_.push_back(prefix | 27);
          write_be_value(value);
        }
      }
      template <class T> void write_be_value(T value) {
        for (size_t i = sizeof(T); i-- > 0;) buffer_.push_back(static_cast<uint8_t>((value >> (8*i)) & 0xFF));
      }
      std::vector<uint8_t> buffer_;
  };

  /**
   * Definite-length CBOR decoder over untrusted bytes.
   * Every read checks bounds and throws SerializeError instead of reading past the end.
   */
  class CborReader {
    public:
      explicit CborReader(std::span<const uint8_t> src) : src_(src) {}

      CborMajor peek_major() const {
        ensure(remaining_bytes() >= 1);
        return static_cast<CborMajor>(src_[pos_] >> 5);
      }

      uint64_t read_uint() { return read_head(CborMajor::Unsigned); }

      std::vector<uint8_t> read_bytes() {
        auto len = read_head(CborMajor::Bytes);
        ensure(len <= remaining_bytes());
        std::vector<uint8_t> result(src_.begin() + pos_, src_.begin() + pos_ + len);
        pos_ += len;
        return result;
      }

      std::string read_text() {
        auto len = read_head(CborMajor::Text);
        ensure(len <= remaining_bytes());
        std::string result(reinterpret_cast<const char*>(src_.data() + pos_), len);
        pos_ += len;
        return result;
      }

      uint64_t read_array_header() { return read_head(CborMajor::Array); }
      uint64_t read_map_header() { return read_head(CborMajor::Map); }
      uint64_t read_tag() { return read_head(CborMajor::Tag); }

      // Consumes `tag` if the next item carries it.
      bool skip_tag(uint64_t tag) {
        if (remaining_bytes() == 0 || peek_major() != CborMajor::Tag) return false;
        const size_t saved = pos_;
        if (read_tag() == tag) return true;
        pos_ = saved;
        return false;
      }

      // Skips one complete item, nested at most `max_depth` levels.
      void skip_item(size_t max_depth) {
        ensure(max_depth > 0);
        auto [major, value] = read_any_head();
        switch (major) {
          case CborMajor::Bytes:
          case CborMajor::Text:
            ensure(value <= remaining_bytes());
            pos_ += value;
            break;
          case CborMajor::Array:
            for (uint64_t i = 0; i < value; ++i) skip_item(max_depth - 1);
            break;
          case CborMajor::Map:
            for (uint64_t i = 0; i < value; ++i) {
              skip_item(max_depth - 1);
              skip_item(max_depth - 1);
            }
            break;
          case CborMajor::Tag:
            skip_item(max_depth - 1);
            break;
          default:
            break;
        }
      }

      size_t remaining_bytes() const { return src_.size() - pos_; }

    private:
      uint64_t read_head(CborMajor expected) {
        auto [major, value] = read_any_head();
        if (major != expected) throw SerializeError("cbor: unexpected major type");
        return value;
      }

      std::pair<CborMajor, uint64_t> read_any_head() {
        ensure(remaining_bytes() >= 1);
        const uint8_t initial = src_[pos_++];
        const auto major = static_cast<CborMajor>(initial >> 5);
        const uint8_t info = initial & 0x1F;
        if (info < 24) return {major, info};
        switch (info) {
          case 24: return {major, read_be_value<uint8_t>()};
          case 25: return {major, read_be_value<uint16_t>()};
          case 26: return {major, read_be_value<uint32_t>()};
          case 27: return {major, read_be_value<uint64_t>()};
          case 31: throw SerializeError("cbor: indefinite length not supported");
          default: throw SerializeError("cbor: reserved additional info");
        }
      }

      template <class T> T read_be_value() {
        static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>, "T must be unsigned integral");
        ensure(remaining_bytes() >= sizeof(T));
        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
          value = static_cast<T>((value << 8) | src_[pos_++]);
        }
        return value;
      }
      void ensure(bool condition) const { if (!condition) throw SerializeError("cbor: truncated/invalid buffer"); }

      std::span<const uint8_t> src_;
      size_t pos_ = 0;
  };
}
