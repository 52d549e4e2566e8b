#pragma once
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>
#include "certum/core/hash_tree.hpp"

namespace certum::core {

  enum class VerificationError {
    None = 0,
    MalformedTree,
    MalformedCertificate,
    DelegationDepthExceeded,
    CanisterNotInRange,
    SignatureInvalid,
    LookupInconclusive,
  };

  const char* to_string(VerificationError error);

  // Raised when a caller asks for a proven answer the tree cannot give.
  class CertificationError : public std::runtime_error {
    public:
      CertificationError(VerificationError code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

      VerificationError code() const { return code_; }

    private:
      VerificationError code_;
  };

  inline constexpr size_t kDefaultMaxDelegationDepth = 32;

  using CanisterId = std::vector<uint8_t>;

  // Inclusive, compared byte-lexicographically.
  struct CanisterRange {
    CanisterId low;
    CanisterId high;

    bool contains(std::span<const uint8_t> canister_id) const;
  };

  // Ascending, disjoint and every low <= high.
  bool canister_ranges_valid(const std::vector<CanisterRange>& ranges);
  bool ranges_contain(const std::vector<CanisterRange>& ranges, std::span<const uint8_t> canister_id);

  struct Certificate;

  struct Delegation {
    std::vector<uint8_t> subnet_id;
    std::shared_ptr<const Certificate> certificate;
  };

  struct Certificate {
    HashTree tree;
    std::vector<uint8_t> signature;
    std::shared_ptr<const Delegation> delegation;

    bool has_delegation() const { return delegation != nullptr; }
  };

  // Locations of delegation metadata inside the issuing certificate's tree.
  Path subnet_public_key_path(std::span<const uint8_t> subnet_id);
  Path subnet_canister_ranges_path(std::span<const uint8_t> subnet_id);

  /**
   * Checks shape only, no cryptography: well-formed trees, non-empty signatures,
   * complete delegations, at most `max_delegation_depth` nested delegations.
   */
  VerificationError check_structure(const Certificate& certificate,
                                    size_t max_tree_depth = kDefaultMaxTreeDepth,
                                    size_t max_delegation_depth = kDefaultMaxDelegationDepth);

  // ------- CBOR wire format -------
  std::vector<uint8_t> encode_hash_tree(const HashTree& tree);
  HashTree decode_hash_tree(std::span<const uint8_t> bytes, size_t max_depth = kDefaultMaxTreeDepth);

  std::vector<uint8_t> encode_certificate(const Certificate& certificate);
  Certificate decode_certificate(std::span<const uint8_t> bytes,
                                 size_t max_tree_depth = kDefaultMaxTreeDepth,
                                 size_t max_delegation_depth = kDefaultMaxDelegationDepth);

  std::vector<uint8_t> encode_canister_ranges(const std::vector<CanisterRange>& ranges);
  std::vector<CanisterRange> decode_canister_ranges(std::span<const uint8_t> bytes);
}
