#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "certum/core/certificate.hpp"
#include "certum/core/hash_tree.hpp"
#include "certum/core/keys.hpp"

namespace certum::core {

  struct VerifierConfig {
    size_t max_delegation_depth = kDefaultMaxDelegationDepth;
    size_t max_tree_depth = kDefaultMaxTreeDepth;
  };

  class CertificateVerifier;

  /**
   * A hash tree whose root was signed by a trusted key.
   * Found answers are proven values, Absent answers proven absence; Unknown proves nothing.
   * Only CertificateVerifier creates these.
   */
  class VerifiedTree {
    public:
      const HashTree& tree() const { return tree_; }
      const Hash256& digest() const { return digest_; }

      LookupResult lookup_path(const Path& path) const { return tree_.lookup_path(path, max_depth_); }
      HashTree lookup_subtree(const Path& path) const { return tree_.lookup_subtree(path, max_depth_); }
      SubtreeLookup lookup_subtree_result(const Path& path) const {
        return tree_.lookup_subtree_result(path, max_depth_);
      }

      // Value if proven present, nullopt if proven absent.
      // Throws CertificationError (LookupInconclusive or MalformedTree) otherwise.
      std::optional<std::vector<uint8_t>> lookup_value(const Path& path) const;

    private:
      friend class CertificateVerifier;
      VerifiedTree(HashTree tree, const Hash256& digest, size_t max_depth)
        : tree_(std::move(tree)), digest_(digest), max_depth_(max_depth) {}

      HashTree tree_;
      Hash256 digest_;
      size_t max_depth_;
  };

  struct VerificationResult {
    bool is_valid;
    VerificationError error;
    std::optional<VerifiedTree> tree;
  };

  // Domain separator "ic-state-root" followed by the root hash.
  std::vector<uint8_t> state_root_message(const Hash256& root_hash);

  class CertificateVerifier {
    public:
      explicit CertificateVerifier(const SignatureScheme& scheme, VerifierConfig config = {});

      const VerifierConfig& config() const { return config_; }

      /**
       * Full check: structure, delegation chain (parent signatures, canister ranges,
       * depth cap), then the signature over this certificate's root hash.
       */
      VerificationResult verify(const Certificate& certificate,
                                std::span<const uint8_t> canister_id,
                                std::span<const uint8_t> root_public_key) const;

    private:
      struct KeyResolution {
        VerificationError error;
        std::vector<uint8_t> public_key;
      };

      VerificationError verify_chain(const Certificate& certificate, std::span<const uint8_t> canister_id,
                                     std::span<const uint8_t> root_public_key, size_t depth) const;
      KeyResolution resolve_delegation(const Delegation& delegation, std::span<const uint8_t> canister_id,
                                       std::span<const uint8_t> root_public_key, size_t depth) const;
      bool check_signature(const Certificate& certificate, std::span<const uint8_t> public_key) const;

      const SignatureScheme& scheme_;
      VerifierConfig config_{};
  };

  inline VerificationResult verify_certificate(const Certificate& certificate,
                                               std::span<const uint8_t> canister_id,
                                               std::span<const uint8_t> root_public_key,
                                               const SignatureScheme& scheme,
                                               VerifierConfig config = {}) {
    return CertificateVerifier(scheme, config).verify(certificate, canister_id, root_public_key);
  }
}
