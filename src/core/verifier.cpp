#include "certum/core/verifier.hpp"
#include "certum/core/logging.hpp"
#include "certum/core/serializer.hpp"
#include <exception>
#include <stdexcept>

namespace certum::core {

  namespace {
    VerificationResult reject(VerificationError error) {
      logger()->debug("certificate rejected: {}", to_string(error));
      return {false, error, std::nullopt};
    }
  }

  std::optional<std::vector<uint8_t>> VerifiedTree::lookup_value(const Path& path) const {
    auto result = lookup_path(path);
    switch (result.status) {
      case LookupStatus::Found:
        return std::move(result.value);
      case LookupStatus::Absent:
        return std::nullopt;
      case LookupStatus::Unknown:
        throw CertificationError(VerificationError::LookupInconclusive,
          "lookup of " + path_to_string(path) + " is inconclusive: subtree pruned");
      case LookupStatus::Error:
        break;
    }
    throw CertificationError(VerificationError::MalformedTree,
      "lookup of " + path_to_string(path) + " hit a malformed tree");
  }

  std::vector<uint8_t> state_root_message(const Hash256& root_hash) {
    auto message = domain_sep("ic-state-root");
    message.insert(message.end(), root_hash.begin(), root_hash.end());
    return message;
  }

  CertificateVerifier::CertificateVerifier(const SignatureScheme& scheme, VerifierConfig config)
    : scheme_(scheme), config_(config) {}

  VerificationResult CertificateVerifier::verify(const Certificate& certificate,
                                                 std::span<const uint8_t> canister_id,
                                                 std::span<const uint8_t> root_public_key) const {
    auto structure = check_structure(certificate, config_.max_tree_depth, config_.max_delegation_depth);
    if (structure != VerificationError::None) return reject(structure);

    auto chain = verify_chain(certificate, canister_id, root_public_key, 0);
    if (chain != VerificationError::None) return reject(chain);

    auto root_hash = certificate.tree.digest();
    logger()->debug("certificate verified for canister {}: root {}", to_hex(canister_id), to_hex(root_hash));
    return {true, VerificationError::None, VerifiedTree(certificate.tree, root_hash, config_.max_tree_depth)};
  }

  VerificationError CertificateVerifier::verify_chain(const Certificate& certificate,
                                                      std::span<const uint8_t> canister_id,
                                                      std::span<const uint8_t> root_public_key,
                                                      size_t depth) const {
    if (depth > config_.max_delegation_depth) return VerificationError::DelegationDepthExceeded;

    if (!certificate.delegation) {
      return check_signature(certificate, root_public_key) ? VerificationError::None
                                                           : VerificationError::SignatureInvalid;
    }

    auto resolved = resolve_delegation(*certificate.delegation, canister_id, root_public_key, depth + 1);
    if (resolved.error != VerificationError::None) return resolved.error;

    return check_signature(certificate, resolved.public_key) ? VerificationError::None
                                                             : VerificationError::SignatureInvalid;
  }

  CertificateVerifier::KeyResolution CertificateVerifier::resolve_delegation(
      const Delegation& delegation, std::span<const uint8_t> canister_id,
      std::span<const uint8_t> root_public_key, size_t depth) const {
    if (depth > config_.max_delegation_depth) return {VerificationError::DelegationDepthExceeded, {}};
    if (!delegation.certificate) {
      // check_structure already ruled this out.
      logger()->error("delegation at depth {} lost its certificate after structural check", depth);
      throw std::logic_error("CertificateVerifier: delegation without certificate");
    }
    const auto& parent = *delegation.certificate;

    auto parent_error = verify_chain(parent, canister_id, root_public_key, depth);
    if (parent_error != VerificationError::None) return {parent_error, {}};

    auto ranges_leaf = parent.tree.lookup_path(subnet_canister_ranges_path(delegation.subnet_id), config_.max_tree_depth);
    if (!ranges_leaf.is_found()) {
      logger()->debug("delegation for subnet {}: canister_ranges {}", to_hex(delegation.subnet_id),
                      to_string(ranges_leaf.status));
      return {VerificationError::MalformedCertificate, {}};
    }

    std::vector<CanisterRange> ranges;
    try {
      ranges = decode_canister_ranges(ranges_leaf.value);
    } catch (const SerializeError& ex) {
      logger()->debug("delegation for subnet {}: {}", to_hex(delegation.subnet_id), ex.what());
      return {VerificationError::MalformedCertificate, {}};
    }
    if (!canister_ranges_valid(ranges)) return {VerificationError::MalformedCertificate, {}};
    if (!ranges_contain(ranges, canister_id)) return {VerificationError::CanisterNotInRange, {}};

    auto key_leaf = parent.tree.lookup_path(subnet_public_key_path(delegation.subnet_id), config_.max_tree_depth);
    if (!key_leaf.is_found()) return {VerificationError::MalformedCertificate, {}};

    return {VerificationError::None, std::move(key_leaf.value)};
  }

  bool CertificateVerifier::check_signature(const Certificate& certificate,
                                            std::span<const uint8_t> public_key) const {
    auto message = state_root_message(certificate.tree.digest());
    try {
      return scheme_.verify(public_key, message, certificate.signature);
    } catch (const std::exception& ex) {
      logger()->warn("signature scheme {} failed: {}", scheme_.name(), ex.what());
      return false;
    }
  }
}
