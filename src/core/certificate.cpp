#include "certum/core/certificate.hpp"
#include "certum/core/serializer.hpp"
#include <algorithm>
#include <string_view>

namespace certum::core {

  namespace {
    template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    // Node tags of the tree encoding.
    constexpr uint64_t kTagEmpty = 0;
    constexpr uint64_t kTagFork = 1;
    constexpr uint64_t kTagLabeled = 2;
    constexpr uint64_t kTagLeaf = 3;
    constexpr uint64_t kTagPruned = 4;

    bool bytes_less(std::span<const uint8_t> a, std::span<const uint8_t> b) {
      return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
    }

    void write_tree(CborWriter& writer, const HashTree& tree) {
      std::visit(overloaded{
        [&](const EmptyNode&) {
          writer.write_array_header(1);
          writer.write_uint(kTagEmpty);
        },
        [&](const ForkNode& fork) {
          if (!fork.left || !fork.right) throw std::invalid_argument("encode_hash_tree: fork with null child");
          writer.write_array_header(3);
          writer.write_uint(kTagFork);
          write_tree(writer, *fork.left);
          write_tree(writer, *fork.right);
        },
        [&](const LabeledNode& labeled) {
          if (!labeled.subtree) throw std::invalid_argument("encode_hash_tree: labeled node with null subtree");
          writer.write_array_header(3);
          writer.write_uint(kTagLabeled);
          writer.write_bytes(labeled.label);
          write_tree(writer, *labeled.subtree);
        },
        [&](const LeafNode& leaf) {
          writer.write_array_header(2);
          writer.write_uint(kTagLeaf);
          writer.write_bytes(leaf.value);
        },
        [&](const PrunedNode& pruned) {
          writer.write_array_header(2);
          writer.write_uint(kTagPruned);
          writer.write_bytes(pruned.digest);
        },
      }, tree.node());
    }

    HashTree read_tree(CborReader& reader, size_t depth, size_t max_depth) {
      if (depth > max_depth) throw SerializeError("hash tree: nesting too deep");
      const auto count = reader.read_array_header();
      if (count == 0) throw SerializeError("hash tree: empty node array");
      const auto tag = reader.read_uint();

      switch (tag) {
        case kTagEmpty:
          if (count != 1) break;
          return HashTree::empty();
        case kTagFork: {
          if (count != 3) break;
          auto left = read_tree(reader, depth + 1, max_depth);
          auto right = read_tree(reader, depth + 1, max_depth);
          return HashTree::fork(std::move(left), std::move(right));
        }
        case kTagLabeled: {
          if (count != 3) break;
          auto node_label = reader.read_bytes();
          auto subtree = read_tree(reader, depth + 1, max_depth);
          return HashTree::labeled(std::move(node_label), std::move(subtree));
        }
        case kTagLeaf:
          if (count != 2) break;
          return HashTree::leaf(reader.read_bytes());
        case kTagPruned: {
          if (count != 2) break;
          auto bytes = reader.read_bytes();
          Hash256 digest{};
          if (bytes.size() != digest.size()) throw SerializeError("hash tree: pruned digest must be 32 bytes");
          std::copy(bytes.begin(), bytes.end(), digest.begin());
          return HashTree::pruned(digest);
        }
        default:
          throw SerializeError("hash tree: unknown node tag");
      }
      throw SerializeError("hash tree: wrong arity for node tag");
    }

    void write_certificate(CborWriter& writer, const Certificate& certificate) {
      writer.write_map_header(certificate.delegation ? 3 : 2);
      writer.write_text("tree");
      write_tree(writer, certificate.tree);
      writer.write_text("signature");
      writer.write_bytes(certificate.signature);
      if (certificate.delegation) {
        const auto& delegation = *certificate.delegation;
        if (!delegation.certificate) throw std::invalid_argument("encode_certificate: delegation without certificate");
        writer.write_text("delegation");
        writer.write_map_header(2);
        writer.write_text("subnet_id");
        writer.write_bytes(delegation.subnet_id);
        writer.write_text("certificate");
        writer.write_bytes(encode_certificate(*delegation.certificate));
      }
    }

    Certificate read_certificate(std::span<const uint8_t> bytes, size_t depth,
                                 size_t max_tree_depth, size_t max_delegation_depth);

    std::shared_ptr<const Delegation> read_delegation(CborReader& reader, size_t depth,
                                                      size_t max_tree_depth, size_t max_delegation_depth) {
      if (depth > max_delegation_depth) throw SerializeError("certificate: delegation chain too deep");
      auto delegation = std::make_shared<Delegation>();
      bool has_subnet = false;
      bool has_certificate = false;

      const auto entries = reader.read_map_header();
      for (uint64_t i = 0; i < entries; ++i) {
        const auto key = reader.read_text();
        if (key == "subnet_id" && !has_subnet) {
          delegation->subnet_id = reader.read_bytes();
          has_subnet = true;
        } else if (key == "certificate" && !has_certificate) {
          auto nested = reader.read_bytes();
          delegation->certificate = std::make_shared<const Certificate>(
            read_certificate(nested, depth, max_tree_depth, max_delegation_depth));
          has_certificate = true;
        } else if (key == "subnet_id" || key == "certificate") {
          throw SerializeError("delegation: duplicate key " + key);
        } else {
          reader.skip_item(max_tree_depth);
        }
      }
      if (!has_subnet || !has_certificate) throw SerializeError("delegation: missing subnet_id or certificate");
      return delegation;
    }

    Certificate read_certificate(std::span<const uint8_t> bytes, size_t depth,
                                 size_t max_tree_depth, size_t max_delegation_depth) {
      CborReader reader(bytes);
      reader.skip_tag(kCborSelfDescribeTag);

      Certificate certificate;
      bool has_tree = false;
      bool has_signature = false;
      bool has_delegation = false;

      const auto entries = reader.read_map_header();
      for (uint64_t i = 0; i < entries; ++i) {
        const auto key = reader.read_text();
        if (key == "tree" && !has_tree) {
          certificate.tree = read_tree(reader, 0, max_tree_depth);
          has_tree = true;
        } else if (key == "signature" && !has_signature) {
          certificate.signature = reader.read_bytes();
          has_signature = true;
        } else if (key == "delegation" && !has_delegation) {
          certificate.delegation = read_delegation(reader, depth + 1, max_tree_depth, max_delegation_depth);
          has_delegation = true;
        } else if (key == "tree" || key == "signature" || key == "delegation") {
          throw SerializeError("certificate: duplicate key " + key);
        } else {
          reader.skip_item(max_tree_depth);
        }
      }
      if (!has_tree || !has_signature) throw SerializeError("certificate: missing tree or signature");
      if (reader.remaining_bytes() != 0) throw SerializeError("certificate: trailing bytes");
      return certificate;
    }
  }

  const char* to_string(VerificationError error) {
    switch (error) {
      case VerificationError::None: return "none";
      case VerificationError::MalformedTree: return "malformed tree";
      case VerificationError::MalformedCertificate: return "malformed certificate";
      case VerificationError::DelegationDepthExceeded: return "delegation depth exceeded";
      case VerificationError::CanisterNotInRange: return "canister not in range";
      case VerificationError::SignatureInvalid: return "signature invalid";
      case VerificationError::LookupInconclusive: return "lookup inconclusive";
    }
    return "unknown";
  }

  bool CanisterRange::contains(std::span<const uint8_t> canister_id) const {
    return !bytes_less(canister_id, low) && !bytes_less(high, canister_id);
  }

  bool canister_ranges_valid(const std::vector<CanisterRange>& ranges) {
    for (size_t i = 0; i < ranges.size(); ++i) {
      if (bytes_less(ranges[i].high, ranges[i].low)) return false;
      if (i > 0 && !bytes_less(ranges[i - 1].high, ranges[i].low)) return false;
    }
    return true;
  }

  bool ranges_contain(const std::vector<CanisterRange>& ranges, std::span<const uint8_t> canister_id) {
    return std::any_of(ranges.begin(), ranges.end(),
      [&](const CanisterRange& range) { return range.contains(canister_id); });
  }

  Path subnet_public_key_path(std::span<const uint8_t> subnet_id) {
    return {label("subnet"), Label(subnet_id.begin(), subnet_id.end()), label("public_key")};
  }

  Path subnet_canister_ranges_path(std::span<const uint8_t> subnet_id) {
    return {label("subnet"), Label(subnet_id.begin(), subnet_id.end()), label("canister_ranges")};
  }

  VerificationError check_structure(const Certificate& certificate,
                                    size_t max_tree_depth, size_t max_delegation_depth) {
    const Certificate* current = &certificate;
    for (size_t depth = 0;; ++depth) {
      if (!current->tree.is_well_formed(max_tree_depth)) return VerificationError::MalformedTree;
      if (current->signature.empty()) return VerificationError::MalformedCertificate;
      if (!current->delegation) return VerificationError::None;
      if (depth + 1 > max_delegation_depth) return VerificationError::DelegationDepthExceeded;

      const auto& delegation = *current->delegation;
      if (delegation.subnet_id.empty() || !delegation.certificate) return VerificationError::MalformedCertificate;
      current = delegation.certificate.get();
    }
  }

  std::vector<uint8_t> encode_hash_tree(const HashTree& tree) {
    CborWriter writer;
    write_tree(writer, tree);
    return writer.take();
  }

  HashTree decode_hash_tree(std::span<const uint8_t> bytes, size_t max_depth) {
    CborReader reader(bytes);
    auto tree = read_tree(reader, 0, max_depth);
    if (reader.remaining_bytes() != 0) throw SerializeError("hash tree: trailing bytes");
    return tree;
  }

  std::vector<uint8_t> encode_certificate(const Certificate& certificate) {
    CborWriter writer;
    writer.write_tag(kCborSelfDescribeTag);
    write_certificate(writer, certificate);
    return writer.take();
  }

  Certificate decode_certificate(std::span<const uint8_t> bytes,
                                 size_t max_tree_depth, size_t max_delegation_depth) {
    return read_certificate(bytes, 0, max_tree_depth, max_delegation_depth);
  }

  std::vector<uint8_t> encode_canister_ranges(const std::vector<CanisterRange>& ranges) {
    CborWriter writer;
    writer.write_array_header(ranges.size());
    for (const auto& range : ranges) {
      writer.write_array_header(2);
      writer.write_bytes(range.low);
      writer.write_bytes(range.high);
    }
    return writer.take();
  }

  std::vector<CanisterRange> decode_canister_ranges(std::span<const uint8_t> bytes) {
    CborReader reader(bytes);
    reader.skip_tag(kCborSelfDescribeTag);
    const auto count = reader.read_array_header();
    // Each range takes at least three bytes on the wire.
    if (count > reader.remaining_bytes() / 3) throw SerializeError("canister ranges: count exceeds input");

    std::vector<CanisterRange> ranges;
    ranges.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
      if (reader.read_array_header() != 2) throw SerializeError("canister ranges: range must have two bounds");
      CanisterRange range;
      range.low = reader.read_bytes();
      range.high = reader.read_bytes();
      ranges.push_back(std::move(range));
    }
    if (reader.remaining_bytes() != 0) throw SerializeError("canister ranges: trailing bytes");
    return ranges;
  }
}
