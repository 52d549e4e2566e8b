#pragma once
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "certum/core/hash.hpp"

namespace certum::core {

  using Label = std::vector<uint8_t>;
  using Path = std::vector<Label>;

  Label label(std::string_view text);
  Path make_path(std::initializer_list<std::string_view> segments);
  std::string path_to_string(const Path& path);

  class HashTree;
  struct SubtreeLookup;
  using HashTreePtr = std::shared_ptr<const HashTree>;

  struct EmptyNode {};

  struct ForkNode {
    HashTreePtr left;
    HashTreePtr right;
  };

  struct LabeledNode {
    Label label;
    HashTreePtr subtree;
  };

  struct LeafNode {
    std::vector<uint8_t> value;
  };

  struct PrunedNode {
    Hash256 digest;
  };

  enum class LookupStatus {
    Found,
    Absent,
    Unknown,
    Error,
  };

  const char* to_string(LookupStatus status);

  struct LookupResult {
    LookupStatus status = LookupStatus::Absent;
    std::vector<uint8_t> value;

    bool is_found() const { return status == LookupStatus::Found; }
  };

  // Nesting cap (forks plus labels) for any traversal of an untrusted tree.
  inline constexpr size_t kDefaultMaxTreeDepth = 128;

  /**
   * Immutable hash tree. Nodes share children through shared_ptr<const HashTree>,
   * so copies are shallow and a tree may be read from several threads at once.
   */
  class HashTree {
    public:
      using Node = std::variant<EmptyNode, ForkNode, LabeledNode, LeafNode, PrunedNode>;

      HashTree() = default;
      explicit HashTree(Node node) : node_(std::move(node)) {}

      static HashTree empty() { return HashTree(); }
      static HashTree fork(HashTree left, HashTree right);
      static HashTree labeled(Label label, HashTree subtree);
      static HashTree labeled(std::string_view text, HashTree subtree) {
        return labeled(certum::core::label(text), std::move(subtree));
      }
      static HashTree leaf(std::vector<uint8_t> value) { return HashTree(LeafNode{std::move(value)}); }
      static HashTree leaf(std::string_view text) {
        return leaf(std::vector<uint8_t>(text.begin(), text.end()));
      }
      static HashTree pruned(const Hash256& digest) { return HashTree(PrunedNode{digest}); }

      const Node& node() const { return node_; }
      bool is_empty() const { return std::holds_alternative<EmptyNode>(node_); }
      bool is_pruned() const { return std::holds_alternative<PrunedNode>(node_); }

      // Root hash. Pruned nodes contribute their stored digest verbatim.
      Hash256 digest() const;

      LookupResult lookup_path(const Path& path, size_t max_depth = kDefaultMaxTreeDepth) const;

      /**
       * Empty when the path is proven absent, a Pruned node when a pruned subtree hides it,
       * so nested lookups stay Unknown. On Error returns the subtree where traversal stopped;
       * callers that must tell the outcomes apart use lookup_subtree_result.
       */
      HashTree lookup_subtree(const Path& path, size_t max_depth = kDefaultMaxTreeDepth) const;

      SubtreeLookup lookup_subtree_result(const Path& path, size_t max_depth = kDefaultMaxTreeDepth) const;

      // Replaces this whole tree by its digest.
      HashTree prune() const { return pruned(digest()); }

      /**
       * Keeps only what is needed to answer lookups of `paths` and prunes the rest.
       * Labels adjacent to a missing label are kept so its absence stays provable.
       * The result always has the same digest as this tree.
       */
      HashTree witness(const std::vector<Path>& paths) const;

      // All label paths that end in a leaf, in tree order.
      std::vector<Path> list_paths() const;

      // Every fork level strictly ascending, no leaf mixed into a labeled level, depth within cap.
      bool is_well_formed(size_t max_depth = kDefaultMaxTreeDepth) const;

    private:
      Node node_{};
  };

  struct SubtreeLookup {
    LookupStatus status = LookupStatus::Absent;
    HashTree tree;
  };
}
