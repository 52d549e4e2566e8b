#include "certum/core/hash_tree.hpp"
#include <algorithm>
#include <cstddef>
#include <map>
#include <stdexcept>

namespace certum::core {

  namespace {
    template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    struct LevelEntry {
      const HashTree* node;
      size_t depth;
    };

    // One labeled level: forks flattened in order, empties dropped.
    using Level = std::vector<LevelEntry>;

    bool flatten_forks(const HashTree& tree, Level& out, size_t depth, size_t max_depth) {
      if (depth > max_depth) return false;
      if (const auto* fork = std::get_if<ForkNode>(&tree.node())) {
        if (!fork->left || !fork->right) return false;
        return flatten_forks(*fork->left, out, depth + 1, max_depth) &&
               flatten_forks(*fork->right, out, depth + 1, max_depth);
      }
      if (!tree.is_empty()) out.push_back({&tree, depth});
      return true;
    }

    bool level_is_ordered(const Level& level) {
      const Label* previous = nullptr;
      for (const auto& entry : level) {
        if (std::holds_alternative<LeafNode>(entry.node->node())) {
          if (level.size() > 1) return false;
          continue;
        }
        if (const auto* labeled = std::get_if<LabeledNode>(&entry.node->node())) {
          if (!labeled->subtree) return false;
          if (previous && !(*previous < labeled->label)) return false;
          previous = &labeled->label;
        }
      }
      return true;
    }

    struct LabelSearch {
      LookupStatus status = LookupStatus::Absent;
      // Indices of the closest labeled entries at or around the target.
      ptrdiff_t lower = -1;
      ptrdiff_t upper = 0;
    };

    // Expects an ordered level.
    LabelSearch find_label(const Level& level, const Label& target) {
      LabelSearch search;
      search.upper = static_cast<ptrdiff_t>(level.size());
      for (size_t i = 0; i < level.size(); ++i) {
        const auto* labeled = std::get_if<LabeledNode>(&level[i].node->node());
        if (!labeled) continue;
        const auto index = static_cast<ptrdiff_t>(i);
        if (labeled->label == target) {
          search.status = LookupStatus::Found;
          search.lower = search.upper = index;
          return search;
        }
        if (labeled->label < target) {
          search.lower = index;
        } else {
          search.upper = index;
          break;
        }
      }
      for (ptrdiff_t i = search.lower + 1; i < search.upper; ++i) {
        if (level[static_cast<size_t>(i)].node->is_pruned()) {
          search.status = LookupStatus::Unknown;
          break;
        }
      }
      return search;
    }

    HashTree keep_or_prune(const std::optional<HashTree>& kept, const HashTree& original) {
      if (kept) return *kept;
      if (original.is_empty()) return original;
      return original.prune();
    }

    std::optional<HashTree> rebuild_level(const HashTree& tree,
                                          const std::map<const HashTree*, HashTree>& replacements) {
      if (const auto* fork = std::get_if<ForkNode>(&tree.node())) {
        auto left = rebuild_level(*fork->left, replacements);
        auto right = rebuild_level(*fork->right, replacements);
        if (!left && !right) return std::nullopt;
        return HashTree::fork(keep_or_prune(left, *fork->left), keep_or_prune(right, *fork->right));
      }
      auto it = replacements.find(&tree);
      if (it == replacements.end()) return std::nullopt;
      return it->second;
    }

    std::optional<HashTree> witness_of(const HashTree& tree, const std::vector<Path>& paths) {
      if (paths.empty()) return std::nullopt;
      for (const auto& path : paths) {
        if (path.empty()) return tree;
      }

      Level level;
      if (!flatten_forks(tree, level, 0, kDefaultMaxTreeDepth) || !level_is_ordered(level)) {
        return tree;
      }

      std::map<Label, std::vector<Path>> tails_by_head;
      for (const auto& path : paths) {
        tails_by_head[path.front()].emplace_back(path.begin() + 1, path.end());
      }

      std::map<const HashTree*, HashTree> replacements;
      for (const auto& [head, tails] : tails_by_head) {
        auto search = find_label(level, head);
        if (search.status == LookupStatus::Found) {
          const HashTree* entry = level[static_cast<size_t>(search.lower)].node;
          const auto& labeled = std::get<LabeledNode>(entry->node());
          auto subtree = witness_of(*labeled.subtree, tails);
          replacements.insert_or_assign(entry,
            HashTree::labeled(labeled.label, keep_or_prune(subtree, *labeled.subtree)));
          continue;
        }
        // Neighbours bracket the missing label; anything between them is already pruned.
        const auto first = std::max<ptrdiff_t>(search.lower, 0);
        const auto last = std::min<ptrdiff_t>(search.upper, static_cast<ptrdiff_t>(level.size()) - 1);
        for (ptrdiff_t i = first; i <= last; ++i) {
          const HashTree* entry = level[static_cast<size_t>(i)].node;
          if (const auto* labeled = std::get_if<LabeledNode>(&entry->node())) {
            replacements.emplace(entry, HashTree::labeled(labeled->label, labeled->subtree->prune()));
          } else {
            replacements.emplace(entry, *entry);
          }
        }
      }
      return rebuild_level(tree, replacements);
    }

    void collect_paths(const HashTree& tree, Path& prefix, std::vector<Path>& out) {
      std::visit(overloaded{
        [&](const ForkNode& fork) {
          if (fork.left) collect_paths(*fork.left, prefix, out);
          if (fork.right) collect_paths(*fork.right, prefix, out);
        },
        [&](const LabeledNode& labeled) {
          if (!labeled.subtree) return;
          prefix.push_back(labeled.label);
          collect_paths(*labeled.subtree, prefix, out);
          prefix.pop_back();
        },
        [&](const LeafNode&) { out.push_back(prefix); },
        [](const EmptyNode&) {},
        [](const PrunedNode&) {},
      }, tree.node());
    }

    bool well_formed(const HashTree& tree, size_t depth, size_t max_depth) {
      Level level;
      if (!flatten_forks(tree, level, depth, max_depth) || !level_is_ordered(level)) return false;
      for (const auto& entry : level) {
        const auto* labeled = std::get_if<LabeledNode>(&entry.node->node());
        if (!labeled) continue;
        if (!well_formed(*labeled->subtree, entry.depth + 1, max_depth)) return false;
      }
      return true;
    }
  }

  Label label(std::string_view text) {
    return Label(text.begin(), text.end());
  }

  Path make_path(std::initializer_list<std::string_view> segments) {
    Path path;
    path.reserve(segments.size());
    for (auto segment : segments) path.push_back(label(segment));
    return path;
  }

  std::string path_to_string(const Path& path) {
    if (path.empty()) return "/";
    std::string out;
    for (const auto& segment : path) {
      out.push_back('/');
      bool printable = std::all_of(segment.begin(), segment.end(),
        [](uint8_t c) { return c >= 0x21 && c <= 0x7e && c != '/'; });
      if (printable && !segment.empty()) {
        out.append(segment.begin(), segment.end());
      } else {
        out += "0x" + to_hex(segment);
      }
    }
    return out;
  }

  const char* to_string(LookupStatus status) {
    switch (status) {
      case LookupStatus::Found: return "found";
      case LookupStatus::Absent: return "absent";
      case LookupStatus::Unknown: return "unknown";
      case LookupStatus::Error: return "error";
    }
    return "error";
  }

  HashTree HashTree::fork(HashTree left, HashTree right) {
    return HashTree(ForkNode{
      std::make_shared<const HashTree>(std::move(left)),
      std::make_shared<const HashTree>(std::move(right))});
  }

  HashTree HashTree::labeled(Label label, HashTree subtree) {
    return HashTree(LabeledNode{std::move(label), std::make_shared<const HashTree>(std::move(subtree))});
  }

  Hash256 HashTree::digest() const {
    return std::visit(overloaded{
      [](const EmptyNode&) {
        return DomainHasher("ic-hashtree-empty").finish();
      },
      [](const ForkNode& fork) {
        if (!fork.left || !fork.right) throw std::logic_error("HashTree: fork with null child");
        auto left = fork.left->digest();
        auto right = fork.right->digest();
        DomainHasher hasher("ic-hashtree-fork");
        return hasher.update(left).update(right).finish();
      },
      [](const LabeledNode& labeled) {
        if (!labeled.subtree) throw std::logic_error("HashTree: labeled node with null subtree");
        auto subtree = labeled.subtree->digest();
        DomainHasher hasher("ic-hashtree-labeled");
        return hasher.update(labeled.label).update(subtree).finish();
      },
      [](const LeafNode& leaf) {
        DomainHasher hasher("ic-hashtree-leaf");
        return hasher.update(leaf.value).finish();
      },
      [](const PrunedNode& pruned) {
        return pruned.digest;
      },
    }, node_);
  }

  SubtreeLookup HashTree::lookup_subtree_result(const Path& path, size_t max_depth) const {
    const HashTree* current = this;
    size_t depth = 0;
    for (const auto& segment : path) {
      Level level;
      if (!flatten_forks(*current, level, depth, max_depth) || !level_is_ordered(level)) {
        return {LookupStatus::Error, *current};
      }
      auto search = find_label(level, segment);
      switch (search.status) {
        case LookupStatus::Found:
          break;
        case LookupStatus::Unknown:
          // Nested lookups on the result stay Unknown.
          return {LookupStatus::Unknown, current->prune()};
        case LookupStatus::Absent:
          return {LookupStatus::Absent, HashTree::empty()};
        case LookupStatus::Error:
          return {LookupStatus::Error, *current};
      }

      const auto& entry = level[static_cast<size_t>(search.lower)];
      current = std::get<LabeledNode>(entry.node->node()).subtree.get();
      depth = entry.depth + 1;
    }
    return {LookupStatus::Found, *current};
  }

  HashTree HashTree::lookup_subtree(const Path& path, size_t max_depth) const {
    return lookup_subtree_result(path, max_depth).tree;
  }

  LookupResult HashTree::lookup_path(const Path& path, size_t max_depth) const {
    auto subtree = lookup_subtree_result(path, max_depth);
    if (subtree.status != LookupStatus::Found) return {subtree.status, {}};

    return std::visit(overloaded{
      [](const LeafNode& leaf) { return LookupResult{LookupStatus::Found, leaf.value}; },
      [](const EmptyNode&) { return LookupResult{LookupStatus::Absent, {}}; },
      [](const PrunedNode&) { return LookupResult{LookupStatus::Unknown, {}}; },
      // A value was expected here, not more structure.
      [](const ForkNode&) { return LookupResult{LookupStatus::Error, {}}; },
      [](const LabeledNode&) { return LookupResult{LookupStatus::Error, {}}; },
    }, subtree.tree.node());
  }

  HashTree HashTree::witness(const std::vector<Path>& paths) const {
    return keep_or_prune(witness_of(*this, paths), *this);
  }

  std::vector<Path> HashTree::list_paths() const {
    std::vector<Path> out;
    Path prefix;
    collect_paths(*this, prefix, out);
    return out;
  }

  bool HashTree::is_well_formed(size_t max_depth) const {
    return well_formed(*this, 0, max_depth);
  }
}
