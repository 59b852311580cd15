#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <absl/container/flat_hash_set.h>

namespace wayfinder {
namespace search {

// Prefix index over display names keyed by their canonical form. Only letters
// become branches, spaces are skipped.
class Trie {
 public:
  Trie();
  ~Trie();

  Trie(const Trie&) = delete;
  Trie& operator=(const Trie&) = delete;
  Trie(Trie&&) noexcept;
  Trie& operator=(Trie&&) noexcept;

  // returns false if the canonical form of `display_name` has no letters
  bool Insert(std::string_view display_name);

  absl::flat_hash_set<std::string> PrefixSearch(std::string_view prefix) const;

  size_t size() const { return size_; }

 private:
  struct Node {
    std::array<std::unique_ptr<Node>, 26> children;
    std::optional<std::string> display_name;
  };

  static void Collect(const Node& node, absl::flat_hash_set<std::string>& matches);

  std::unique_ptr<Node> root_;
  size_t size_ = 0;
};

}  // namespace search
}  // namespace wayfinder
