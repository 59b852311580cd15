#include "search/trie.hpp"

#include "base/text.hpp"

namespace wayfinder {
namespace search {

Trie::Trie() : root_(std::make_unique<Node>()) {}

Trie::~Trie() = default;

Trie::Trie(Trie&&) noexcept = default;

Trie& Trie::operator=(Trie&&) noexcept = default;

bool Trie::Insert(std::string_view display_name) {
  const std::string key = Canonicalize(display_name);
  if (!HasLetters(key)) {
    return false;
  }

  Node* node = root_.get();
  for (char c : key) {
    if (c == ' ') {
      continue;
    }
    auto& child = node->children[c - 'a'];
    if (!child) {
      child = std::make_unique<Node>();
    }
    node = child.get();
  }

  // the terminal flag is the presence of a display name
  if (!node->display_name) {
    ++size_;
  }
  node->display_name = std::string(display_name);
  return true;
}

absl::flat_hash_set<std::string> Trie::PrefixSearch(std::string_view prefix) const {
  absl::flat_hash_set<std::string> matches;

  const Node* node = root_.get();
  for (char c : Canonicalize(prefix)) {
    if (c == ' ') {
      continue;
    }
    node = node->children[c - 'a'].get();
    if (!node) {
      return matches;
    }
  }

  Collect(*node, matches);
  return matches;
}

// static
void Trie::Collect(const Node& node, absl::flat_hash_set<std::string>& matches) {
  if (node.display_name) {
    matches.insert(*node.display_name);
  }
  for (const auto& child : node.children) {
    if (child) {
      Collect(*child, matches);
    }
  }
}

}  // namespace search
}  // namespace wayfinder
