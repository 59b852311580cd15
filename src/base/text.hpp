#pragma once

#include <string>
#include <string_view>

namespace wayfinder {

// Lowercases `name` and drops everything except ASCII letters and spaces.
inline std::string Canonicalize(std::string_view name) {
  std::string result;
  result.reserve(name.size());
  for (char c : name) {
    if (c >= 'A' && c <= 'Z') {
      result.push_back(static_cast<char>(c - 'A' + 'a'));
    } else if ((c >= 'a' && c <= 'z') || c == ' ') {
      result.push_back(c);
    }
  }
  return result;
}

inline bool HasLetters(std::string_view canonical) {
  return canonical.find_first_not_of(' ') != std::string_view::npos;
}

} // namespace wayfinder
