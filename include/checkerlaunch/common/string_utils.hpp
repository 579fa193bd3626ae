#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace checkerlaunch::common {

// Replace every occurrence of `from` in `s` with `to`.
inline auto ReplaceAll(
    std::string s, std::string_view from, std::string_view to) -> std::string {
  if (from.empty()) {
    return s;
  }
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
  return s;
}

// Strip leading and trailing whitespace.
inline auto Trim(std::string_view s) -> std::string_view {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

inline auto Join(const std::vector<std::string>& parts, std::string_view sep)
    -> std::string {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      result += sep;
    }
    result += parts[i];
  }
  return result;
}

// Decode %XX escapes. '+' is kept literally: it is a legal path character
// and appears in artifact versions such as "9+181-r4173-1".
inline auto UrlDecode(std::string_view s) -> std::string {
  auto hex_value = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };

  std::string result;
  result.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hex_value(s[i + 1]);
      int lo = hex_value(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        result += static_cast<char>((hi << 4) | lo);
        i += 2;
        continue;
      }
    }
    result += s[i];
  }
  return result;
}

// Quote a token for POSIX shells; tokens made of safe characters are left
// untouched so the logged command stays readable.
inline auto ShellQuote(std::string_view token) -> std::string {
  if (token.empty()) {
    return "''";
  }
  bool safe = true;
  for (char c : token) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && std::string_view("@%+=:,./_-").find(c) ==
                                     std::string_view::npos) {
      safe = false;
      break;
    }
  }
  if (safe) {
    return std::string(token);
  }
  std::string result = "'";
  for (char c : token) {
    if (c == '\'') {
      result += "'\\''";
    } else {
      result += c;
    }
  }
  result += "'";
  return result;
}

// Quote a token for a javac argument file when it contains whitespace.
inline auto QuoteArgFileToken(std::string_view token) -> std::string {
  if (token.find_first_of(" \t") == std::string_view::npos) {
    return std::string(token);
  }
  std::string result = "\"";
  for (char c : token) {
    if (c == '"' || c == '\\') {
      result += '\\';
    }
    result += c;
  }
  result += "\"";
  return result;
}

}  // namespace checkerlaunch::common
