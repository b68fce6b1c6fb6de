#include "sor_reader/value_policy.hpp"

#include <charconv>
#include <string_view>
#include <system_error>
#include <fast_float/fast_float.h>

namespace sor {

static std::string_view trim_number(std::string_view s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' ||
                        s.back() == '\n' || s.back() == '\v' || s.back() == '\f')) {
    s.remove_suffix(1);
  }
  // from_chars rejects an explicit '+'
  if (s.size() > 1 && s[0] == '+') s.remove_prefix(1);
  return s;
}

std::optional<bool> ValuePolicy::parse_bool(std::string_view s) const {
  s = trim_number(s);
  if (s == "1") return true;
  if (s == "0") return false;
  return std::nullopt;
}

std::optional<std::int64_t> ValuePolicy::parse_integer(std::string_view s) const {
  s = trim_number(s);
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
  if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
  return out;
}

std::optional<double> ValuePolicy::parse_float(std::string_view s) const {
  s = trim_number(s);
  double out = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
  return out;
}

std::string ValuePolicy::unquote(std::string_view s) {
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') s = s.substr(1, s.size() - 2);
  return std::string(s);
}

TypedValue ValuePolicy::to_typed(TypeRank column_rank, std::string_view value) const {
  if (value.empty()) return std::monostate{};

  switch (column_rank) {
    case TypeRank::Bool:
      if (auto b = parse_bool(value)) return *b;
      break;
    case TypeRank::Integer:
      if (auto i = parse_integer(value)) return *i;
      break;
    case TypeRank::Float:
      if (auto d = parse_float(value)) return *d;
      break;
    case TypeRank::String:
      return unquote(value);
  }
  if (on_error == OnError::Lenient) return std::string(value);
  return std::monostate{};
}

}
