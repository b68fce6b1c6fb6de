#include "sor_reader/row_tokenizer.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sor {

static inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

static inline bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

static inline bool is_alpha(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_field_char(char c) noexcept {
  if (is_alpha(c) || is_digit(c) || is_space(c)) return true;
  switch (c) {
    case '.': case ',': case '-': case '+': case '_':
    case '!': case '?': case '\'': case ':': case ';':
    case '/': case '(': case ')': case '&': case '%':
    case '$': case '#': case '@': case '*':
      return true;
    default:
      return false;
  }
}

// Strip trailing whitespace only; leading whitespace defeats the numeric rules.
static std::string_view rtrim(std::string_view s) {
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

static bool is_bool_body(std::string_view s) {
  s = rtrim(s);
  return s.size() == 1 && (s[0] == '0' || s[0] == '1');
}

static bool is_integer_body(std::string_view s) {
  s = rtrim(s);
  if (!s.empty() && (s[0] == '+' || s[0] == '-')) s.remove_prefix(1);
  if (s.empty()) return false;
  for (char c : s) if (!is_digit(c)) return false;
  return true;
}

// Deliberately loose: "1.2.3", "." and "1-2" all pass.
static bool is_float_body(std::string_view s) {
  s = rtrim(s);
  if (!s.empty() && (s[0] == '+' || s[0] == '-')) s.remove_prefix(1);
  if (s.empty() || !(is_digit(s[0]) || s[0] == '.')) return false;
  for (char c : s.substr(1)) {
    if (!(is_digit(c) || c == '.' || c == '+' || c == '-')) return false;
  }
  return true;
}

static bool all_field_chars(std::string_view s) {
  for (char c : s) if (!is_field_char(c)) return false;
  return true;
}

std::vector<std::string_view> extract_fields(std::string_view line) {
  std::vector<std::string_view> out;
  const std::size_t n = line.size();
  std::size_t i = 0;
  while (i < n) {
    if (line[i] != '<') { ++i; continue; }
    std::size_t j = i + 1;
    while (j < n && (is_field_char(line[j]) || line[j] == '"')) ++j;
    if (j < n && line[j] == '>') {
      out.push_back(line.substr(i + 1, j - i - 1));
      i = j + 1;
    } else {
      ++i;
    }
  }
  return out;
}

Field classify_field(std::string_view body, TypeRank current) {
  Field f;
  if (body.empty()) {
    f.rank = promote(current, TypeRank::Bool);
    return f;
  }
  if (is_bool_body(body)) {
    f.rank = promote(current, TypeRank::Bool);
  } else if (is_integer_body(body)) {
    f.rank = promote(current, TypeRank::Integer);
  } else if (is_float_body(body)) {
    f.rank = promote(current, TypeRank::Float);
  } else if (body.size() >= 2 && body.front() == '"' && body.back() == '"' &&
             all_field_chars(body.substr(1, body.size() - 2))) {
    f.rank = promote(current, TypeRank::String);
    f.value.assign(body.data(), body.size());
    f.missing = false;
    return f;
  } else if (all_field_chars(body)) {
    f.rank = promote(current, TypeRank::String);
    f.value.reserve(body.size() + 2);
    f.value.push_back('"');
    f.value.append(body.data(), body.size());
    f.value.push_back('"');
    f.missing = false;
    return f;
  } else {
    // unclassifiable -> missing
    f.rank = promote(current, TypeRank::Bool);
    return f;
  }
  const std::string_view num = rtrim(body);
  f.value.assign(num.data(), num.size());
  f.missing = false;
  return f;
}

Row tokenize_row(std::string_view line, const ColumnSchema& schema) {
  const auto bodies = extract_fields(line);
  Row row;
  row.reserve(bodies.size());
  for (std::size_t i = 0; i < bodies.size(); ++i) {
    const TypeRank current = (i < schema.size()) ? schema[i] : TypeRank::Bool;
    row.push_back(classify_field(bodies[i], current));
  }
  return row;
}

}
