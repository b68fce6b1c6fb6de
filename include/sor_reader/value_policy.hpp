#pragma once
#include "sor_reader/type_rank.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sor {

// monostate marks a missing (or unconvertible, under OnError::Null) value.
using TypedValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

struct ValuePolicy {
  // Behavior when a reconciled value does not convert to its column type:
  // null -> monostate; lenient -> keep the raw text as a string
  enum class OnError { Null, Lenient };

  OnError on_error = OnError::Null;

  // "0"/"1", trailing whitespace ignored.
  std::optional<bool> parse_bool(std::string_view s) const;

  // Optional sign and decimal digits (std::from_chars); fails on overflow.
  std::optional<std::int64_t> parse_integer(std::string_view s) const;

  // Numeric parse (fast_float in .cpp).
  std::optional<double> parse_float(std::string_view s) const;

  // Drop one pair of wrapping double quotes, if present.
  static std::string unquote(std::string_view s);

  // Convert `value` as returned by a query, according to the column's
  // inferred rank. "" -> monostate.
  TypedValue to_typed(TypeRank column_rank, std::string_view value) const;
};

}
