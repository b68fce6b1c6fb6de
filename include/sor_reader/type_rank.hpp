#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace sor {

// Field classification, ordered from most to least specific.
// A column's type is the loosest rank seen for it.
enum class TypeRank : std::uint8_t {
  Bool    = 0,
  Integer = 1,
  Float   = 2,
  String  = 3,
};

// One rank per column position, as inferred from the sample.
using ColumnSchema = std::vector<TypeRank>;

constexpr TypeRank promote(TypeRank a, TypeRank b) noexcept { return (a < b) ? b : a; }

// "BOOL", "INTEGER", "FLOAT", "STRING".
std::string_view display(TypeRank r) noexcept;

// Inverse of display(); case-sensitive.
std::optional<TypeRank> parse_type_rank(std::string_view name) noexcept;

}
