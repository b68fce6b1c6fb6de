#include "sor_reader/type_rank.hpp"

namespace sor {

static constexpr std::string_view kNames[] = {"BOOL", "INTEGER", "FLOAT", "STRING"};

std::string_view display(TypeRank r) noexcept {
  return kNames[static_cast<std::size_t>(r)];
}

std::optional<TypeRank> parse_type_rank(std::string_view name) noexcept {
  for (std::size_t i = 0; i < sizeof(kNames) / sizeof(kNames[0]); ++i) {
    if (kNames[i] == name) return static_cast<TypeRank>(i);
  }
  return std::nullopt;
}

}
