#pragma once
#include "sor_reader/type_rank.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sor {

// One classified field. `rank` is already promoted against the column's
// current schema rank, so the same result serves inference and checking.
struct Field {
  TypeRank rank = TypeRank::Bool;
  std::string value;     // strings keep or gain quotes; numbers lose trailing blanks
  bool missing = true;   // empty, unclassifiable; value is "" then
};

using Row = std::vector<Field>;

// Letters, digits, whitespace and the punctuation allowed inside a field.
// Excludes '"', which is only legal as a string wrapper.
bool is_field_char(char c) noexcept;

// Bodies of every <...> pair in `line`, in source order, markers stripped,
// interior kept verbatim. A '<' whose run of field characters (or '"') is
// not closed by '>' is skipped and scanning resumes at the next character.
std::vector<std::string_view> extract_fields(std::string_view line);

// Classification cascade; the first matching rule wins:
//   empty -> missing, [01] -> BOOL, [+-]?digits -> INTEGER,
//   [+-]?[0-9.][0-9.+-]* -> FLOAT, quoted/unquoted -> STRING, else missing.
// Trailing whitespace is tolerated by the three numeric rules.
Field classify_field(std::string_view body, TypeRank current = TypeRank::Bool);

// Tokenize `line` against `schema`; columns past its end promote against BOOL.
Row tokenize_row(std::string_view line, const ColumnSchema& schema);

}
