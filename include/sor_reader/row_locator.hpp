#pragma once
#include "sor_reader/error.hpp"
#include "sor_reader/type_rank.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace sor {

class LineSource;

// Byte range the locator may read. The schema sample ignores it.
struct AccessWindow {
  std::uint64_t start_byte = 0;
  std::optional<std::uint64_t> length_bytes;  // nullopt -> read to EOF
};

// Finds the n-th row inside an AccessWindow and reconciles one of its
// fields against a fixed schema.
//
// Window rules, counted in bytes consumed since start_byte:
//   - a nonzero start_byte discards the (partial) line it lands in;
//   - row 0 counts only while consumed <  length_bytes;
//   - later rows count only while consumed <= length_bytes.
//
// With the sequential cache on, the last row reached is remembered and a
// query at or past it resumes from there instead of from start_byte.
class RowLocator {
public:
  RowLocator(LineSource& src, const ColumnSchema& schema, AccessWindow win,
             bool sequential_cache = true);

  // Raw text of row `row_offset` (terminator stripped).
  bool locate(std::size_t row_offset, std::string& line, SorError* err = nullptr);

  // Field `column` of row `row_offset`; "" when missing or when the value is
  // looser than the column's inferred type.
  std::optional<std::string> value_at(std::size_t column, std::size_t row_offset,
                                      SorError* err = nullptr);

  const AccessWindow& window() const noexcept { return win_; }
  void reset_cache() noexcept { cursor_ = Cursor{}; }

private:
  struct Cursor {
    bool valid = false;
    std::size_t row = 0;
    std::uint64_t offset = 0;    // file offset where `row` starts
    std::uint64_t consumed = 0;  // window bytes consumed before `row`
  };

  bool fail(SorError e, SorError* err) const;
  bool exceeds(std::uint64_t consumed, bool first_row) const noexcept;

  LineSource& src_;
  const ColumnSchema& schema_;
  AccessWindow win_;
  bool use_cache_;
  Cursor cursor_;
  std::string scratch_;
};

}
