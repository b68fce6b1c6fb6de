#include "sor_reader/row_locator.hpp"
#include "sor_reader/line_source.hpp"
#include "sor_reader/row_tokenizer.hpp"

namespace sor {

RowLocator::RowLocator(LineSource& src, const ColumnSchema& schema, AccessWindow win,
                       bool sequential_cache)
  : src_(src), schema_(schema), win_(win), use_cache_(sequential_cache) {}

bool RowLocator::fail(SorError e, SorError* err) const {
  if (err) *err = e;
  return false;
}

// Row 0 needs consumed < length; every later row tolerates consumed == length.
bool RowLocator::exceeds(std::uint64_t consumed, bool first_row) const noexcept {
  if (!win_.length_bytes) return false;
  return first_row ? consumed >= *win_.length_bytes : consumed > *win_.length_bytes;
}

bool RowLocator::locate(std::size_t row_offset, std::string& line, SorError* err) {
  std::size_t row = 0;
  std::uint64_t row_start = 0;
  std::uint64_t consumed = 0;
  std::size_t n = 0;

  if (use_cache_ && cursor_.valid && cursor_.row <= row_offset) {
    if (!src_.seek(cursor_.offset)) return fail(SorError::Io, err);
    row = cursor_.row;
    row_start = cursor_.offset;
    n = src_.read_line(line);
    if (src_.last_error() != 0) return fail(SorError::Io, err);
    if (n == 0) {
      // file shrank under us; fall back to a cold scan
      cursor_ = Cursor{};
      return locate(row_offset, line, err);
    }
    consumed = cursor_.consumed + n;
  } else {
    if (!src_.seek(win_.start_byte)) return fail(SorError::Io, err);
    if (win_.start_byte != 0) consumed += src_.read_line(scratch_);
    row_start = src_.tell();
    n = src_.read_line(line);
    if (src_.last_error() != 0) return fail(SorError::Io, err);
    if (n == 0) return fail(SorError::OffsetOutOfRange, err);
    consumed += n;
    if (exceeds(consumed, true)) return fail(SorError::OffsetOutOfRange, err);
  }

  while (row < row_offset) {
    row_start = src_.tell();
    n = src_.read_line(line);
    if (src_.last_error() != 0) return fail(SorError::Io, err);
    if (n == 0) return fail(SorError::OffsetOutOfRange, err);
    consumed += n;
    if (exceeds(consumed, false)) return fail(SorError::OffsetOutOfRange, err);
    ++row;
  }

  if (use_cache_) cursor_ = Cursor{true, row, row_start, consumed - n};
  if (err) *err = SorError::None;
  return true;
}

std::optional<std::string> RowLocator::value_at(std::size_t column, std::size_t row_offset,
                                                SorError* err) {
  std::string line;
  if (!locate(row_offset, line, err)) return std::nullopt;

  if (column >= schema_.size()) {
    fail(SorError::UnknownColumn, err);
    return std::nullopt;
  }
  const Row row = tokenize_row(line, schema_);
  if (column >= row.size()) return std::string{};

  const Field& f = row[column];
  if (f.rank > schema_[column]) return std::string{};  // looser than the column type
  return f.value;
}

}
