#pragma once
#include "sor_reader/error.hpp"
#include "sor_reader/row_locator.hpp"
#include "sor_reader/schema_inferencer.hpp"
#include "sor_reader/type_rank.hpp"
#include "sor_reader/value_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace sor {

// Opens a SoR file, infers its column schema once from the leading sample
// and answers per-field queries inside a byte window.
//
// Queries seek the shared file handle, so one Interpreter must not be used
// from several threads at once without external serialization.
class Interpreter {
public:
  struct Config {
    std::string path;
    std::uint64_t start_byte = 0;
    std::optional<std::uint64_t> length_bytes;   // nullopt -> to EOF
    std::size_t sample_rows = kDefaultSampleRows;
    bool strip_cr = true;                        // trim trailing '\r' (CRLF)
    bool sequential_cache = true;                // resume ascending scans
    ValuePolicy value_policy{};
  };

  explicit Interpreter(Config cfg);
  ~Interpreter();

  Interpreter(Interpreter&& other) noexcept;
  Interpreter& operator=(Interpreter&& other) noexcept;
  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

  // False when the file could not be opened or sampled, and after a move.
  // A moved-from Interpreter answers queries with SorError::Io; its
  // reference accessors (path, window, schema) must not be called.
  bool ok() const noexcept;
  SorError last_error() const noexcept;
  int last_errno() const noexcept;

  const std::string& path() const noexcept;
  const AccessWindow& window() const noexcept;
  const ColumnSchema& schema() const noexcept;
  std::size_t column_count() const noexcept;
  std::size_t rows_sampled() const noexcept;

  std::optional<TypeRank> column_type(std::size_t column, SorError* err = nullptr) const;

  // "" for a missing value; nullopt with `err` set on failure.
  std::optional<std::string> get_value(std::size_t column, std::size_t row,
                                       SorError* err = nullptr);

  std::optional<bool> is_missing(std::size_t column, std::size_t row,
                                 SorError* err = nullptr);

  // get_value() converted per the column type and Config::value_policy.
  std::optional<TypedValue> get_typed(std::size_t column, std::size_t row,
                                      SorError* err = nullptr);

private:
  struct Impl; Impl* p_;
};

}
