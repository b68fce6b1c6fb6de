#pragma once
#include "sor_reader/type_rank.hpp"

#include <cstddef>
#include <string_view>

namespace sor {

class LineSource;

inline constexpr std::size_t kDefaultSampleRows = 500;

struct SchemaSample {
  ColumnSchema schema;
  std::size_t rows_sampled = 0;
};

class SchemaInferencer {
public:
  explicit SchemaInferencer(std::size_t sample_rows = kDefaultSampleRows)
    : sample_rows_(sample_rows) {}

  // Fold one line into `schema`: new columns are appended, known columns
  // are widened to the loosest rank seen.
  static void observe(std::string_view line, ColumnSchema& schema);

  // Sample up to sample_rows lines from byte 0 of `src`, whatever position
  // it was left at. Returns false on a read error (see src.last_error()).
  bool infer(LineSource& src, SchemaSample& out) const;

  std::size_t sample_rows() const noexcept { return sample_rows_; }

private:
  std::size_t sample_rows_;
};

}
