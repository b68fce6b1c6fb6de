#include "sor_reader/schema_inferencer.hpp"
#include "sor_reader/line_source.hpp"
#include "sor_reader/row_tokenizer.hpp"

#include <string>

namespace sor {

void SchemaInferencer::observe(std::string_view line, ColumnSchema& schema) {
  const Row row = tokenize_row(line, schema);
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i < schema.size()) schema[i] = row[i].rank;  // already promoted
    else                   schema.push_back(row[i].rank);
  }
}

bool SchemaInferencer::infer(LineSource& src, SchemaSample& out) const {
  out.schema.clear();
  out.rows_sampled = 0;
  if (!src.seek(0)) return false;

  std::string line;
  while (out.rows_sampled < sample_rows_) {
    if (src.read_line(line) == 0) break;
    observe(line, out.schema);
    ++out.rows_sampled;
  }
  return src.last_error() == 0;
}

}
