#pragma once
#include "sor_reader/type_rank.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace sor {

struct SchemaJsonPayload {
  std::string file;
  std::uint64_t start_byte = 0;
  std::optional<std::uint64_t> length_bytes;  // null when unbounded
  std::size_t sampled_rows = 0;
  ColumnSchema schema;
};

class SchemaJsonWriter {
public:
  // {"file":..,"start_byte":..,"length_bytes":..|null,"sampled_rows":..,
  //  "columns":[{"index":0,"type":"BOOL"},..]}
  static std::string to_json(const SchemaJsonPayload& p);
};

}
