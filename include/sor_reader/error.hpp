#pragma once

namespace sor {

// Query failure kinds. A missing value is not an error: it comes back as "".
enum class SorError {
  None,
  UnknownColumn,     // column index at or beyond the schema length
  OffsetOutOfRange,  // row not reached inside the access window
  Io,                // file could not be opened or read
};

const char* to_string(SorError e) noexcept;

}
