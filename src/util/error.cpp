#include "sor_reader/error.hpp"

namespace sor {

const char* to_string(SorError e) noexcept {
  switch (e) {
    case SorError::None:             return "ok";
    case SorError::UnknownColumn:    return "unknown column";
    case SorError::OffsetOutOfRange: return "offset out of range";
    case SorError::Io:               return "i/o error";
  }
  return "unknown error";
}

}
