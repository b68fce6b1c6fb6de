#include "sor_reader/schema_json.hpp"
#include <sstream>

namespace sor {

static void esc(std::ostringstream& o, const std::string& s){
  static const char* hex = "0123456789abcdef";
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

std::string SchemaJsonWriter::to_json(const SchemaJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"file\":"; esc(o, p.file); o << ",";
  o << "\"start_byte\":" << p.start_byte << ",";
  o << "\"length_bytes\":";
  if (p.length_bytes) o << *p.length_bytes; else o << "null";
  o << ",";
  o << "\"sampled_rows\":" << p.sampled_rows << ",";

  o << "\"columns\":[";
  for (size_t i=0;i<p.schema.size();++i){
    if (i) o << ",";
    o << "{\"index\":" << i << ",\"type\":"; esc(o, std::string(display(p.schema[i])));
    o << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

}
