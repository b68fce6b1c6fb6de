#include "sor_reader/interpreter.hpp"
#include "sor_reader/schema_json.hpp"
#include "sor_reader/type_rank.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

enum class Mode { None, Type, Value, Missing, SchemaJson };

struct Cli {
  std::string file;
  std::uint64_t from = 0;
  std::optional<std::uint64_t> len;
  std::size_t sample = sor::kDefaultSampleRows;
  Mode mode = Mode::None;
  std::size_t column = 0;
  std::size_t row = 0;
  bool verbose = false;
};

[[noreturn]] void usage(int rc) {
  (rc == 0 ? std::cout : std::cerr) <<
    "Usage: sor-query --file=PATH [--from=N] [--len=N] [--sample=N] [--verbose]\n"
    "                 (--type=COL | --value=COL,ROW | --missing=COL,ROW | --schema-json)\n";
  std::exit(rc);
}

std::uint64_t to_u64(const std::string& flag, const std::string& s) {
  try {
    // stoull would skip blanks and take a sign
    if (s.empty() || s[0] < '0' || s[0] > '9') throw std::invalid_argument(s);
    std::size_t used = 0;
    const unsigned long long v = std::stoull(s, &used);
    if (used != s.size()) throw std::invalid_argument(s);
    return v;
  } catch (const std::exception&) {
    std::cerr << "[sor] bad number for " << flag << ": '" << s << "'\n";
    usage(2);
  }
}

void eat_pair(const std::string& flag, const std::string& s, Cli& c) {
  auto comma = s.find(',');
  if (comma == std::string::npos) {
    std::cerr << "[sor] " << flag << " expects COL,ROW\n";
    usage(2);
  }
  c.column = static_cast<std::size_t>(to_u64(flag, s.substr(0, comma)));
  c.row    = static_cast<std::size_t>(to_u64(flag, s.substr(comma + 1)));
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (eat("--file=", &c.file)) continue;
    if (eat("--from=", &v))   { c.from = to_u64("--from", v); continue; }
    if (eat("--len=", &v))    { c.len = to_u64("--len", v); continue; }
    if (eat("--sample=", &v)) { c.sample = static_cast<std::size_t>(to_u64("--sample", v)); continue; }
    if (eat("--type=", &v)) {
      c.mode = Mode::Type;
      c.column = static_cast<std::size_t>(to_u64("--type", v));
      continue;
    }
    if (eat("--value=", &v))   { c.mode = Mode::Value;   eat_pair("--value", v, c); continue; }
    if (eat("--missing=", &v)) { c.mode = Mode::Missing; eat_pair("--missing", v, c); continue; }
    if (a == "--schema-json") { c.mode = Mode::SchemaJson; continue; }
    if (a == "--verbose" || a == "-v") { c.verbose = true; continue; }
    if (a == "-h" || a == "--help") usage(0);
    std::cerr << "[sor] unknown argument: " << a << "\n";
    usage(2);
  }
  if (c.file.empty() || c.mode == Mode::None) usage(2);
  return c;
}

int fail(sor::SorError e) {
  std::cerr << "[sor] " << sor::to_string(e) << "\n";
  return 1;
}

}

int main(int argc, char** argv) {
  const Cli cli = parse_cli(argc, argv);

  sor::Interpreter::Config cfg;
  cfg.path = cli.file;
  cfg.start_byte = cli.from;
  cfg.length_bytes = cli.len;
  cfg.sample_rows = cli.sample;

  sor::Interpreter in(cfg);
  if (!in.ok()) {
    std::cerr << "[sor] cannot read " << cli.file << " (errno " << in.last_errno() << ")\n";
    return 2;
  }
  if (cli.verbose) {
    std::cerr << "[sor] schema: " << in.column_count() << " columns from "
              << in.rows_sampled() << " sampled rows\n";
  }

  sor::SorError err = sor::SorError::None;
  switch (cli.mode) {
    case Mode::Type: {
      auto t = in.column_type(cli.column, &err);
      if (!t) return fail(err);
      std::cout << sor::display(*t) << "\n";
      return 0;
    }
    case Mode::Value: {
      auto v = in.get_value(cli.column, cli.row, &err);
      if (!v) return fail(err);
      std::cout << *v << "\n";
      return 0;
    }
    case Mode::Missing: {
      auto m = in.is_missing(cli.column, cli.row, &err);
      if (!m) return fail(err);
      std::cout << (*m ? "true" : "false") << "\n";
      return 0;
    }
    case Mode::SchemaJson: {
      sor::SchemaJsonPayload p;
      p.file = in.path();
      p.start_byte = in.window().start_byte;
      p.length_bytes = in.window().length_bytes;
      p.sampled_rows = in.rows_sampled();
      p.schema = in.schema();
      std::cout << sor::SchemaJsonWriter::to_json(p) << "\n";
      return 0;
    }
    case Mode::None:
      break;
  }
  usage(2);
}
