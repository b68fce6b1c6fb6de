#include "sor_reader/interpreter.hpp"
#include "sor_reader/type_rank.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Each <name>.sor fixture has a <name>.schema sibling listing the expected
// column types, whitespace separated.
static bool load_expected(const fs::path& p, std::vector<std::string>& out) {
  std::ifstream in(p);
  if (!in) return false;
  std::string tok;
  while (in >> tok) out.push_back(tok);
  return true;
}

static std::string join(const std::vector<std::string>& v) {
  std::ostringstream o;
  for (size_t i = 0; i < v.size(); ++i) { if (i) o << ' '; o << v[i]; }
  return o.str();
}

int main(int argc, char** argv){
  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  size_t total=0, passed=0, failed=0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    if (p.extension() != ".sor") continue;

    fs::path schema_file = p;
    schema_file.replace_extension(".schema");
    std::vector<std::string> expect;
    if (!load_expected(schema_file, expect)) {
      std::cout << "[SKIP] " << p.filename().string() << "  (no .schema)\n";
      continue;
    }

    sor::Interpreter::Config cfg;
    cfg.path = p.string();
    sor::Interpreter in(cfg);

    std::vector<std::string> got;
    for (auto r : in.schema()) got.emplace_back(sor::display(r));

    // every column answers for row 0 without error when the file has rows
    bool rows_ok = true;
    if (in.rows_sampled() > 0) {
      for (size_t c = 0; c < in.column_count(); ++c) {
        sor::SorError err = sor::SorError::None;
        if (!in.get_value(c, 0, &err)) rows_ok = false;
      }
    }

    const bool verdict = in.ok() && got == expect && rows_ok;
    ++total; verdict ? ++passed : ++failed;

    if (verdict) {
      std::cout << "[PASS] " << p.filename().string()
                << "  rows=" << in.rows_sampled()
                << "  schema=[" << join(got) << "]\n";
    } else {
      std::cout << "[FAIL] " << p.filename().string()
                << "  expected=[" << join(expect) << "]"
                << "  actual=[" << join(got) << "]"
                << "  ok=" << (in.ok()?"true":"false")
                << "  rows_ok=" << (rows_ok?"true":"false") << "\n";
    }
  }

  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  return (failed == 0 && total > 0) ? 0 : 1;
}
