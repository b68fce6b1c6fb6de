#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <simdjson.h>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream o; o << in.rdbuf();
  return o.str();
}

// Runs the binary with `args`, stdout captured to `out`. Returns the raw system() status.
static int run(const std::string& bin, const std::string& args, const fs::path& out) {
  std::string cmd = "\"" + bin + "\" " + args + " >\"" + out.string() + "\" 2>>\"" +
                    (fs::temp_directory_path() / "sor_it_cli.log").string() + "\"";
  return std::system(cmd.c_str());
}

int main() {
  std::string bin = env_or("SOR_QUERY_BIN", "build/sor-query");
  const fs::path in = "tests/data/basic.sor";
  if (!fs::exists(in)) { std::cerr << "[ERR] fixture not found: " << in << "\n"; return 2; }
  if (!fs::exists(bin)) { std::cerr << "[ERR] binary not found: " << bin << "\n"; return 2; }

  const fs::path out = fs::temp_directory_path() / "sor_it_cli.out";
  bool ok = true;

  // --- schema as JSON
  int rc = run(bin, "--file=" + in.string() + " --schema-json", out);
  if (rc != 0) { std::cerr << "[FAIL] --schema-json returned " << rc << "\n"; return 1; }

  simdjson::dom::parser parser;
  simdjson::dom::element doc;
  if (auto error = parser.load(out.string()).get(doc)) {
    std::cerr << "[FAIL] schema json does not parse: " << simdjson::error_message(error) << "\n";
    return 1;
  }

  std::uint64_t sampled = 0;
  if (doc["sampled_rows"].get_uint64().get(sampled) || sampled != 3) {
    std::cerr << "[FAIL] sampled_rows=" << sampled << "\n"; ok = false;
  }
  if (!doc["length_bytes"].is_null()) {
    std::cerr << "[FAIL] length_bytes should be null when unbounded\n"; ok = false;
  }
  std::string_view file;
  if (doc["file"].get_string().get(file) || file.find("basic.sor") == std::string_view::npos) {
    std::cerr << "[FAIL] file=" << file << "\n"; ok = false;
  }

  const std::vector<std::string_view> expect = {"BOOL", "STRING", "FLOAT", "STRING"};
  simdjson::dom::array cols;
  if (doc["columns"].get_array().get(cols) || cols.size() != expect.size()) {
    std::cerr << "[FAIL] columns array missing or wrong size\n"; ok = false;
  } else {
    size_t i = 0;
    for (simdjson::dom::element c : cols) {
      std::string_view t;
      std::uint64_t idx = 0;
      if (c["type"].get_string().get(t) || c["index"].get_uint64().get(idx) ||
          t != expect[i] || idx != i) {
        std::cerr << "[FAIL] column " << i << " type=" << t << "\n"; ok = false;
      }
      ++i;
    }
  }

  // --- single queries
  rc = run(bin, "--file=" + in.string() + " --value=1,0", out);
  if (rc != 0 || slurp(out) != "\"hello\"\n") {
    std::cerr << "[FAIL] --value=1,0 -> '" << slurp(out) << "' rc=" << rc << "\n"; ok = false;
  }
  rc = run(bin, "--file=" + in.string() + " --type=2", out);
  if (rc != 0 || slurp(out) != "FLOAT\n") {
    std::cerr << "[FAIL] --type=2 -> '" << slurp(out) << "'\n"; ok = false;
  }
  rc = run(bin, "--file=" + in.string() + " --missing=3,1", out);
  if (rc != 0 || slurp(out) != "true\n") {
    std::cerr << "[FAIL] --missing=3,1 -> '" << slurp(out) << "'\n"; ok = false;
  }

  // --- failures exit non-zero
  rc = run(bin, "--file=" + in.string() + " --type=4", out);
  if (rc == 0) { std::cerr << "[FAIL] unknown column exited 0\n"; ok = false; }
  rc = run(bin, "--file=" + in.string() + " --len=5 --value=0,0", out);
  if (rc == 0) { std::cerr << "[FAIL] out-of-range offset exited 0\n"; ok = false; }
  rc = run(bin, "--file=" + in.string() + " --value=oops", out);
  if (rc == 0) { std::cerr << "[FAIL] bad usage exited 0\n"; ok = false; }
  for (const char* bad : {"\"--from= -1\"", "--from=+5", "--len=-1", "\"--len= 7\""}) {
    rc = run(bin, "--file=" + in.string() + " " + bad + " --value=0,0", out);
    if (rc == 0) { std::cerr << "[FAIL] " << bad << " accepted\n"; ok = false; }
  }

  fs::remove(out);
  if (!ok) return 1;
  std::cout << "[PASS] end-to-end sor-query: columns=" << expect.size() << "\n";
  return 0;
}
