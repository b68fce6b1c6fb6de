#include "sor_reader/line_source.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;
static void check(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static fs::path write_tmp(const char* name, const std::string& body) {
  fs::path p = fs::temp_directory_path() / name;
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << body;
  return p;
}

static void read_all(sor::LineSource& src, const std::string& tag) {
  std::string line;
  check(src.read_line(line) == 2 && line == "a", tag + ": line 1");
  check(src.read_line(line) == 4 && line == "bb", tag + ": CRLF stripped");
  check(src.read_line(line) == 3 && line == "ccc", tag + ": last line without newline");
  check(src.read_line(line) == 0 && line.empty(), tag + ": EOF");
  check(src.tell() == 9, tag + ": tell at EOF");
  check(src.bytes_read() == 9, tag + ": bytes_read");
  check(src.last_error() == 0, tag + ": no error");
}

int main(){
  const fs::path f = write_tmp("sor_test_line_source.sor", "a\nbb\r\nccc");

  {
    sor::LineSource src(f.string());
    check(src.is_open(), "opened");
    read_all(src, "default chunk");

    std::string line;
    check(src.seek(2), "seek");
    check(src.bytes_read() == 0, "seek resets bytes_read");
    check(src.read_line(line) == 4 && line == "bb", "read after seek");
    check(src.seek(3) && src.read_line(line) == 3 && line == "b", "seek mid-line yields the tail");
    check(src.seek(100) && src.read_line(line) == 0, "seek past EOF reads nothing");
    check(src.last_error() == 0, "seek past EOF is not an error");
    check(src.seek(std::uint64_t{1} << 63), "seek beyond the range of long");
    check(src.read_line(line) == 0 && src.last_error() == 0, "far seek reads nothing, no error");
    check(src.seek(0) && src.read_line(line) == 2 && line == "a", "usable after a far seek");
  }

  {
    sor::LineSource::Config cfg;
    cfg.chunk_bytes = 2; // lines straddle refills
    sor::LineSource src(f.string(), cfg);
    read_all(src, "tiny chunk");
  }

  {
    sor::LineSource::Config cfg;
    cfg.strip_cr = false;
    sor::LineSource src(f.string(), cfg);
    std::string line;
    (void)src.read_line(line);
    check(src.read_line(line) == 4 && line == "bb\r", "strip_cr=false keeps CR");
  }

  {
    sor::LineSource a(f.string());
    sor::LineSource b(std::move(a));
    std::string line;
    check(b.is_open() && !a.is_open(), "move transfers the handle");
    check(b.read_line(line) == 2 && line == "a", "moved-to source reads");
  }

  {
    sor::LineSource src((fs::temp_directory_path() / "sor_test_does_not_exist.sor").string());
    std::string line;
    check(!src.is_open(), "missing file not open");
    check(src.last_error() != 0, "missing file sets errno");
    check(!src.seek(0), "seek on missing file fails");
    check(src.read_line(line) == 0, "read on missing file returns 0");
  }

  fs::remove(f);
  if (failures) return 1;
  std::cout << "[PASS] line_source\n";
  return 0;
}
