#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace sor {

// Seekable line reader over a file handle held for the object's lifetime.
// Not thread-safe: the read position is shared by every caller.
class LineSource {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024;  // read-ahead buffer
    bool        strip_cr    = true;       // trim trailing '\r' (CRLF)
  };

  explicit LineSource(std::string path);     // uses default Config{}
  LineSource(std::string path, Config cfg);  // explicit Config
  ~LineSource();

  LineSource(LineSource&& other) noexcept;
  LineSource& operator=(LineSource&& other) noexcept;
  LineSource(const LineSource&) = delete;
  LineSource& operator=(const LineSource&) = delete;

  bool is_open() const noexcept;

  // Position the next read at absolute byte `offset`. Offsets past EOF are
  // accepted; the following read_line() then reports EOF.
  bool seek(std::uint64_t offset);

  // Reads one line into `out` without its terminator. Returns the bytes
  // consumed from the file, terminator included; 0 means EOF or an error
  // (check last_error()).
  std::size_t read_line(std::string& out);

  // Absolute offset of the next unread byte.
  std::uint64_t tell() const noexcept;

  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;  // since the last seek()
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
