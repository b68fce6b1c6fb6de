#include "sor_reader/line_source.hpp"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace sor {

struct LineSource::Impl {
  std::string path;
  Config cfg;
  std::FILE* f{nullptr};
  int last_errno{0};

  std::vector<char> buf;
  std::size_t head{0};        // next unread byte in buf
  std::size_t len{0};         // valid bytes in buf
  std::uint64_t offset{0};    // file offset of buf[head]
  std::uint64_t bytes{0};     // consumed since last seek

  Impl(std::string p, Config c) : path(std::move(p)), cfg(c) {
    if (cfg.chunk_bytes == 0) cfg.chunk_bytes = 1;
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return; }
    buf.resize(cfg.chunk_bytes);
  }

  ~Impl() { if (f) std::fclose(f); }

  bool refill() {
    len = std::fread(buf.data(), 1, buf.size(), f);
    head = 0;
    if (len == 0 && std::ferror(f)) { last_errno = errno ? errno : EIO; return false; }
    return len != 0;
  }

  bool seek(std::uint64_t off) {
    if (!f) return false;
    // fseek takes a long; anything beyond it is past any real EOF
    const int rc = (off > static_cast<std::uint64_t>(LONG_MAX))
                     ? std::fseek(f, 0, SEEK_END)
                     : std::fseek(f, static_cast<long>(off), SEEK_SET);
    if (rc != 0) { last_errno = errno; return false; }
    std::clearerr(f);
    last_errno = 0;
    head = len = 0;
    offset = off;
    bytes = 0;
    return true;
  }

  std::size_t read_line(std::string& out) {
    out.clear();
    if (!f) return 0;
    std::size_t consumed = 0;
    while (true) {
      if (head == len && !refill()) break;
      const char* s = buf.data() + head;
      const std::size_t avail = len - head;
      const void* nl = std::memchr(s, '\n', avail);
      const std::size_t take = nl ? static_cast<std::size_t>(static_cast<const char*>(nl) - s) + 1 : avail;
      out.append(s, nl ? take - 1 : take);
      head += take;
      consumed += take;
      if (nl) break;
    }
    if (cfg.strip_cr && !out.empty() && out.back() == '\r') out.pop_back();
    offset += consumed;
    bytes += consumed;
    return consumed;
  }
};

LineSource::LineSource(std::string path)
  : LineSource(std::move(path), Config{}) {}

LineSource::LineSource(std::string path, Config cfg)
  : p_(new Impl(std::move(path), cfg)) {}

LineSource::~LineSource() { delete p_; }

LineSource::LineSource(LineSource&& other) noexcept : p_(other.p_) { other.p_ = nullptr; }

LineSource& LineSource::operator=(LineSource&& other) noexcept {
  if (this != &other) {
    delete p_;
    p_ = other.p_;
    other.p_ = nullptr;
  }
  return *this;
}

bool LineSource::is_open() const noexcept { return p_ && p_->f; }
bool LineSource::seek(std::uint64_t offset) { return p_->seek(offset); }
std::size_t LineSource::read_line(std::string& out) { return p_->read_line(out); }
std::uint64_t LineSource::tell() const noexcept { return p_->offset; }
int  LineSource::last_error() const noexcept { return p_->last_errno; }
std::uint64_t LineSource::bytes_read() const noexcept { return p_->bytes; }
const std::string& LineSource::path() const noexcept { return p_->path; }

}
