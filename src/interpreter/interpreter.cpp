#include "sor_reader/interpreter.hpp"
#include "sor_reader/line_source.hpp"

#include <utility>

namespace sor {

struct Interpreter::Impl {
  Config cfg;
  LineSource src;
  SchemaSample sample;
  AccessWindow win;
  RowLocator locator;
  SorError open_error{SorError::None};

  explicit Impl(Config c)
    : cfg(std::move(c)),
      src(cfg.path, LineSource::Config{64 * 1024, cfg.strip_cr}),
      win{cfg.start_byte, cfg.length_bytes},
      locator(src, sample.schema, win, cfg.sequential_cache) {
    if (!src.is_open() || !SchemaInferencer(cfg.sample_rows).infer(src, sample)) {
      open_error = SorError::Io;
    }
  }
};

Interpreter::Interpreter(Config cfg) : p_(new Impl(std::move(cfg))) {}

Interpreter::~Interpreter() { delete p_; }

Interpreter::Interpreter(Interpreter&& other) noexcept : p_(other.p_) { other.p_ = nullptr; }

Interpreter& Interpreter::operator=(Interpreter&& other) noexcept {
  if (this != &other) {
    delete p_;
    p_ = other.p_;
    other.p_ = nullptr;
  }
  return *this;
}

bool Interpreter::ok() const noexcept { return p_ && p_->open_error == SorError::None; }
SorError Interpreter::last_error() const noexcept { return p_ ? p_->open_error : SorError::Io; }
int Interpreter::last_errno() const noexcept { return p_ ? p_->src.last_error() : 0; }

const std::string& Interpreter::path() const noexcept { return p_->cfg.path; }
const AccessWindow& Interpreter::window() const noexcept { return p_->win; }
const ColumnSchema& Interpreter::schema() const noexcept { return p_->sample.schema; }
std::size_t Interpreter::column_count() const noexcept { return p_ ? p_->sample.schema.size() : 0; }
std::size_t Interpreter::rows_sampled() const noexcept { return p_ ? p_->sample.rows_sampled : 0; }

std::optional<TypeRank> Interpreter::column_type(std::size_t column, SorError* err) const {
  if (!ok()) { if (err) *err = SorError::Io; return std::nullopt; }
  if (column >= p_->sample.schema.size()) {
    if (err) *err = SorError::UnknownColumn;
    return std::nullopt;
  }
  if (err) *err = SorError::None;
  return p_->sample.schema[column];
}

std::optional<std::string> Interpreter::get_value(std::size_t column, std::size_t row,
                                                  SorError* err) {
  if (!ok()) { if (err) *err = SorError::Io; return std::nullopt; }
  return p_->locator.value_at(column, row, err);
}

std::optional<bool> Interpreter::is_missing(std::size_t column, std::size_t row, SorError* err) {
  auto v = get_value(column, row, err);
  if (!v) return std::nullopt;
  return v->empty();
}

std::optional<TypedValue> Interpreter::get_typed(std::size_t column, std::size_t row,
                                                 SorError* err) {
  auto v = get_value(column, row, err);
  if (!v) return std::nullopt;
  return p_->cfg.value_policy.to_typed(p_->sample.schema[column], *v);
}

}
