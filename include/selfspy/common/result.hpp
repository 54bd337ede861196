#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace selfspy::common {

enum class ErrorKind {
  None,
  InvalidArgument,
  Capture,
  Encryption,
  BufferOverflow,
  Flush,
  StoreUnavailable,
  Store,
  Timeout,
  Config,
  Io,
};

[[nodiscard]] const char *error_kind_name(ErrorKind kind);

// A failure is never reported with ErrorKind::None.
constexpr ErrorKind failure_kind(ErrorKind kind) {
  return kind == ErrorKind::None ? ErrorKind::InvalidArgument : kind;
}

class Status {
public:
  static Status success() { return Status(ErrorKind::None, ""); }
  static Status error(std::string message) {
    return Status(ErrorKind::InvalidArgument, std::move(message));
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(failure_kind(kind), std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorKind::None, std::move(value), ""); }
  static Result failure(std::string message) {
    return Result(ErrorKind::InvalidArgument, std::nullopt, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(failure_kind(kind), std::nullopt, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Result(ErrorKind kind, std::optional<T> value, std::string error)
      : kind_(kind), value_(std::move(value)), error_(std::move(error)) {}

  ErrorKind kind_;
  std::optional<T> value_;
  std::string error_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(ErrorKind::None, ""); }
  static Result failure(std::string message) {
    return Result(ErrorKind::InvalidArgument, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(failure_kind(kind), std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Result(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

} // namespace selfspy::common
