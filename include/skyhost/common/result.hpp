#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace skyhost::common {

enum class ErrorKind {
  Config,
  Orchestration,
  Network,
  Io,
};

[[nodiscard]] inline const char *error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Config:
    return "config";
  case ErrorKind::Orchestration:
    return "orchestration";
  case ErrorKind::Network:
    return "network";
  case ErrorKind::Io:
    return "io";
  }
  return "unknown";
}

struct Error {
  ErrorKind kind = ErrorKind::Io;
  std::string message;

  [[nodiscard]] std::string to_string() const {
    return std::string(error_kind_name(kind)) + " error: " + message;
  }
};

class Status {
public:
  static Status success() { return Status(std::nullopt); }
  static Status error(std::string message) {
    return Status(Error{.kind = ErrorKind::Io, .message = std::move(message)});
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(Error{.kind = kind, .message = std::move(message)});
  }
  static Status error(Error err) { return Status(std::move(err)); }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }
  [[nodiscard]] const std::string &error() const {
    static const std::string empty;
    return error_.has_value() ? error_->message : empty;
  }
  [[nodiscard]] ErrorKind kind() const {
    return error_.has_value() ? error_->kind : ErrorKind::Io;
  }
  [[nodiscard]] const std::optional<Error> &details() const { return error_; }

private:
  explicit Status(std::optional<Error> error) : error_(std::move(error)) {}

  std::optional<Error> error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), std::nullopt); }
  static Result failure(std::string message) {
    return Result(std::nullopt, Error{.kind = ErrorKind::Io, .message = std::move(message)});
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(std::nullopt, Error{.kind = kind, .message = std::move(message)});
  }
  static Result failure(Error err) { return Result(std::nullopt, std::move(err)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error());
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error());
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const {
    static const std::string empty;
    return error_.has_value() ? error_->message : empty;
  }
  [[nodiscard]] ErrorKind kind() const {
    return error_.has_value() ? error_->kind : ErrorKind::Io;
  }
  [[nodiscard]] Error error_details() const { return error_.value_or(Error{}); }

private:
  Result(std::optional<T> value, std::optional<Error> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::optional<Error> error_;
};

} // namespace skyhost::common
