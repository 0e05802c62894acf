#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace semcache::common {

enum class ErrorCode {
  Unknown,
  InvalidArgument,
  ConfigError,
  EmbeddingFailure,
  StoreFailure,
  InconsistentIndexState,
  ServiceUnavailable,
  ServiceError,
};

[[nodiscard]] inline std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::Unknown:
    return "unknown";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::ConfigError:
    return "config_error";
  case ErrorCode::EmbeddingFailure:
    return "embedding_failure";
  case ErrorCode::StoreFailure:
    return "store_failure";
  case ErrorCode::InconsistentIndexState:
    return "inconsistent_index_state";
  case ErrorCode::ServiceUnavailable:
    return "service_unavailable";
  case ErrorCode::ServiceError:
    return "service_error";
  }
  return "unknown";
}

class Status {
public:
  static Status success() { return Status(true, ErrorCode::Unknown, ""); }
  static Status error(std::string message) {
    return Status(false, ErrorCode::Unknown, std::move(message));
  }
  static Status error(const ErrorCode code, std::string message) {
    return Status(false, code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, ErrorCode code, std::string error)
      : ok_(ok), code_(code), error_(std::move(error)) {}

  bool ok_;
  ErrorCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), ErrorCode::Unknown, "");
  }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, ErrorCode::Unknown, std::move(message));
  }
  static Result failure(const ErrorCode code, std::string message) {
    return Result(false, std::nullopt, code, std::move(message));
  }
  static Result failure(const Status &status) {
    return Result(false, std::nullopt, status.code(), status.error());
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] Status status() const {
    return ok_ ? Status::success() : Status::error(code_, error_);
  }

private:
  Result(bool ok, std::optional<T> value, ErrorCode code, std::string error)
      : ok_(ok), value_(std::move(value)), code_(code), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  ErrorCode code_;
  std::string error_;
};

} // namespace semcache::common
