#ifndef RESULT_HPP_
#define RESULT_HPP_

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace zvukdl::utils {

enum class ErrorCode {
  Success = 0,
  InvalidArgument,
  UnrecognizedLink,
  NetworkError,
  FetchFailed,
  InvalidData,
  NotFound,
  WriteError,
  DatabaseError,
  Unauthorized,
  NotEntitled,
  TaggingError,
  PartialFailure,
  InternalError
};

constexpr const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
      return "Success";
    case ErrorCode::InvalidArgument:
      return "Invalid argument";
    case ErrorCode::UnrecognizedLink:
      return "Unrecognized link";
    case ErrorCode::NetworkError:
      return "Network error";
    case ErrorCode::FetchFailed:
      return "Fetch failed";
    case ErrorCode::InvalidData:
      return "Invalid data";
    case ErrorCode::NotFound:
      return "Not found";
    case ErrorCode::WriteError:
      return "Write error";
    case ErrorCode::DatabaseError:
      return "Database error";
    case ErrorCode::Unauthorized:
      return "Unauthorized";
    case ErrorCode::NotEntitled:
      return "Subscription inactive";
    case ErrorCode::TaggingError:
      return "Tagging error";
    case ErrorCode::PartialFailure:
      return "Some items failed";
    case ErrorCode::InternalError:
      return "Internal error";
  }
  return "Unknown error";
}

struct Error {
  ErrorCode code;
  std::string message;

  Error() : code(ErrorCode::Success) {}
  Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
  explicit Error(ErrorCode c) : code(c), message(ErrorCodeToString(c)) {}

  bool operator==(ErrorCode c) const { return code == c; }
  bool operator!=(ErrorCode c) const { return code != c; }
};

/**
 * @brief 值或错误，用于可跳过的单项失败（不抛异常）
 */
template <typename T>
class Result {
 public:
  Result(T&& value) : data_(std::move(value)) {}
  Result(const T& value) : data_(value) {}
  Result(Error error) : data_(std::move(error)) {}

  bool has_value() const noexcept { return std::holds_alternative<T>(data_); }
  explicit operator bool() const noexcept { return has_value(); }

  const T& value() const& {
    if (!has_value()) {
      throw std::runtime_error("Result contains error: " + error().message);
    }
    return std::get<T>(data_);
  }

  T&& value() && {
    if (!has_value()) {
      throw std::runtime_error("Result contains error: " +
                               std::get<Error>(data_).message);
    }
    return std::get<T>(std::move(data_));
  }

  const Error& error() const {
    if (has_value()) {
      throw std::runtime_error("Result contains value");
    }
    return std::get<Error>(data_);
  }

 private:
  std::variant<T, Error> data_;
};

template <>
class Result<void> {
 public:
  Result() = default;
  Result(Error error) : error_(std::move(error)) {}

  bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
  explicit operator bool() const noexcept { return has_value(); }

  const Error& error() const {
    if (has_value()) {
      throw std::runtime_error("Result contains value");
    }
    return error_;
  }

 private:
  Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

}  // namespace zvukdl::utils

#endif  // RESULT_HPP_
