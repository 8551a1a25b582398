#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace millsync::util {

enum class FailureKind {
  kNetwork,
  kValidation,
  kAuth,
  kServer,
  kSyncConflict,
  kNotFound,
  kStorage,
};

std::string_view FailureKindName(FailureKind kind);

/*
  Value-typed error returned across the Mill Service and RemoteApi
  boundaries. status_code is the HTTP status when one is known, 0 otherwise.
*/
struct Failure {
  FailureKind kind = FailureKind::kServer;
  std::string message;
  int         status_code = 0;

  static Failure Network(std::string msg) {
    return {FailureKind::kNetwork, std::move(msg), 0};
  }

  static Failure Validation(std::string msg, int status_code = 0) {
    return {FailureKind::kValidation, std::move(msg), status_code};
  }

  static Failure Auth(std::string msg, int status_code = 401) {
    return {FailureKind::kAuth, std::move(msg), status_code};
  }

  static Failure Server(std::string msg, int status_code = 0) {
    return {FailureKind::kServer, std::move(msg), status_code};
  }
};

// Maps the util exception family onto Failure kinds.
Failure ToFailure(const std::exception& e);

/*
  Either a value or a Failure.
*/
template <typename T>
class Outcome {
 public:
  static Outcome Ok(T value) {
    return Outcome(std::in_place_index<0>, std::move(value));
  }

  static Outcome Fail(Failure failure) {
    return Outcome(std::in_place_index<1>, std::move(failure));
  }

  explicit operator bool() const {
    return state_.index() == 0;
  }

  const T& value() const {
    if (!*this) {
      throw std::logic_error("Outcome has no value: " + failure().message);
    }
    return std::get<0>(state_);
  }

  T& value() {
    if (!*this) {
      throw std::logic_error("Outcome has no value: " + std::get<1>(state_).message);
    }
    return std::get<0>(state_);
  }

  const Failure& failure() const {
    if (*this) {
      throw std::logic_error("Outcome holds a value");
    }
    return std::get<1>(state_);
  }

 private:
  template <std::size_t I, typename V>
  Outcome(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {
  }

  std::variant<T, Failure> state_;
};

} // namespace millsync::util
