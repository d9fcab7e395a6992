#ifndef REALMLINK_CORE_RESULT_H
#define REALMLINK_CORE_RESULT_H

#include <string>
#include <utility>

#include "realmlink/core/compat.h"

namespace realmlink {

// Error codes shared by every layer. Values are stable so they can be
// surfaced in logs and gateway replies.
namespace errors {
constexpr int kTimeout = 1;
constexpr int kNotConnected = 2;
constexpr int kParseError = 3;
constexpr int kUnexpectedStatus = 4;
constexpr int kTransportError = 5;
constexpr int kInvalidArgument = 6;
constexpr int kIoError = 7;
}  // namespace errors

struct Error {
  int code{0};
  std::string message;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
};

template <typename T>
using Result = variant<T, Error>;

// For cleaner API, we define a VoidResult type
using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<typename std::decay<T>::type> makeSuccess(T&& value) {
  return Result<typename std::decay<T>::type>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool isError(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const Error& getError(const Result<T>& result) {
  return get<Error>(result);
}

template <typename T>
const T& getValue(const Result<T>& result) {
  return get<T>(result);
}

}  // namespace realmlink

#endif  // REALMLINK_CORE_RESULT_H
