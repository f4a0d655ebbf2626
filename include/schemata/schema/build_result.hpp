#pragma once

#include <schemata/schema/build_error_code.hpp>

#include <optional>
#include <string>
#include <utility>

// Outcome of one build step. Either carries a value (code == ok) or a code
// with a short `log` and a descriptive `info`; never both.
namespace schemata::schema {

template <typename T>
struct build_result final {
  build_error_code code{build_error_code::ok};
  std::string log;
  std::string info;
  std::optional<T> value;

  bool ok() const { return code == build_error_code::ok && value.has_value(); }
  explicit operator bool() const { return ok(); }
};

template <typename T>
build_result<T> make_build_success(T value) {
  auto result = build_result<T>{};
  result.value = std::move(value);
  return result;
}

template <typename T>
build_result<T> make_build_failure(const build_error_code code,
                                   std::string info) {
  auto result = build_result<T>{};
  result.code = code;
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  return result;
}

// Forwards the error of an upstream step into a result of another type.
template <typename T, typename U>
build_result<T> forward_failure(const build_result<U>& failed) {
  auto result = build_result<T>{};
  result.code = failed.code;
  result.log = failed.log;
  result.info = failed.info;
  return result;
}

}  // namespace schemata::schema
