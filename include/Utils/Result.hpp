#pragma once
#include <stdexcept>
#include <string>
#include <variant>

template <typename T, typename E = std::string>
class Result {
  std::variant<T, E> storage;

public:
  Result(T&& value)
      : storage(std::move(value)) {}
  Result(E&& error)
      : storage(std::move(error)) {}

  [[nodiscard]] bool isOk() const noexcept {
    return std::holds_alternative<T>(storage);
  }
  [[nodiscard]] bool isErr() const noexcept { return std::holds_alternative<E>(storage); }

  [[nodiscard]] const T& value() const {
    if (isErr()) throw std::runtime_error("Called value on error Result");
    return std::get<T>(storage);
  }
  [[nodiscard]] const E& error() const {
    if (isOk()) throw std::runtime_error("Called error on ok Result");
    return std::get<E>(storage);
  }

  T expect(const std::string& msg) {
    if (isErr()) throw std::runtime_error(msg + ": " + describe(std::get<E>(storage)));
    return std::move(std::get<T>(storage));
  }

  T unwrap() { return expect("Called unwrap on error Result"); }
  E unwrapErr() {
    if (isOk()) throw std::runtime_error("Called unwrapErr on ok Result");
    return std::move(std::get<E>(storage));
  }

  T unwrapOr(T&& defaultValue) { return isOk() ? std::move(std::get<T>(storage)) : std::move(defaultValue); }

private:
  static std::string describe(const std::string& error) { return error; }
  template <typename Err>
  static std::string describe(const Err& error) { return error.message; }
};
