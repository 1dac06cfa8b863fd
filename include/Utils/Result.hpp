#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

template <typename T, typename E = std::string>
class Result {
  std::variant<T, E> storage;

  explicit Result(std::in_place_index_t<1>, E&& error)
      : storage(std::in_place_index<1>, std::move(error)) {}

public:
  Result(T value)
      : storage(std::in_place_index<0>, std::move(value)) {}

  // Errors are built explicitly so that Result<std::string> stays unambiguous.
  static Result fail(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool isOk() const noexcept { return storage.index() == 0; }
  [[nodiscard]] bool isErr() const noexcept { return storage.index() == 1; }

  T expect(const std::string& msg) {
    if (isErr()) throw std::runtime_error(msg + ": " + std::get<1>(storage));
    return std::move(std::get<0>(storage));
  }

  T unwrap() { return expect("Called unwrap on error Result"); }
  E unwrapErr() const {
    if (isOk()) throw std::runtime_error("Called unwrapErr on ok Result");
    return std::get<1>(storage);
  }

  T unwrapOr(T&& defaultValue) { return isOk() ? std::move(std::get<0>(storage)) : std::move(defaultValue); }
};

template <typename E>
class Result<void, E> {
  std::optional<E> error;

public:
  Result() = default;

  static Result ok() { return Result(); }
  static Result fail(E err) {
    Result r;
    r.error = std::move(err);
    return r;
  }

  [[nodiscard]] bool isOk() const noexcept { return !error.has_value(); }
  [[nodiscard]] bool isErr() const noexcept { return error.has_value(); }

  void expect(const std::string& msg) const {
    if (isErr()) throw std::runtime_error(msg + ": " + *error);
  }

  E unwrapErr() const {
    if (isOk()) throw std::runtime_error("Called unwrapErr on ok Result");
    return *error;
  }
};
