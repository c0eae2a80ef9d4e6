/**
 * @file expected.h
 * @brief Minimal C++17 Expected<T, E> (value-or-error) modeled on std::expected
 *
 * Used instead of exceptions for recoverable errors. Supports the monadic
 * helpers transform / and_then / or_else / transform_error.
 */

#pragma once

#include <cassert>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace sqlbackup::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(const E& error) : error_(error) {}
  explicit Unexpected(E&& error) : error_(std::move(error)) {}

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by value() when the Expected holds an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  const char* what() const noexcept override { return "bad Expected access"; }

  const E& error() const { return error_; }

 private:
  E error_;
};

template <typename T, typename E>
class Expected;

namespace detail {
template <typename T>
struct IsExpected : std::false_type {};

template <typename T, typename E>
struct IsExpected<Expected<T, E>> : std::true_type {};

template <typename T>
struct IsUnexpected : std::false_type {};

template <typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};
}  // namespace detail

/**
 * @brief Holds either a value of type T or an error of type E
 */
template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  template <typename U = T,
            typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                        !detail::IsExpected<std::decay_t<U>>::value &&
                                        !detail::IsUnexpected<std::decay_t<U>>::value &&
                                        !std::is_same_v<std::decay_t<U>, std::in_place_t>>>
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Expected(const Unexpected<G>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Expected(Unexpected<G>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::get<0>(storage_);
  }

  const T& value() const& {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::get<0>(storage_);
  }

  T&& value() && {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::move(std::get<0>(storage_));
  }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::move(std::get<0>(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  E& error() & { return std::get<1>(storage_); }
  const E& error() const& { return std::get<1>(storage_); }
  E&& error() && { return std::move(std::get<1>(storage_)); }

  template <typename U>
  T value_or(U&& fallback) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
  }

  template <typename U>
  T value_or(U&& fallback) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(fallback));
  }

  /**
   * @brief Map the value, keep the error
   */
  template <typename F>
  auto transform(F&& func) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
    using U = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return Expected<U, E>(MakeUnexpected(error()));
    }
    if constexpr (std::is_void_v<U>) {
      std::forward<F>(func)(**this);
      return Expected<void, E>();
    } else {
      return Expected<U, E>(std::forward<F>(func)(**this));
    }
  }

  /**
   * @brief Chain another Expected-returning operation on the value
   */
  template <typename F>
  auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
    using Result = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return Result(MakeUnexpected(error()));
    }
    return std::forward<F>(func)(**this);
  }

  /**
   * @brief Recover from the error with an Expected-returning operation
   */
  template <typename F>
  auto or_else(F&& func) const& -> std::invoke_result_t<F, const E&> {
    using Result = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Result(**this);
    }
    return std::forward<F>(func)(error());
  }

  /**
   * @brief Map the error, keep the value
   */
  template <typename F>
  auto transform_error(F&& func) const& -> Expected<T, std::invoke_result_t<F, const E&>> {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<T, G>(**this);
    }
    return Expected<T, G>(MakeUnexpected(std::forward<F>(func)(error())));
  }

 private:
  std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations that return nothing on success
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Expected(const Unexpected<G>& unexpected) : error_(unexpected.error()) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Expected(Unexpected<G>&& unexpected) : error_(std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (error_.has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  E& error() & {
    assert(error_.has_value() && "error() called on Expected containing a value");
    return *error_;
  }

  const E& error() const& {
    assert(error_.has_value() && "error() called on Expected containing a value");
    return *error_;
  }

  E&& error() && {
    assert(error_.has_value() && "error() called on Expected containing a value");
    return std::move(*error_);
  }

  template <typename F>
  auto and_then(F&& func) const& -> std::invoke_result_t<F> {
    using Result = std::invoke_result_t<F>;
    if (!has_value()) {
      return Result(MakeUnexpected(error()));
    }
    return std::forward<F>(func)();
  }

  template <typename F>
  auto transform_error(F&& func) const& -> Expected<void, std::invoke_result_t<F, const E&>> {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<void, G>();
    }
    return Expected<void, G>(MakeUnexpected(std::forward<F>(func)(error())));
  }

 private:
  std::optional<E> error_;
};

}  // namespace sqlbackup::utils
