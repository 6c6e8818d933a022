/**
 * @file expected.h
 * @brief Minimal std::expected-like result type for C++17
 *
 * Provides Expected<T, E> and Expected<void, E> with the subset of the C++23
 * std::expected interface used across stashd:
 *   - has_value / operator bool / value / operator* / operator->
 *   - error / value_or
 *   - transform / and_then / or_else / transform_error
 *
 * Errors are created with MakeUnexpected(MakeError(...)):
 * @code
 * Expected<Header, Error> ReadHeader(std::istream& in) {
 *   if (!in) {
 *     return MakeUnexpected(MakeError(ErrorCode::kIoError, "stream not readable"));
 *   }
 *   return header;
 * }
 * @endcode
 */

#pragma once

#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace stashd::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(E error) : error_(std::move(error)) {}

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

 private:
  E error_;
};

/**
 * @brief Create an Unexpected from an error value
 */
template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by value() when an Expected holds an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  const char* what() const noexcept override { return "bad expected access"; }
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

  // NOLINTNEXTLINE(google-explicit-constructor) - Implicit like std::expected
  Expected(const T& value) : storage_(std::in_place_index<0>, value) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

  template <typename U, typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                                    !std::is_same_v<std::decay_t<U>, T> &&
                                                    !std::is_same_v<std::decay_t<U>, Expected> &&
                                                    !std::is_same_v<std::decay_t<U>, Unexpected<E>>>>
  // NOLINTNEXTLINE(google-explicit-constructor,bugprone-forwarding-reference-overload)
  Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<E>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<E>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::get<0>(storage_);
  }

  const T& value() const& {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::get<0>(storage_);
  }

  T&& value() && {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
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
  T value_or(U&& default_value) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value, keep the error
   */
  template <typename F>
  auto transform(F&& func) const& {
    using U = std::invoke_result_t<F, const T&>;
    if constexpr (std::is_void_v<U>) {
      if (!has_value()) {
        return Expected<void, E>(MakeUnexpected(error()));
      }
      std::forward<F>(func)(**this);
      return Expected<void, E>();
    } else {
      if (!has_value()) {
        return Expected<U, E>(MakeUnexpected(error()));
      }
      return Expected<U, E>(std::forward<F>(func)(**this));
    }
  }

  /**
   * @brief Chain an operation that itself returns Expected
   */
  template <typename F>
  auto and_then(F&& func) const& {
    using R = std::invoke_result_t<F, const T&>;
    static_assert(detail::IsExpected<R>::value, "and_then callback must return Expected");
    if (!has_value()) {
      return R(MakeUnexpected(error()));
    }
    return std::forward<F>(func)(**this);
  }

  /**
   * @brief Recover from an error
   */
  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::forward<F>(func)(error());
  }

  /**
   * @brief Map the error, keep the value
   */
  template <typename F>
  auto transform_error(F&& func) const& {
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
 * @brief Specialization for operations that produce no value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<E>& unexpected) : error_(unexpected.error()) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<E>&& unexpected) : error_(std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  E& error() & { return *error_; }
  const E& error() const& { return *error_; }
  E&& error() && { return std::move(*error_); }

  template <typename F>
  auto transform(F&& func) const& {
    using U = std::invoke_result_t<F>;
    if constexpr (std::is_void_v<U>) {
      if (!has_value()) {
        return Expected<void, E>(MakeUnexpected(error()));
      }
      std::forward<F>(func)();
      return Expected<void, E>();
    } else {
      if (!has_value()) {
        return Expected<U, E>(MakeUnexpected(error()));
      }
      return Expected<U, E>(std::forward<F>(func)());
    }
  }

  template <typename F>
  auto and_then(F&& func) const& {
    using R = std::invoke_result_t<F>;
    static_assert(detail::IsExpected<R>::value, "and_then callback must return Expected");
    if (!has_value()) {
      return R(MakeUnexpected(error()));
    }
    return std::forward<F>(func)();
  }

  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::forward<F>(func)(error());
  }

  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<void, G>();
    }
    return Expected<void, G>(MakeUnexpected(std::forward<F>(func)(error())));
  }

 private:
  std::optional<E> error_;
};

}  // namespace stashd::utils
