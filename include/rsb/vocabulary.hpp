/**
 * @file vocabulary.hpp
 * @brief Result and optional vocabulary types shared by all rsb modules.
 *
 * expected<V, E> carries either a value or an error and never throws;
 * callers check has_value() before value() / get_error().
 */

#ifndef RSB_VOCABULARY_HPP_
#define RSB_VOCABULARY_HPP_

#include "rsb/platform.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>

namespace rsb {

// ============================================================================
// Common error enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
using optional = std::optional<T>;

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result.
 *
 * Construct through the success() / error() factories. Storage is a
 * variant addressed by index so V and E may be the same type.
 */
template <typename V, typename E>
class expected {
 public:
  static expected success(const V& v) {
    return expected(std::in_place_index<0>, v);
  }
  static expected success(V&& v) {
    return expected(std::in_place_index<0>, std::move(v));
  }
  static expected error(const E& e) {
    return expected(std::in_place_index<1>, e);
  }
  static expected error(E&& e) {
    return expected(std::in_place_index<1>, std::move(e));
  }

  bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  V& value() & {
    RSB_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  const V& value() const& {
    RSB_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  V&& value() && {
    RSB_ASSERT(has_value());
    return std::get<0>(std::move(storage_));
  }

  const E& get_error() const {
    RSB_ASSERT(!has_value());
    return std::get<1>(storage_);
  }

  template <typename U>
  V value_or(U&& fallback) const {
    return has_value() ? std::get<0>(storage_)
                       : static_cast<V>(std::forward<U>(fallback));
  }

 private:
  template <std::size_t I, typename Arg>
  expected(std::in_place_index_t<I> tag, Arg&& arg)
      : storage_(tag, std::forward<Arg>(arg)) {}

  std::variant<V, E> storage_;
};

/// @brief Specialization for operations that produce no value.
template <typename E>
class expected<void, E> {
 public:
  static expected success() { return expected(); }
  static expected error(const E& e) {
    expected r;
    r.error_.emplace(e);
    return r;
  }
  static expected error(E&& e) {
    expected r;
    r.error_.emplace(std::move(e));
    return r;
  }

  bool has_value() const noexcept { return !error_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  const E& get_error() const {
    RSB_ASSERT(!has_value());
    return *error_;
  }

 private:
  expected() = default;

  std::optional<E> error_;
};

}  // namespace rsb

#endif  // RSB_VOCABULARY_HPP_
