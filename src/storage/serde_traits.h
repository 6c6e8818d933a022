/**
 * @file serde_traits.h
 * @brief Type classification shared by the archives
 */

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "storage/format_error.h"

namespace stashd::storage::traits {

template <typename T>
struct IsVector : std::false_type {};
template <typename T, typename A>
struct IsVector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct IsMap : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct IsMap<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct IsMap<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T>
struct IsOptional : std::false_type {};
template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T>
struct IsPair : std::false_type {};
template <typename A, typename B>
struct IsPair<std::pair<A, B>> : std::true_type {};

template <typename T>
struct IsArray : std::false_type {};
template <typename T, std::size_t N>
struct IsArray<std::array<T, N>> : std::true_type {};

template <typename T>
inline constexpr bool kIsByteVector = std::is_same_v<T, std::vector<uint8_t>>;

/**
 * @brief Integers (bool excluded, it has its own encoding)
 */
template <typename T>
inline constexpr bool kIsInteger = std::is_integral_v<T> && !std::is_same_v<T, bool>;

/**
 * @brief Enums that declare their variant count, found by ADL:
 *
 * @code
 * enum class Kind : uint32_t { kText, kImage };
 * constexpr uint32_t EnumVariantCount(Kind) { return 2; }
 * @endcode
 */
template <typename T, typename = void>
struct HasVariantCount : std::false_type {};
template <typename T>
struct HasVariantCount<T, std::void_t<decltype(EnumVariantCount(std::declval<T>()))>> : std::true_type {};

/**
 * @brief Decoded variant index to enum
 *
 * Throws when T declares a variant count and @p raw is outside it. Enums
 * without EnumVariantCount accept any index.
 */
template <typename T, typename U>
T ToEnum(U raw) {
  if constexpr (HasVariantCount<T>::value) {
    bool negative = false;
    if constexpr (std::is_signed_v<U>) {
      negative = raw < 0;
    }
    if (negative || static_cast<uint64_t>(raw) >= static_cast<uint64_t>(EnumVariantCount(T{}))) {
      throw FormatError("invalid value for enum: " + std::to_string(raw));
    }
  }
  return static_cast<T>(raw);
}

/**
 * @brief Convert one legacy element into the current element type
 *
 * Arithmetic types are cast. Everything else goes through a converting
 * constructor, the same way a legacy struct converts into its successor.
 */
template <typename To, typename From>
To ConvertElement(From&& from) {
  if constexpr (std::is_arithmetic_v<To> && std::is_arithmetic_v<std::decay_t<From>>) {
    return static_cast<To>(from);
  } else {
    return To(std::forward<From>(from));
  }
}

}  // namespace stashd::storage::traits
