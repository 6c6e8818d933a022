/**
 * @file versioned_field.h
 * @brief Versioned-field combinators used inside Serialize(ar, value)
 *
 * A struct lists its fields with ar("name", value.field). A field whose wire
 * shape depends on the schema version is wrapped at that call site:
 *
 * @code
 * template <typename Archive>
 * void Serialize(Archive& ar, State& s) {
 *   ar("field1", s.field1);
 *   ar("field2", migration::RemovedIn<2, 1>(s.field2));
 *   ar("field3", migration::AddedIn<2, 2>(s.field3));
 *   ar("count", migration::WidenedIn<2, 3, int32_t>(s.count));
 * }
 * @endcode
 *
 * The archive hands the wrapper to itself through Save()/Load(); the wrapper
 * consults ar.Context().ActiveVersion() to pick the encode/decode path. Decode
 * failures below the wrapper are re-thrown as MigrationFieldError carrying
 * "Migration error. Tag <tag> Error: <inner>".
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "storage/format_error.h"
#include "storage/serde_traits.h"

namespace stashd::migration {

/**
 * @brief Marker base; archives route fields deriving from it to Save/Load
 */
struct VersionedFieldBase {};

template <typename T>
inline constexpr bool kIsVersionedField = std::is_base_of_v<VersionedFieldBase, std::decay_t<T>>;

namespace detail {

inline std::string FormatMigrationError(uint32_t tag, const std::string& inner) {
  return "Migration error. Tag " + std::to_string(tag) + " Error: " + inner;
}

template <typename Fn>
void WithTag(uint32_t tag, Fn&& decode) {
  try {
    decode();
  } catch (const storage::FormatError& e) {
    throw storage::MigrationFieldError(FormatMigrationError(tag, e.what()));
  }
}

}  // namespace detail

/**
 * @brief Field present from schema version kVersion onwards
 *
 * Decoding at an older version reads nothing and leaves T{}.
 */
template <uint64_t kVersion, uint32_t kTag, typename T>
class AddedInField : public VersionedFieldBase {
 public:
  explicit AddedInField(T& field) : field_(field) {}

  template <typename Archive>
  void Save(Archive& ar, const char* name) const {
    ar.SaveField(name, field_);
  }

  template <typename Archive>
  void Load(Archive& ar, const char* name) {
    if (ar.Context().ActiveVersion() < kVersion) {
      field_ = T{};
      return;
    }
    detail::WithTag(kTag, [&] { ar.LoadField(name, field_); });
  }

 private:
  T& field_;
};

/**
 * @brief Field dropped at schema version kVersion
 *
 * Still written and read below kVersion, so legacy bytes keep decoding.
 */
template <uint64_t kVersion, uint32_t kTag, typename T>
class RemovedInField : public VersionedFieldBase {
 public:
  explicit RemovedInField(T& field) : field_(field) {}

  template <typename Archive>
  void Save(Archive& ar, const char* name) const {
    if (ar.Context().ActiveVersion() >= kVersion) {
      return;
    }
    ar.SaveField(name, field_);
  }

  template <typename Archive>
  void Load(Archive& ar, const char* name) {
    if (ar.Context().ActiveVersion() >= kVersion) {
      field_ = T{};
      return;
    }
    detail::WithTag(kTag, [&] { ar.LoadField(name, field_); });
  }

 private:
  T& field_;
};

/**
 * @brief Field whose type changed at kVersion; older bytes hold an Old
 */
template <uint64_t kVersion, uint32_t kTag, typename Old, typename T, typename Convert>
class ChangedInField : public VersionedFieldBase {
 public:
  ChangedInField(T& field, Convert convert) : field_(field), convert_(std::move(convert)) {}

  template <typename Archive>
  void Save(Archive& ar, const char* name) const {
    ar.SaveField(name, field_);
  }

  template <typename Archive>
  void Load(Archive& ar, const char* name) {
    detail::WithTag(kTag, [&] {
      if (ar.Context().ActiveVersion() < kVersion) {
        Old legacy{};
        ar.LoadField(name, legacy);
        field_ = convert_(std::move(legacy));
      } else {
        ar.LoadField(name, field_);
      }
    });
  }

 private:
  T& field_;
  Convert convert_;
};

/**
 * @brief Field that only adds a diagnostic tag to decode errors
 */
template <uint32_t kTag, typename T>
class TaggedField : public VersionedFieldBase {
 public:
  explicit TaggedField(T& field) : field_(field) {}

  template <typename Archive>
  void Save(Archive& ar, const char* name) const {
    ar.SaveField(name, field_);
  }

  template <typename Archive>
  void Load(Archive& ar, const char* name) {
    detail::WithTag(kTag, [&] { ar.LoadField(name, field_); });
  }

 private:
  T& field_;
};

template <uint64_t kVersion, uint32_t kTag = 0, typename T>
AddedInField<kVersion, kTag, T> AddedIn(T& field) {
  return AddedInField<kVersion, kTag, T>(field);
}

template <uint64_t kVersion, uint32_t kTag = 0, typename T>
RemovedInField<kVersion, kTag, T> RemovedIn(T& field) {
  return RemovedInField<kVersion, kTag, T>(field);
}

template <uint64_t kVersion, uint32_t kTag, typename Old, typename T, typename Convert>
ChangedInField<kVersion, kTag, Old, T, Convert> ChangedIn(T& field, Convert convert) {
  return ChangedInField<kVersion, kTag, Old, T, Convert>(field, std::move(convert));
}

template <uint32_t kTag, typename T>
TaggedField<kTag, T> Tagged(T& field) {
  return TaggedField<kTag, T>(field);
}

namespace detail {

template <typename Old, typename T>
struct Widen {
  using Legacy = Old;
  T operator()(Old old) const { return static_cast<T>(old); }
};

template <typename Old, typename U>
struct Widen<Old, std::optional<U>> {
  using Legacy = std::optional<Old>;
  std::optional<U> operator()(std::optional<Old> old) const {
    if (!old) {
      return std::nullopt;
    }
    return static_cast<U>(*old);
  }
};

template <typename OldElem, typename Elem>
struct ConvertElements {
  std::vector<Elem> operator()(std::vector<OldElem> old) const {
    std::vector<Elem> out;
    out.reserve(old.size());
    for (auto& elem : old) {
      out.push_back(storage::traits::ConvertElement<Elem>(std::move(elem)));
    }
    return out;
  }
};

template <typename OldElem>
struct Stringify {
  std::vector<std::string> operator()(const std::vector<OldElem>& old) const {
    using std::to_string;
    std::vector<std::string> out;
    out.reserve(old.size());
    for (const auto& elem : old) {
      out.push_back(to_string(elem));
    }
    return out;
  }
};

template <typename Fn>
struct Fallible {
  Fn fn;

  template <typename Old>
  auto operator()(Old&& old) const {
    auto converted = fn(std::forward<Old>(old));
    if (!converted) {
      throw storage::FormatError(converted.error().message());
    }
    return std::move(*converted);
  }
};

}  // namespace detail

/**
 * @brief Numeric widening (i32 -> i64, u8 -> u32...), also for optionals
 */
template <uint64_t kVersion, uint32_t kTag, typename Old, typename T>
auto WidenedIn(T& field) {
  using Conv = detail::Widen<Old, T>;
  return ChangedInField<kVersion, kTag, typename Conv::Legacy, T, Conv>(field, Conv{});
}

/**
 * @brief Element-wise conversion of a vector (Vec<Old> -> Vec<New>)
 */
template <uint64_t kVersion, uint32_t kTag, typename OldElem, typename Elem>
auto ElementsChangedIn(std::vector<Elem>& field) {
  using Conv = detail::ConvertElements<OldElem, Elem>;
  return ChangedInField<kVersion, kTag, std::vector<OldElem>, std::vector<Elem>, Conv>(field, Conv{});
}

/**
 * @brief Vector of values that became a vector of their string forms
 */
template <uint64_t kVersion, uint32_t kTag, typename OldElem>
auto StringifiedIn(std::vector<std::string>& field) {
  using Conv = detail::Stringify<OldElem>;
  return ChangedInField<kVersion, kTag, std::vector<OldElem>, std::vector<std::string>, Conv>(field, Conv{});
}

/**
 * @brief Type change whose conversion can fail
 *
 * @p convert takes an Old and returns utils::Expected<T, utils::Error>; a
 * failed conversion is a decode error for the whole value.
 */
template <uint64_t kVersion, uint32_t kTag, typename Old, typename T, typename Fn>
auto TryChangedIn(T& field, Fn convert) {
  using Conv = detail::Fallible<Fn>;
  return ChangedInField<kVersion, kTag, Old, T, Conv>(field, Conv{std::move(convert)});
}

}  // namespace stashd::migration
