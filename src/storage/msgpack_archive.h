/**
 * @file msgpack_archive.h
 * @brief Self-describing archive built on nlohmann::json's msgpack codec
 *
 * Values are first mapped to a json tree, then written with json::to_msgpack.
 *
 * Mapping:
 *   - struct: map keyed by field name (unknown keys are ignored on decode,
 *     a missing key for a plain field is an error)
 *   - map containers: array of [key, value] arrays, so any key type works
 *   - enum: integer
 *   - optional: nil or value
 *   - std::vector<uint8_t>: bin
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "migration/decode_context.h"
#include "migration/versioned_field.h"
#include "storage/format_error.h"
#include "storage/serde_traits.h"

namespace stashd::storage {

using json = nlohmann::json;

/**
 * @brief Builds a json tree from a value
 */
class MsgPackOutputArchive {
 public:
  explicit MsgPackOutputArchive(const migration::DecodeContext& ctx) : ctx_(ctx) {}

  const migration::DecodeContext& Context() const { return ctx_; }

  template <typename T>
  MsgPackOutputArchive& operator()(const char* name, T&& field) {
    if constexpr (migration::kIsVersionedField<T>) {
      field.Save(*this, name);
    } else {
      SaveField(name, field);
    }
    return *this;
  }

  template <typename T>
  void SaveField(const char* name, const T& value) {
    (*current_)[name] = ToJson(value);
  }

  template <typename T>
  json ToJson(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
      return json(value);
    } else if constexpr (std::is_enum_v<T>) {
      return json(static_cast<int64_t>(value));
    } else if constexpr (traits::kIsInteger<T> && std::is_signed_v<T>) {
      return json(static_cast<int64_t>(value));
    } else if constexpr (traits::kIsInteger<T>) {
      return json(static_cast<uint64_t>(value));
    } else if constexpr (std::is_floating_point_v<T>) {
      return json(static_cast<double>(value));
    } else if constexpr (std::is_same_v<T, std::string>) {
      return json(value);
    } else if constexpr (traits::kIsByteVector<T>) {
      return json::binary(value);
    } else if constexpr (traits::IsVector<T>::value || traits::IsArray<T>::value) {
      json arr = json::array();
      for (const auto& elem : value) {
        arr.push_back(ToJson(elem));
      }
      return arr;
    } else if constexpr (traits::IsMap<T>::value) {
      json arr = json::array();
      for (const auto& [key, mapped] : value) {
        arr.push_back(json::array({ToJson(key), ToJson(mapped)}));
      }
      return arr;
    } else if constexpr (traits::IsOptional<T>::value) {
      if (!value.has_value()) {
        return json(nullptr);
      }
      return ToJson(*value);
    } else if constexpr (traits::IsPair<T>::value) {
      return json::array({ToJson(value.first), ToJson(value.second)});
    } else {
      json object = json::object();
      json* parent = current_;
      current_ = &object;
      Serialize(*this, const_cast<T&>(value));  // NOLINT(cppcoreguidelines-pro-type-const-cast)
      current_ = parent;
      return object;
    }
  }

 private:
  const migration::DecodeContext& ctx_;
  json* current_ = nullptr;
};

/**
 * @brief Fills a value from a json tree
 */
class MsgPackInputArchive {
 public:
  explicit MsgPackInputArchive(const migration::DecodeContext& ctx) : ctx_(ctx) {}

  const migration::DecodeContext& Context() const { return ctx_; }

  template <typename T>
  MsgPackInputArchive& operator()(const char* name, T&& field) {
    if constexpr (migration::kIsVersionedField<T>) {
      field.Load(*this, name);
    } else {
      LoadField(name, field);
    }
    return *this;
  }

  template <typename T>
  void LoadField(const char* name, T& value) {
    auto it = current_->find(name);
    if (it == current_->end()) {
      throw FormatError(std::string("missing field `") + name + "`");
    }
    try {
      FromJson(*it, value);
    } catch (const MigrationFieldError&) {
      throw;
    } catch (const FormatError& e) {
      throw FormatError(std::string("field `") + name + "`: " + e.what());
    }
  }

  template <typename T>
  void FromJson(const json& j, T& value) {
    if constexpr (std::is_same_v<T, bool>) {
      if (!j.is_boolean()) {
        throw TypeMismatch("bool", j);
      }
      value = j.get<bool>();
    } else if constexpr (std::is_enum_v<T>) {
      using U = std::underlying_type_t<T>;
      U raw{};
      FromJson(j, raw);
      value = traits::ToEnum<T>(raw);
    } else if constexpr (traits::kIsInteger<T>) {
      value = ToInteger<T>(j);
    } else if constexpr (std::is_floating_point_v<T>) {
      if (!j.is_number()) {
        throw TypeMismatch("float", j);
      }
      value = static_cast<T>(j.get<double>());
    } else if constexpr (std::is_same_v<T, std::string>) {
      if (!j.is_string()) {
        throw TypeMismatch("string", j);
      }
      value = j.get<std::string>();
    } else if constexpr (traits::kIsByteVector<T>) {
      if (j.is_binary()) {
        const auto& bin = j.get_binary();
        value.assign(bin.begin(), bin.end());
      } else if (j.is_array()) {
        value.clear();
        for (const auto& elem : j) {
          value.push_back(ToInteger<uint8_t>(elem));
        }
      } else {
        throw TypeMismatch("bytes", j);
      }
    } else if constexpr (traits::IsVector<T>::value) {
      if (!j.is_array()) {
        throw TypeMismatch("sequence", j);
      }
      value.clear();
      for (const auto& elem_json : j) {
        typename T::value_type elem{};
        FromJson(elem_json, elem);
        value.push_back(std::move(elem));
      }
    } else if constexpr (traits::IsArray<T>::value) {
      if (!j.is_array() || j.size() != value.size()) {
        throw FormatError("invalid length, expected array of " + std::to_string(value.size()));
      }
      for (size_t i = 0; i < value.size(); ++i) {
        FromJson(j[i], value[i]);
      }
    } else if constexpr (traits::IsMap<T>::value) {
      if (!j.is_array()) {
        throw TypeMismatch("map", j);
      }
      value.clear();
      for (const auto& entry : j) {
        if (!entry.is_array() || entry.size() != 2) {
          throw FormatError("invalid map entry, expected [key, value]");
        }
        typename T::key_type key{};
        typename T::mapped_type mapped{};
        FromJson(entry[0], key);
        FromJson(entry[1], mapped);
        value.emplace(std::move(key), std::move(mapped));
      }
    } else if constexpr (traits::IsOptional<T>::value) {
      if (j.is_null()) {
        value.reset();
      } else {
        typename T::value_type inner{};
        FromJson(j, inner);
        value = std::move(inner);
      }
    } else if constexpr (traits::IsPair<T>::value) {
      if (!j.is_array() || j.size() != 2) {
        throw TypeMismatch("pair", j);
      }
      FromJson(j[0], value.first);
      FromJson(j[1], value.second);
    } else {
      if (!j.is_object()) {
        throw TypeMismatch("struct", j);
      }
      const json* parent = current_;
      current_ = &j;
      Serialize(*this, value);
      current_ = parent;
    }
  }

 private:
  static FormatError TypeMismatch(const char* expected, const json& j) {
    return FormatError(std::string("invalid type: ") + j.type_name() + ", expected " + expected);
  }

  template <typename T>
  static T ToInteger(const json& j) {
    if (j.is_number_unsigned()) {
      auto raw = j.get<uint64_t>();
      if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw FormatError("integer " + std::to_string(raw) + " out of range");
      }
      return static_cast<T>(raw);
    }
    if (j.is_number_integer()) {
      auto raw = j.get<int64_t>();
      if constexpr (std::is_unsigned_v<T>) {
        if (raw < 0 || static_cast<uint64_t>(raw) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
          throw FormatError("integer " + std::to_string(raw) + " out of range");
        }
      } else {
        if (raw < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
            raw > static_cast<int64_t>(std::numeric_limits<T>::max())) {
          throw FormatError("integer " + std::to_string(raw) + " out of range");
        }
      }
      return static_cast<T>(raw);
    }
    throw TypeMismatch("integer", j);
  }

  const migration::DecodeContext& ctx_;
  const json* current_ = nullptr;
};

}  // namespace stashd::storage
