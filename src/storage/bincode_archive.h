/**
 * @file bincode_archive.h
 * @brief Positional little-endian archive (bincode-compatible layout)
 *
 * Layout:
 *   - integers: fixed width, little-endian
 *   - bool: one byte (0 or 1)
 *   - float/double: IEEE-754, little-endian
 *   - string, vector, map: u64 element count, then elements
 *   - optional: u8 tag (0 = none, 1 = some), then value
 *   - enum: u32 variant index
 *   - pair, std::array, struct: members in order, no length, no names
 *
 * Field names passed through ar("name", field) are ignored. Decoding therefore
 * depends on the exact field list of the struct and its active schema version.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "migration/decode_context.h"
#include "migration/versioned_field.h"
#include "storage/format_error.h"
#include "storage/serde_traits.h"

namespace stashd::storage {

/**
 * @brief Writes values to an ostream in bincode layout
 */
class BincodeOutputArchive {
 public:
  BincodeOutputArchive(std::ostream& out, const migration::DecodeContext& ctx) : out_(out), ctx_(ctx) {}

  const migration::DecodeContext& Context() const { return ctx_; }

  template <typename T>
  BincodeOutputArchive& operator()(const char* name, T&& field) {
    if constexpr (migration::kIsVersionedField<T>) {
      field.Save(*this, name);
    } else {
      SaveField(name, field);
    }
    return *this;
  }

  template <typename T>
  void SaveField(const char* /*name*/, const T& value) {
    Write(value);
  }

  template <typename T>
  void Write(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
      WriteUint<uint8_t>(value ? 1 : 0);
    } else if constexpr (std::is_enum_v<T>) {
      WriteUint<uint32_t>(static_cast<uint32_t>(value));
    } else if constexpr (traits::kIsInteger<T>) {
      WriteUint<std::make_unsigned_t<T>>(static_cast<std::make_unsigned_t<T>>(value));
    } else if constexpr (std::is_same_v<T, float>) {
      uint32_t bits = 0;
      std::memcpy(&bits, &value, sizeof(bits));
      WriteUint<uint32_t>(bits);
    } else if constexpr (std::is_same_v<T, double>) {
      uint64_t bits = 0;
      std::memcpy(&bits, &value, sizeof(bits));
      WriteUint<uint64_t>(bits);
    } else if constexpr (std::is_same_v<T, std::string>) {
      WriteUint<uint64_t>(value.size());
      WriteRaw(value.data(), value.size());
    } else if constexpr (traits::kIsByteVector<T>) {
      WriteUint<uint64_t>(value.size());
      WriteRaw(reinterpret_cast<const char*>(value.data()), value.size());
    } else if constexpr (traits::IsVector<T>::value || traits::IsMap<T>::value) {
      WriteUint<uint64_t>(value.size());
      for (const auto& elem : value) {
        Write(elem);
      }
    } else if constexpr (traits::IsOptional<T>::value) {
      if (value.has_value()) {
        WriteUint<uint8_t>(1);
        Write(*value);
      } else {
        WriteUint<uint8_t>(0);
      }
    } else if constexpr (traits::IsPair<T>::value) {
      Write(value.first);
      Write(value.second);
    } else if constexpr (traits::IsArray<T>::value) {
      for (const auto& elem : value) {
        Write(elem);
      }
    } else {
      // Serialize() takes a mutable reference because the same function
      // drives decoding; encoding never modifies the value.
      Serialize(*this, const_cast<T&>(value));  // NOLINT(cppcoreguidelines-pro-type-const-cast)
    }
  }

 private:
  template <typename U>
  void WriteUint(U value) {
    char buf[sizeof(U)];
    for (size_t i = 0; i < sizeof(U); ++i) {
      buf[i] = static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFF);
    }
    WriteRaw(buf, sizeof(U));
  }

  void WriteRaw(const char* data, size_t size) {
    if (size == 0) {
      return;
    }
    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) {
      throw FormatError("write failed");
    }
  }

  std::ostream& out_;
  const migration::DecodeContext& ctx_;
};

/**
 * @brief Reads values from an istream in bincode layout
 */
class BincodeInputArchive {
 public:
  BincodeInputArchive(std::istream& in, const migration::DecodeContext& ctx) : in_(in), ctx_(ctx) {}

  const migration::DecodeContext& Context() const { return ctx_; }

  template <typename T>
  BincodeInputArchive& operator()(const char* name, T&& field) {
    if constexpr (migration::kIsVersionedField<T>) {
      field.Load(*this, name);
    } else {
      LoadField(name, field);
    }
    return *this;
  }

  template <typename T>
  void LoadField(const char* /*name*/, T& value) {
    Read(value);
  }

  template <typename T>
  void Read(T& value) {
    if constexpr (std::is_same_v<T, bool>) {
      auto byte = ReadUint<uint8_t>();
      if (byte > 1) {
        throw FormatError("invalid value for bool: " + std::to_string(byte));
      }
      value = byte == 1;
    } else if constexpr (std::is_enum_v<T>) {
      value = traits::ToEnum<T>(ReadUint<uint32_t>());
    } else if constexpr (traits::kIsInteger<T>) {
      value = static_cast<T>(ReadUint<std::make_unsigned_t<T>>());
    } else if constexpr (std::is_same_v<T, float>) {
      auto bits = ReadUint<uint32_t>();
      std::memcpy(&value, &bits, sizeof(bits));
    } else if constexpr (std::is_same_v<T, double>) {
      auto bits = ReadUint<uint64_t>();
      std::memcpy(&value, &bits, sizeof(bits));
    } else if constexpr (std::is_same_v<T, std::string>) {
      auto len = ReadUint<uint64_t>();
      value.clear();
      ReadInto(value, len);
    } else if constexpr (traits::kIsByteVector<T>) {
      auto len = ReadUint<uint64_t>();
      value.clear();
      ReadInto(value, len);
    } else if constexpr (traits::IsVector<T>::value) {
      auto len = ReadUint<uint64_t>();
      value.clear();
      for (uint64_t i = 0; i < len; ++i) {
        typename T::value_type elem{};
        Read(elem);
        value.push_back(std::move(elem));
      }
    } else if constexpr (traits::IsMap<T>::value) {
      auto len = ReadUint<uint64_t>();
      value.clear();
      for (uint64_t i = 0; i < len; ++i) {
        typename T::key_type key{};
        typename T::mapped_type mapped{};
        Read(key);
        Read(mapped);
        value.emplace(std::move(key), std::move(mapped));
      }
    } else if constexpr (traits::IsOptional<T>::value) {
      auto tag = ReadUint<uint8_t>();
      if (tag == 0) {
        value.reset();
      } else if (tag == 1) {
        typename T::value_type inner{};
        Read(inner);
        value = std::move(inner);
      } else {
        throw FormatError("invalid value for option tag: " + std::to_string(tag));
      }
    } else if constexpr (traits::IsPair<T>::value) {
      Read(value.first);
      Read(value.second);
    } else if constexpr (traits::IsArray<T>::value) {
      for (auto& elem : value) {
        Read(elem);
      }
    } else {
      Serialize(*this, value);
    }
  }

 private:
  // Bounded steps keep a corrupt length prefix from allocating gigabytes
  // before the truncation is noticed.
  static constexpr size_t kReadStep = 64 * 1024;

  template <typename U>
  U ReadUint() {
    unsigned char buf[sizeof(U)];
    ReadRaw(reinterpret_cast<char*>(buf), sizeof(U));
    uint64_t value = 0;
    for (size_t i = 0; i < sizeof(U); ++i) {
      value |= static_cast<uint64_t>(buf[i]) << (8 * i);
    }
    return static_cast<U>(value);
  }

  template <typename Container>
  void ReadInto(Container& out, uint64_t len) {
    uint64_t remaining = len;
    while (remaining > 0) {
      size_t step = remaining < kReadStep ? static_cast<size_t>(remaining) : kReadStep;
      size_t old_size = out.size();
      out.resize(old_size + step);
      ReadRaw(reinterpret_cast<char*>(&out[old_size]), step);
      remaining -= step;
    }
  }

  void ReadRaw(char* data, size_t size) {
    in_.read(data, static_cast<std::streamsize>(size));
    if (static_cast<size_t>(in_.gcount()) != size) {
      throw FormatError("unexpected end of input");
    }
  }

  std::istream& in_;
  const migration::DecodeContext& ctx_;
};

}  // namespace stashd::storage
