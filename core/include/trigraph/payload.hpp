#pragma once

/**
 * @file payload.hpp
 * @brief Typed values carried by node and edge data entries.
 *
 * A Payload is the (tag, type name, bytes) triple stored in the data file.
 * Fixed-width primitives are little-endian; arrays and slices carry a u32
 * element count followed by the packed elements; protobuf payloads carry
 * the message's full name as the type name.
 */

#include "trigraph/codec.hpp"
#include "trigraph/error.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <google/protobuf/message.h>

namespace trigraph {

// ═══════════════════════════════════════════════════════════════════════════
// Data-type tag (one byte on disk)
// ═══════════════════════════════════════════════════════════════════════════

enum class DataType : uint8_t {
  Protobuf = 0,
  Bytes = 1,
  String = 2,
  Int = 3,
  Int8 = 4,
  Int16 = 5,
  Int32 = 6,
  Int64 = 7,
  Uint = 8,
  Uint8 = 9,
  Uint16 = 10,
  Uint32 = 11,
  Uint64 = 12,
  Float32 = 13,
  Float64 = 14,
  Array = 15,
  Slice = 16,
};

inline constexpr uint8_t DATA_TYPE_MAX = 16;

const char *to_string(DataType type) noexcept;

/// Byte width of a fixed-width tag, or 0 for variable-length tags.
size_t fixed_width(DataType type) noexcept;

/// Tag used for a C++ arithmetic type (int64_t -> Int64, float -> Float32...).
template <typename T> constexpr DataType data_type_of() noexcept {
  static_assert(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>,
                "payload scalars must be arithmetic");
  if constexpr (std::is_same_v<T, float>)
    return DataType::Float32;
  else if constexpr (std::is_same_v<T, double>)
    return DataType::Float64;
  else if constexpr (std::is_signed_v<T>) {
    if constexpr (sizeof(T) == 1)
      return DataType::Int8;
    else if constexpr (sizeof(T) == 2)
      return DataType::Int16;
    else if constexpr (sizeof(T) == 4)
      return DataType::Int32;
    else
      return DataType::Int64;
  } else {
    if constexpr (sizeof(T) == 1)
      return DataType::Uint8;
    else if constexpr (sizeof(T) == 2)
      return DataType::Uint16;
    else if constexpr (sizeof(T) == 4)
      return DataType::Uint32;
    else
      return DataType::Uint64;
  }
}

// ═══════════════════════════════════════════════════════════════════════════
// Payload
// ═══════════════════════════════════════════════════════════════════════════

class Payload {
public:
  Payload() = default;
  Payload(DataType type, std::string type_name, std::vector<uint8_t> bytes)
      : type_(type), type_name_(std::move(type_name)),
        bytes_(std::move(bytes)) {}

  static Payload of_bytes(std::vector<uint8_t> bytes) {
    return Payload(DataType::Bytes, {}, std::move(bytes));
  }

  static Payload of_string(std::string_view text) {
    return Payload(DataType::String, {},
                   std::vector<uint8_t>(text.begin(), text.end()));
  }

  template <typename T> static Payload of(T value) {
    constexpr DataType tag = data_type_of<T>();
    std::vector<uint8_t> out(sizeof(T));
    encode_scalar(out.data(), value);
    return Payload(tag, {}, std::move(out));
  }

  /// u32 count, then elements. `fixed_length` selects Array over Slice.
  template <typename T>
  static Payload of_vector(std::span<const T> values, bool fixed_length = false) {
    std::vector<uint8_t> out(4 + values.size() * sizeof(T));
    store_le<uint32_t>(out.data(), static_cast<uint32_t>(values.size()));
    uint8_t *p = out.data() + 4;
    for (const T &v : values) {
      encode_scalar(p, v);
      p += sizeof(T);
    }
    return Payload(fixed_length ? DataType::Array : DataType::Slice, {},
                   std::move(out));
  }

  /// Serializes `message`; the type name is its full protobuf name.
  static Result<Payload> of_message(const google::protobuf::Message &message);

  DataType type() const noexcept { return type_; }
  const std::string &type_name() const noexcept { return type_name_; }
  std::span<const uint8_t> bytes() const noexcept { return bytes_; }
  size_t size() const noexcept { return bytes_.size(); }

  /// Parsed message for protobuf payloads read through a TypeRegistry.
  const google::protobuf::Message *message() const noexcept {
    return message_.get();
  }
  void set_message(std::shared_ptr<const google::protobuf::Message> m) {
    message_ = std::move(m);
  }

  /// Fixed-width scalar; the tag must match T exactly.
  template <typename T> Result<T> as() const {
    constexpr DataType tag = data_type_of<T>();
    bool wide_alias = (sizeof(T) == 8) &&
                      ((std::is_signed_v<T> && type_ == DataType::Int) ||
                       (std::is_unsigned_v<T> && type_ == DataType::Uint));
    if (type_ != tag && !wide_alias)
      return fail(ErrorCode::InvalidArgument,
                  std::string("payload is ") + to_string(type_) + ", not " +
                      to_string(tag));
    if (bytes_.size() < sizeof(T))
      return fail(ErrorCode::Format, "short buffer");
    return decode_scalar<T>(bytes_.data());
  }

  Result<std::string> as_string() const;

  template <typename T> Result<std::vector<T>> as_vector() const {
    if (type_ != DataType::Array && type_ != DataType::Slice)
      return fail(ErrorCode::InvalidArgument,
                  std::string("payload is ") + to_string(type_) +
                      ", not an array or slice");
    if (bytes_.size() < 4)
      return fail(ErrorCode::Format, "short buffer");
    uint64_t n = load_le<uint32_t>(bytes_.data());
    if (4 + n * sizeof(T) > bytes_.size())
      return fail(ErrorCode::Format, "short buffer");
    std::vector<T> out;
    out.reserve(n);
    for (uint64_t i = 0; i < n; ++i)
      out.push_back(decode_scalar<T>(bytes_.data() + 4 + i * sizeof(T)));
    return out;
  }

  /// Any numeric tag widened to double.
  Result<double> as_number() const;

  bool operator==(const Payload &o) const {
    return type_ == o.type_ && type_name_ == o.type_name_ &&
           bytes_ == o.bytes_;
  }

private:
  template <typename T> static void encode_scalar(uint8_t *out, T value) {
    if constexpr (std::is_floating_point_v<T>) {
      using Bits = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
      Bits bits;
      std::memcpy(&bits, &value, sizeof(T));
      store_le<Bits>(out, bits);
    } else {
      store_le<T>(out, value);
    }
  }

  template <typename T> static T decode_scalar(const uint8_t *in) {
    if constexpr (std::is_floating_point_v<T>) {
      using Bits = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
      Bits bits = load_le<Bits>(in);
      T value;
      std::memcpy(&value, &bits, sizeof(T));
      return value;
    } else {
      return load_le<T>(in);
    }
  }

  DataType type_ = DataType::Bytes;
  std::string type_name_;
  std::vector<uint8_t> bytes_;
  std::shared_ptr<const google::protobuf::Message> message_;
};

// ═══════════════════════════════════════════════════════════════════════════
// TypeRegistry: protobuf prototypes by full message name
// ═══════════════════════════════════════════════════════════════════════════

class TypeRegistry {
public:
  TypeRegistry() = default;
  TypeRegistry(const TypeRegistry &) = delete;
  TypeRegistry &operator=(const TypeRegistry &) = delete;

  void add(const google::protobuf::Message &prototype);

  template <typename M> void add() { add(M::default_instance()); }

  bool contains(std::string_view full_name) const;
  size_t size() const noexcept { return prototypes_.size(); }

  /// NotFound when unregistered, Format when the bytes do not parse.
  Result<std::shared_ptr<const google::protobuf::Message>>
  parse(std::string_view full_name, std::span<const uint8_t> bytes) const;

private:
  std::map<std::string, std::unique_ptr<google::protobuf::Message>,
           std::less<>>
      prototypes_;
};

} // namespace trigraph
