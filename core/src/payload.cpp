#include "trigraph/payload.hpp"

namespace trigraph {

const char *to_string(DataType type) noexcept {
  switch (type) {
  case DataType::Protobuf:
    return "protobuf";
  case DataType::Bytes:
    return "bytes";
  case DataType::String:
    return "string";
  case DataType::Int:
    return "int";
  case DataType::Int8:
    return "int8";
  case DataType::Int16:
    return "int16";
  case DataType::Int32:
    return "int32";
  case DataType::Int64:
    return "int64";
  case DataType::Uint:
    return "uint";
  case DataType::Uint8:
    return "uint8";
  case DataType::Uint16:
    return "uint16";
  case DataType::Uint32:
    return "uint32";
  case DataType::Uint64:
    return "uint64";
  case DataType::Float32:
    return "float32";
  case DataType::Float64:
    return "float64";
  case DataType::Array:
    return "array";
  case DataType::Slice:
    return "slice";
  }
  return "unknown";
}

size_t fixed_width(DataType type) noexcept {
  switch (type) {
  case DataType::Int8:
  case DataType::Uint8:
    return 1;
  case DataType::Int16:
  case DataType::Uint16:
    return 2;
  case DataType::Int32:
  case DataType::Uint32:
  case DataType::Float32:
    return 4;
  case DataType::Int:
  case DataType::Int64:
  case DataType::Uint:
  case DataType::Uint64:
  case DataType::Float64:
    return 8;
  default:
    return 0;
  }
}

Result<Payload> Payload::of_message(const google::protobuf::Message &message) {
  std::string wire;
  if (!message.SerializeToString(&wire))
    return fail(ErrorCode::InvalidArgument,
                "failed to serialize " + message.GetTypeName());
  Payload p(DataType::Protobuf, message.GetDescriptor()->full_name(),
            std::vector<uint8_t>(wire.begin(), wire.end()));
  std::shared_ptr<google::protobuf::Message> copy(message.New());
  copy->CopyFrom(message);
  p.message_ = std::move(copy);
  return p;
}

Result<std::string> Payload::as_string() const {
  if (type_ != DataType::String && type_ != DataType::Bytes)
    return fail(ErrorCode::InvalidArgument,
                std::string("payload is ") + to_string(type_) + ", not string");
  return std::string(bytes_.begin(), bytes_.end());
}

Result<double> Payload::as_number() const {
  if (fixed_width(type_) == 0)
    return fail(ErrorCode::InvalidArgument,
                std::string("payload is ") + to_string(type_) +
                    ", not numeric");
  if (bytes_.size() < fixed_width(type_))
    return fail(ErrorCode::Format, "short buffer");

  const uint8_t *p = bytes_.data();
  switch (type_) {
  case DataType::Int8:
    return static_cast<double>(static_cast<int8_t>(p[0]));
  case DataType::Uint8:
    return static_cast<double>(p[0]);
  case DataType::Int16:
    return static_cast<double>(load_le<int16_t>(p));
  case DataType::Uint16:
    return static_cast<double>(load_le<uint16_t>(p));
  case DataType::Int32:
    return static_cast<double>(load_le<int32_t>(p));
  case DataType::Uint32:
    return static_cast<double>(load_le<uint32_t>(p));
  case DataType::Int:
  case DataType::Int64:
    return static_cast<double>(load_le<int64_t>(p));
  case DataType::Uint:
  case DataType::Uint64:
    return static_cast<double>(load_le<uint64_t>(p));
  case DataType::Float32:
    return static_cast<double>(decode_scalar<float>(p));
  case DataType::Float64:
    return decode_scalar<double>(p);
  default:
    break;
  }
  return fail(ErrorCode::InvalidArgument, "payload is not numeric");
}

// ═══════════════════════════════════════════════════════════════════════════
// TypeRegistry
// ═══════════════════════════════════════════════════════════════════════════

void TypeRegistry::add(const google::protobuf::Message &prototype) {
  prototypes_[prototype.GetDescriptor()->full_name()] =
      std::unique_ptr<google::protobuf::Message>(prototype.New());
}

bool TypeRegistry::contains(std::string_view full_name) const {
  return prototypes_.find(full_name) != prototypes_.end();
}

Result<std::shared_ptr<const google::protobuf::Message>>
TypeRegistry::parse(std::string_view full_name,
                    std::span<const uint8_t> bytes) const {
  auto it = prototypes_.find(full_name);
  if (it == prototypes_.end())
    return fail(ErrorCode::NotFound, "protobuf type \"" +
                                         std::string(full_name) +
                                         "\" not registered");
  std::shared_ptr<google::protobuf::Message> msg(it->second->New());
  if (!msg->ParseFromArray(bytes.data(), static_cast<int>(bytes.size())))
    return fail(ErrorCode::Format,
                "payload does not parse as " + std::string(full_name));
  return std::shared_ptr<const google::protobuf::Message>(std::move(msg));
}

} // namespace trigraph
