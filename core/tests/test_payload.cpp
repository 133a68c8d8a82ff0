#include "trigraph/data_section.hpp"
#include "trigraph/payload.hpp"

#include "test_payloads.pb.h"

#include <gtest/gtest.h>

using namespace trigraph;

// ============================================================================
// Scalars
// ============================================================================

TEST(Payload, ScalarTagsAndLittleEndian) {
  Payload p = Payload::of<int32_t>(-2);
  EXPECT_EQ(p.type(), DataType::Int32);
  ASSERT_EQ(p.size(), 4u);
  EXPECT_EQ(p.bytes()[0], 0xFE);
  EXPECT_EQ(p.bytes()[3], 0xFF);

  auto back = p.as<int32_t>();
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, -2);

  EXPECT_EQ(Payload::of<uint8_t>(7).type(), DataType::Uint8);
  EXPECT_EQ(Payload::of(2.5).type(), DataType::Float64);
  EXPECT_EQ(Payload::of(1.5f).as<float>().value(), 1.5f);
}

TEST(Payload, TagMismatchIsInvalidArgument) {
  auto r = Payload::of<int16_t>(3).as<int32_t>();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(r.error().message, "payload is int16, not int32");
}

TEST(Payload, PlatformIntReadsAsSixtyFourBits) {
  std::vector<uint8_t> bytes(8, 0);
  store_le<int64_t>(bytes.data(), -9);
  Payload p(DataType::Int, {}, bytes);
  EXPECT_EQ(p.as<int64_t>().value(), -9);
  EXPECT_FALSE(p.as<int32_t>().has_value());
  EXPECT_DOUBLE_EQ(p.as_number().value(), -9.0);
}

TEST(Payload, AsNumberWidensEveryNumericTag) {
  EXPECT_DOUBLE_EQ(Payload::of<int8_t>(-4).as_number().value(), -4.0);
  EXPECT_DOUBLE_EQ(Payload::of<uint16_t>(65000).as_number().value(), 65000.0);
  EXPECT_DOUBLE_EQ(Payload::of(0.25f).as_number().value(), 0.25);

  auto text = Payload::of_string("7").as_number();
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error().code, ErrorCode::InvalidArgument);
}

TEST(Payload, ShortScalarIsFormatError) {
  Payload p(DataType::Float64, {}, {1, 2, 3});
  auto r = p.as<double>();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::Format);
}

// ============================================================================
// Strings, bytes, vectors
// ============================================================================

TEST(Payload, StringsAndBytes) {
  Payload s = Payload::of_string("next");
  EXPECT_EQ(s.type(), DataType::String);
  EXPECT_EQ(s.as_string().value(), "next");

  Payload b = Payload::of_bytes({0xDE, 0xAD});
  EXPECT_EQ(b.type(), DataType::Bytes);
  EXPECT_EQ(b.size(), 2u);
  EXPECT_FALSE(Payload::of(1).as_string().has_value());
}

TEST(Payload, SliceAndArray) {
  std::vector<int16_t> values = {1, -2, 3};
  Payload slice = Payload::of_vector<int16_t>(values);
  EXPECT_EQ(slice.type(), DataType::Slice);
  ASSERT_EQ(slice.size(), 4u + 3 * 2);
  EXPECT_EQ(load_le<uint32_t>(slice.bytes().data()), 3u);
  EXPECT_EQ(slice.as_vector<int16_t>().value(), values);

  std::vector<double> fixed = {0.5, 1.5};
  Payload array = Payload::of_vector<double>(fixed, true);
  EXPECT_EQ(array.type(), DataType::Array);
  EXPECT_EQ(array.as_vector<double>().value(), fixed);
}

TEST(Payload, VectorCountPastEndIsFormatError) {
  std::vector<uint8_t> bytes(4 + 2, 0);
  store_le<uint32_t>(bytes.data(), 5);
  Payload p(DataType::Slice, {}, bytes);
  auto r = p.as_vector<uint16_t>();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::Format);
}

// ============================================================================
// Protobuf messages & TypeRegistry
// ============================================================================

TEST(Payload, MessageCarriesFullName) {
  trigraph::test::WeightedEdge edge;
  edge.set_cost(2.5f);
  edge.set_label("toll");

  auto p = Payload::of_message(edge);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->type(), DataType::Protobuf);
  EXPECT_EQ(p->type_name(), "trigraph.test.WeightedEdge");
  ASSERT_NE(p->message(), nullptr);
  EXPECT_EQ(p->message()->GetDescriptor()->full_name(),
            "trigraph.test.WeightedEdge");
}

TEST(TypeRegistry, ParsesRegisteredTypes) {
  TypeRegistry types;
  types.add<trigraph::test::WeightedEdge>();
  EXPECT_TRUE(types.contains("trigraph.test.WeightedEdge"));
  EXPECT_FALSE(types.contains("trigraph.test.City"));
  EXPECT_EQ(types.size(), 1u);

  trigraph::test::WeightedEdge edge;
  edge.set_cost(4.0f);
  auto p = Payload::of_message(edge);
  ASSERT_TRUE(p.has_value());

  auto msg = types.parse(p->type_name(), p->bytes());
  ASSERT_TRUE(msg.has_value()) << msg.error().describe();
  const auto *parsed =
      dynamic_cast<const trigraph::test::WeightedEdge *>(msg->get());
  ASSERT_NE(parsed, nullptr);
  EXPECT_FLOAT_EQ(parsed->cost(), 4.0f);
}

TEST(TypeRegistry, UnknownTypeAndGarbage) {
  TypeRegistry types;
  types.add<trigraph::test::City>();

  std::vector<uint8_t> bytes = {0x08, 0x01};
  auto missing = types.parse("trigraph.test.WeightedEdge", bytes);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

  std::vector<uint8_t> garbage = {0xFF, 0xFF, 0xFF};
  auto bad = types.parse("trigraph.test.City", garbage);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().code, ErrorCode::Format);
}

TEST(TypeRegistry, DecodePayloadNeedsRegistryForMessages) {
  trigraph::test::City city;
  city.set_name("Oslo");
  auto p = Payload::of_message(city);
  ASSERT_TRUE(p.has_value());
  DataEntry entry{DataType::Protobuf, p->type_name(),
                  std::vector<uint8_t>(p->bytes().begin(), p->bytes().end())};

  auto unregistered = decode_payload(entry, nullptr);
  ASSERT_FALSE(unregistered.has_value());
  EXPECT_EQ(unregistered.error().code, ErrorCode::NotFound);

  TypeRegistry types;
  types.add<trigraph::test::City>();
  auto decoded = decode_payload(entry, &types);
  ASSERT_TRUE(decoded.has_value());
  ASSERT_NE(decoded->message(), nullptr);
  EXPECT_EQ(*decoded, *p);
}
