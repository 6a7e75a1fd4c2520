#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <state_sync/buffer_stream.hpp>
#include <state_sync/serializer.hpp>

#include <cereal/archives/portable_binary.hpp>

#include <boost/uuid/string_generator.hpp>

#include <map>
#include <string>
#include <vector>

using namespace state_sync;

class SerializerTest : public ::testing::Test {
protected:
  template <typename... T>
  buffer_type write(T... values) {
    buffer_type bytes;
    {
      buffer_ostream                      os(bytes);
      cereal::PortableBinaryOutputArchive archive(os);
      serializer                          s(archive);
      s(values...);
    }
    return bytes;
  }

  template <typename T>
  T read(buffer_type const& bytes) {
    buffer_istream                     is(bytes);
    cereal::PortableBinaryInputArchive archive(is);
    serializer                         s(archive, protocol::current_version);
    T                                  value{};
    s(value);
    return value;
  }

  var round_trip(var value) {
    return read<var>(write(value));
  }

  // Bytes after the archive's leading endianness marker
  static buffer_type body(buffer_type const& bytes) {
    return buffer_type(bytes.begin() + 1, bytes.end());
  }
};

TEST_F(SerializerTest, SmallIntegersTakeOneByte) {
  EXPECT_THAT(body(write(std::int32_t{0})), ::testing::ElementsAre(0x00));
  EXPECT_THAT(body(write(std::int32_t{127})), ::testing::ElementsAre(0x7f));
  EXPECT_THAT(body(write(std::int32_t{300})), ::testing::ElementsAre(0xac, 0x02));
  EXPECT_THAT(body(write(std::uint64_t{300})), ::testing::ElementsAre(0xac, 0x02));
}

TEST_F(SerializerTest, NegativeIntegersUseFullWidth) {
  EXPECT_EQ(body(write(std::int32_t{-1})).size(), 5u);
  EXPECT_EQ(body(write(std::int64_t{-1})).size(), 10u);
  EXPECT_EQ(read<std::int32_t>(write(std::int32_t{-1})), -1);
  EXPECT_EQ(read<std::int64_t>(write(std::int64_t{-123456789012})), -123456789012);
}

TEST_F(SerializerTest, OverlongVarintIsRejected) {
  buffer_type bytes = write(std::uint8_t{0});
  bytes.resize(1);
  bytes.insert(bytes.end(), {0xff, 0xff, 0xff, 0xff, 0xff, 0x01});
  EXPECT_THROW(read<std::int32_t>(bytes), decode_error);
}

TEST_F(SerializerTest, StringsAreLengthPrefixed) {
  EXPECT_THAT(body(write(std::string("Life"))), ::testing::ElementsAre(0x04, 'L', 'i', 'f', 'e'));
  EXPECT_EQ(read<std::string>(write(std::string())), "");
}

TEST_F(SerializerTest, TruncatedInputThrows) {
  auto bytes = write(std::string("Hello world"));
  bytes.resize(bytes.size() - 3);
  EXPECT_THROW(read<std::string>(bytes), decode_error);

  EXPECT_THROW(read<double>(write(std::uint8_t{1})), decode_error);
}

TEST_F(SerializerTest, OversizedLengthPrefixIsRejected) {
  auto bytes = write(std::uint64_t{serializer::max_sequence_length + 1});
  EXPECT_THROW(read<std::string>(bytes), decode_error);
}

TEST_F(SerializerTest, VarTagPrecedesPayload) {
  EXPECT_THAT(body(write(var{})), ::testing::ElementsAre(static_cast<std::uint8_t>(var_type::null)));
  EXPECT_THAT(body(write(var(75))), ::testing::ElementsAre(static_cast<std::uint8_t>(var_type::int32), 75));
  EXPECT_THAT(body(write(var(true))), ::testing::ElementsAre(static_cast<std::uint8_t>(var_type::boolean), 1));
}

TEST_F(SerializerTest, ScalarVarsKeepTheirKind) {
  auto const id = boost::uuids::string_generator()("01234567-89ab-cdef-0123-456789abcdef");

  std::vector<var> values{var(true),
                          var(std::int8_t{-8}),
                          var(std::uint8_t{200}),
                          var(u'z'),
                          var(std::int16_t{-1000}),
                          var(std::uint16_t{60000}),
                          var(std::int32_t{-70000}),
                          var(std::uint32_t{4000000000u}),
                          var(std::int64_t{-5}),
                          var(std::uint64_t{1} << 63),
                          var(75.0f),
                          var(-2.5),
                          var(decimal{.mantissa = 1999, .scale = 2}),
                          var("Life"),
                          var::make(enum_value{.type_name = "Weapon", .value = 4}),
                          var(id),
                          var(object_ref{"door-1"})};

  for (auto const& value : values) {
    auto const decoded = round_trip(value);
    EXPECT_EQ(decoded.type(), value.type()) << value.to_string();
    EXPECT_EQ(decoded, value) << value.to_string();
  }
}

TEST_F(SerializerTest, TypedArraysSkipItemTags) {
  var const value(std::vector<std::int32_t>{1, 2, 3});
  EXPECT_THAT(body(write(value)),
              ::testing::ElementsAre(static_cast<std::uint8_t>(var_type::array), static_cast<std::uint8_t>(var_type::int32), 3, 1, 2, 3));
  EXPECT_EQ(round_trip(value), value);
}

TEST_F(SerializerTest, ArrayWithForeignItemsFallsBackToTaggedItems) {
  var_array array{.element_type = var_type::string, .items = {var("a"), var{}, var("c")}};
  auto const decoded = round_trip(var::make(array));

  auto const* items = decoded.get_if<var_array>();
  ASSERT_NE(items, nullptr);
  EXPECT_EQ(items->element_type, var_type::any);
  ASSERT_EQ(items->items.size(), 3u);
  EXPECT_EQ(items->items[0], var("a"));
  EXPECT_TRUE(items->items[1].is_null());
}

TEST_F(SerializerTest, ListsAndMapsNest) {
  std::map<std::string, std::vector<std::int32_t>> slots{{"left", {1, 2}}, {"right", {}}};
  var const nested(std::vector<var>{var(slots), var("tail"), var{}, var(std::vector<var>{var(1.5f)})});

  auto const decoded = round_trip(nested);
  EXPECT_EQ(decoded, nested);
  EXPECT_EQ((decoded.as<std::vector<var>>()[0].as<std::map<std::string, std::vector<std::int32_t>>>()), slots);
}

TEST_F(SerializerTest, DeepNestingIsRejected) {
  var value(std::vector<var>{});
  for (std::uint32_t i = 0; i < serializer::max_nesting_depth + 2; ++i) {
    value = var(std::vector<var>{value});
  }
  EXPECT_THROW(round_trip(value), decode_error);

  var shallow(std::vector<var>{});
  for (std::uint32_t i = 0; i < 8; ++i) {
    shallow = var(std::vector<var>{shallow});
  }
  EXPECT_EQ(round_trip(shallow), shallow);
}

TEST_F(SerializerTest, UnknownTagIsRejected) {
  buffer_type bytes = write(std::uint8_t{0});
  bytes.back() = 0x7e;
  EXPECT_THROW(read<var>(bytes), decode_error);
}

TEST_F(SerializerTest, StringListsAndBuffers) {
  std::vector<std::string> ids{"actor-1", "", "door-7"};
  EXPECT_EQ(read<std::vector<std::string>>(write(ids)), ids);

  buffer_type blob{0x00, 0xff, 0x10};
  EXPECT_EQ(read<buffer_type>(write(blob)), blob);
}

TEST_F(SerializerTest, NullElementKindIsRejected) {
  auto const array_tag = static_cast<std::uint8_t>(var_type::array);
  auto const map_tag   = static_cast<std::uint8_t>(var_type::map);
  auto const null_tag  = static_cast<std::uint8_t>(var_type::null);
  auto const any_tag   = static_cast<std::uint8_t>(var_type::any);
  auto const huge      = static_cast<std::uint32_t>(serializer::max_sequence_length);

  EXPECT_THROW(read<var>(write(array_tag, null_tag, huge)), decode_error);
  EXPECT_THROW(read<var>(write(map_tag, null_tag, any_tag, huge)), decode_error);
  EXPECT_THROW(read<var>(write(map_tag, any_tag, null_tag, huge)), decode_error);
}

TEST_F(SerializerTest, NullDeclaredKindsAreWrittenAsTaggedItems) {
  var_array array{.element_type = var_type::null, .items = {var{}, var{}}};
  auto const any_tag  = static_cast<std::uint8_t>(var_type::any);
  auto const null_tag = static_cast<std::uint8_t>(var_type::null);
  EXPECT_THAT(body(write(var::make(array))),
              ::testing::ElementsAre(static_cast<std::uint8_t>(var_type::array), any_tag, 2, null_tag, null_tag));

  auto const decoded = round_trip(var::make(array));
  auto const* items  = decoded.get_if<var_array>();
  ASSERT_NE(items, nullptr);
  EXPECT_EQ(items->element_type, var_type::any);
  EXPECT_EQ(items->items.size(), 2u);

  var_map map{.key_type = var_type::string, .value_type = var_type::null, .keys = {var("a")}, .values = {var{}}};
  EXPECT_THAT(body(write(var::make(map))),
              ::testing::ElementsAre(static_cast<std::uint8_t>(var_type::map),
                                     static_cast<std::uint8_t>(var_type::string),
                                     any_tag,
                                     1,
                                     1,
                                     'a',
                                     null_tag));
}

TEST_F(SerializerTest, BooleansAreZeroOrOne) {
  EXPECT_THAT(body(write(true, false)), ::testing::ElementsAre(1, 0));
  EXPECT_TRUE(read<bool>(write(std::uint8_t{1})));
  EXPECT_THROW(read<bool>(write(std::uint8_t{2})), decode_error);
  EXPECT_THROW(read<var>(write(static_cast<std::uint8_t>(var_type::boolean), std::uint8_t{0x80})), decode_error);
  EXPECT_EQ(round_trip(var(true)), var(true));
}

TEST_F(SerializerTest, WriteBytesMatchesBufferLayout) {
  buffer_type const blob{0x01, 0x02, 0x03};

  buffer_type bytes;
  {
    buffer_ostream                      os(bytes);
    cereal::PortableBinaryOutputArchive archive(os);
    serializer                          s(archive);
    s.write_bytes(blob);
  }
  EXPECT_EQ(bytes, write(blob));
  EXPECT_EQ(read<buffer_type>(bytes), blob);

  buffer_istream                     is(bytes);
  cereal::PortableBinaryInputArchive archive(is);
  serializer                         reader(archive, protocol::current_version);
  EXPECT_THROW(reader.write_bytes(blob), sync_error);
}

TEST_F(SerializerTest, OutputStreamAppendsWhenDestroyed) {
  buffer_type bytes{0x7f};
  {
    buffer_ostream os(bytes);
    os.write("ab", 2);
    os.put('\xff');
  }
  EXPECT_THAT(bytes, ::testing::ElementsAre(0x7f, 'a', 'b', 0xff));
}
