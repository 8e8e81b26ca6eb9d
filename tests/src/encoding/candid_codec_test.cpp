#include <gtest/gtest.h>
#include <vellum/encoding/candid/codec.hpp>
#include <vellum/testing/fixtures.hpp>

namespace candid = vellum::encoding::candid;

namespace {

std::string encode_hex(const std::vector<candid::value_t>& args) {
  return vellum::schema::to_hex(candid::encode(args));
}

std::optional<std::vector<candid::value_t>> decode_hex(
    const std::string_view text,
    vellum::common::error& error) {
  return candid::decode(vellum::testing::hex(text), error);
}

}  // namespace

TEST(candid_codec, field_hash_matches_idl_hash) {
  EXPECT_EQ(candid::field_hash("a"), 97u);
  EXPECT_EQ(candid::field_hash("to"), 25979u);
  EXPECT_EQ(candid::field_hash("e8s"), 5035232u);
  EXPECT_EQ(candid::field_hash("memo"), 1213809850u);
}

TEST(candid_codec, leb128_encodings) {
  auto out = vellum::schema::bytes_t{};
  candid::write_uleb128(624485, out);
  EXPECT_EQ(vellum::schema::to_hex(out), "e58e26");
  out.clear();
  candid::write_sleb128(-123456, out);
  EXPECT_EQ(vellum::schema::to_hex(out), "c0bb78");
  out.clear();
  candid::write_sleb128(-1, out);
  EXPECT_EQ(vellum::schema::to_hex(out), "7f");
}

TEST(candid_codec, primitive_messages) {
  EXPECT_EQ(encode_hex({}), "4449444c0000");
  EXPECT_EQ(encode_hex({candid::make_nat64(42)}),
            "4449444c0001782a00000000000000");
  EXPECT_EQ(encode_hex({candid::make_text("a")}), "4449444c00017101" "61");
  EXPECT_EQ(encode_hex({candid::make_bool(true)}), "4449444c00017e01");
  EXPECT_EQ(encode_hex({candid::make_principal(
                vellum::schema::make_anonymous_principal())}),
            "4449444c000168010104");
}

TEST(candid_codec, composite_types_go_through_the_type_table) {
  EXPECT_EQ(encode_hex({candid::make_some(candid::make_nat8(5))}),
            "4449444c016e7b01000105");
  // Fields are emitted in field id order whatever order they were given in.
  EXPECT_EQ(encode_hex({candid::make_record({{"b", candid::make_nat8(2)},
                                             {"a", candid::make_nat8(1)}})}),
            "4449444c016c02617b627b01000102");
}

TEST(candid_codec, identical_types_share_one_table_entry) {
  auto bytes = candid::encode(
      {candid::make_some(candid::make_nat8(1)),
       candid::make_some(candid::make_nat8(2))});
  EXPECT_EQ(vellum::schema::to_hex(bytes), "4449444c016e7b0200000101" "0102");
}

TEST(candid_codec, decode_recovers_values) {
  auto error = vellum::common::error{};
  auto args = decode_hex("4449444c016c02617b627b01000102", error);
  ASSERT_TRUE(args.has_value()) << vellum::common::describe(error);
  ASSERT_EQ(args->size(), 1u);
  const auto* a = candid::find_field(args->front(), "a");
  const auto* b = candid::find_field(args->front(), "b");
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(std::get<uint64_t>(a->scalar), 1u);
  EXPECT_EQ(std::get<uint64_t>(b->scalar), 2u);
  EXPECT_EQ(candid::find_field(args->front(), "c"), nullptr);
}

TEST(candid_codec, decode_then_encode_reproduces_the_golden_transfer) {
  auto error = vellum::common::error{};
  auto args = decode_hex(vellum::testing::kGoldenTransferArg, error);
  ASSERT_TRUE(args.has_value()) << vellum::common::describe(error);
  EXPECT_EQ(encode_hex(*args), vellum::testing::kGoldenTransferArg);
}

TEST(candid_codec, every_truncation_of_a_message_is_rejected) {
  auto bytes = vellum::testing::hex(vellum::testing::kGoldenTransferArg);
  for (std::size_t size = 0; size < bytes.size(); ++size) {
    auto error = vellum::common::error{};
    auto prefix = vellum::schema::bytes_view_t{bytes.data(), size};
    EXPECT_FALSE(candid::decode(prefix, error)) << "size " << size;
    EXPECT_EQ(error.code, vellum::common::error_code::encoding);
    EXPECT_EQ(error.codespace, "vellum.candid");
  }
}

TEST(candid_codec, trailing_bytes_are_rejected) {
  auto error = vellum::common::error{};
  EXPECT_FALSE(decode_hex("4449444c00017e0100", error));
  EXPECT_EQ(error.log, "trailing bytes after arguments");
}

TEST(candid_codec, malformed_messages_are_rejected) {
  struct case_t final {
    std::string_view hex;
    std::string_view log;
  };
  const auto cases = std::array{
      case_t{"4449444d0000", "missing DIDL magic"},
      case_t{"4449444c00017e02", "invalid bool"},
      // opt whose element is the opt itself.
      case_t{"4449444c016e00010000", "recursive types are not supported"},
      // Record field ids 1 then 0.
      case_t{"4449444c016c0201710071010000",
             "field ids are not strictly increasing"},
      // Type reference 5 in a one entry table.
      case_t{"4449444c016e05010000", "type reference out of range"},
      case_t{"4449444c0001680000",
             "opaque principal references are not supported"},
      case_t{"4449444c016e7b010002", "invalid opt tag"},
      case_t{"4449444c016b01007f010001", "variant index out of range"},
      // func type in the table.
      case_t{"4449444c016a00000000", "func and service types are not supported"},
  };
  for (const auto& test : cases) {
    auto error = vellum::common::error{};
    EXPECT_FALSE(decode_hex(test.hex, error)) << test.hex;
    EXPECT_EQ(error.code, vellum::common::error_code::encoding) << test.hex;
    EXPECT_EQ(error.log, test.log) << test.hex;
  }
}

TEST(candid_codec, principal_longer_than_29_bytes_is_rejected) {
  auto message = std::string{"4449444c000168011e"} + std::string(60, '0');
  auto error = vellum::common::error{};
  EXPECT_FALSE(decode_hex(message, error));
  EXPECT_EQ(error.log, "principal is longer than 29 bytes");
}

namespace {

// `count` opt types, entry i wrapping entry i + 1 and the last wrapping
// null, with one argument of the outermost type set to none.
vellum::schema::bytes_t opt_chain_message(const int count) {
  auto message = vellum::schema::bytes_t{'D', 'I', 'D', 'L'};
  candid::write_uleb128(static_cast<uint64_t>(count), message);
  for (auto i = 0; i < count - 1; ++i) {
    message.push_back(0x6e);
    candid::write_sleb128(i + 1, message);
  }
  message.push_back(0x6e);
  candid::write_sleb128(-1, message);
  message.push_back(0x01);
  message.push_back(0x00);
  message.push_back(0x00);
  return message;
}

}  // namespace

TEST(candid_codec, type_nesting_is_bounded) {
  auto error = vellum::common::error{};
  constexpr auto kMaxDepth = static_cast<int>(candid::kMaxDepth);
  EXPECT_TRUE(candid::decode(opt_chain_message(kMaxDepth), error))
      << vellum::common::describe(error);

  EXPECT_FALSE(candid::decode(opt_chain_message(kMaxDepth + 1), error));
  EXPECT_EQ(error.log, "candid type nesting too deep");

  // Far deeper than any stack could resolve recursively.
  EXPECT_FALSE(candid::decode(opt_chain_message(400'000), error));
  EXPECT_EQ(error.log, "candid type nesting too deep");
  EXPECT_EQ(error.code, vellum::common::error_code::encoding);
}

TEST(candid_codec, type_nesting_is_bounded_when_entries_point_backwards) {
  // Entry i wraps entry i - 1, so every entry resolves from the memo.
  auto message = vellum::schema::bytes_t{'D', 'I', 'D', 'L'};
  constexpr auto kCount = 100'000;
  candid::write_uleb128(kCount, message);
  message.push_back(0x6e);
  candid::write_sleb128(-5, message);
  for (auto i = 1; i < kCount; ++i) {
    message.push_back(0x6e);
    candid::write_sleb128(i - 1, message);
  }
  message.push_back(0x00);
  auto error = vellum::common::error{};
  EXPECT_FALSE(candid::decode(message, error));
  EXPECT_EQ(error.log, "candid type nesting too deep");
}

TEST(candid_codec, values_without_input_are_budgeted) {
  // vec null with the largest accepted length decodes.
  auto error = vellum::common::error{};
  auto single = vellum::testing::hex("4449444c016d7f0100");
  candid::write_uleb128(65'536, single);
  auto values = candid::decode(single, error);
  ASSERT_TRUE(values.has_value()) << vellum::common::describe(error);
  EXPECT_EQ(values->front().items.size(), 65'536u);

  // vec (vec null): a few hundred bytes would otherwise expand into
  // millions of values.
  auto nested = vellum::testing::hex("4449444c026d7f6d000101");
  candid::write_uleb128(100, nested);
  for (auto i = 0; i < 100; ++i) {
    candid::write_uleb128(65'536, nested);
  }
  EXPECT_FALSE(candid::decode(nested, error));
  EXPECT_EQ(error.log, "candid message decodes to too many values");
  EXPECT_EQ(error.code, vellum::common::error_code::encoding);
}

TEST(candid_codec, large_blobs_fit_the_value_budget) {
  auto message = vellum::testing::hex("4449444c016d7b0100");
  constexpr auto kSize = 1 << 20;
  candid::write_uleb128(kSize, message);
  message.insert(message.end(), kSize, 0xab);
  auto error = vellum::common::error{};
  auto values = candid::decode(message, error);
  ASSERT_TRUE(values.has_value()) << vellum::common::describe(error);
  EXPECT_EQ(values->front().items.size(), static_cast<std::size_t>(kSize));
}
