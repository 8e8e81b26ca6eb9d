#include <gtest/gtest.h>
#include <vellum/encoding/candid/codec.hpp>
#include <vellum/encoding/candid/text.hpp>
#include <vellum/testing/fixtures.hpp>

namespace candid = vellum::encoding::candid;

TEST(candid_text, group_digits_inserts_separators_every_three_digits) {
  EXPECT_EQ(candid::group_digits("0"), "0");
  EXPECT_EQ(candid::group_digits("999"), "999");
  EXPECT_EQ(candid::group_digits("1000"), "1_000");
  EXPECT_EQ(candid::group_digits("250000000"), "250_000_000");
}

TEST(candid_text, known_labels_are_named) {
  EXPECT_EQ(candid::field_name(candid::field_hash("memo")),
            std::optional<std::string_view>{"memo"});
  EXPECT_EQ(candid::field_name(candid::field_hash("percentage_to_merge")),
            std::optional<std::string_view>{"percentage_to_merge"});
  EXPECT_FALSE(candid::field_name(candid::field_hash("not_a_known_label")));
}

TEST(candid_text, scalars) {
  EXPECT_EQ(candid::to_text(candid::make_nat64(250'000'000)),
            "250_000_000 : nat64");
  EXPECT_EQ(candid::to_text(candid::make_bool(false)), "false");
  EXPECT_EQ(candid::to_text(candid::make_text("a\"b")), "\"a\\\"b\"");
  EXPECT_EQ(candid::to_text(candid::make_principal(
                vellum::schema::make_anonymous_principal())),
            "principal \"2vxsx-fae\"");
  EXPECT_EQ(candid::to_text(candid::make_none(
                candid::make_primitive_type(candid::type_code_t::nat64))),
            "null");
  EXPECT_EQ(candid::to_text(candid::make_some(candid::make_nat8(7))),
            "opt 7 : nat8");
  EXPECT_EQ(candid::to_text(candid::make_blob(vellum::schema::bytes_t{
                'o', 'k', 0x00, 0xff})),
            "blob \"ok\\00\\ff\"");
}

TEST(candid_text, records_and_variants) {
  auto record = candid::make_record({{"memo", candid::make_nat64(42)},
                                     {"unlisted", candid::make_bool(true)}});
  // Unknown labels fall back to their id.
  EXPECT_EQ(candid::to_text(record),
            "record { memo = 42 : nat64; " +
                std::to_string(candid::field_hash("unlisted")) +
                " = true; }");

  auto variant_type = candid::make_variant_type(
      {{"StopDissolving", candid::make_primitive_type(candid::type_code_t::null)},
       {"Split", candid::make_record_type(
                     {{"amount_e8s", candid::make_primitive_type(
                                         candid::type_code_t::nat64)}})}});
  EXPECT_EQ(candid::to_text(candid::make_variant(variant_type, "StopDissolving",
                                                 candid::make_null())),
            "variant { StopDissolving }");
  EXPECT_EQ(candid::to_text(candid::make_variant(
                variant_type, "Split",
                candid::make_record({{"amount_e8s", candid::make_nat64(1)}}))),
            "variant { Split = record { amount_e8s = 1 : nat64; } }");
}

TEST(candid_text, golden_transfer_arguments) {
  auto error = vellum::common::error{};
  auto args = candid::decode(
      vellum::testing::hex(vellum::testing::kGoldenTransferArg), error);
  ASSERT_TRUE(args.has_value()) << vellum::common::describe(error);
  auto text = candid::to_text(*args);
  EXPECT_EQ(text.front(), '(');
  EXPECT_EQ(text.back(), ')');
  EXPECT_NE(text.find("memo = 42 : nat64"), std::string::npos) << text;
  EXPECT_NE(text.find("amount = record { e8s = 250_000_000 : nat64; }"),
            std::string::npos)
      << text;
  EXPECT_NE(text.find("fee = record { e8s = 10_000 : nat64; }"),
            std::string::npos)
      << text;
  EXPECT_NE(text.find(std::string{"to = \""} +
                      std::string{vellum::testing::kAnonymousAccount} + "\""),
            std::string::npos)
      << text;
  EXPECT_NE(text.find("from_subaccount = null"), std::string::npos) << text;
}
