#include <gtest/gtest.h>
#include <vellum/encoding/candid/codec.hpp>
#include <vellum/encoding/candid/operation_codec.hpp>
#include <vellum/testing/fixtures.hpp>

namespace candid = vellum::encoding::candid;

namespace {

vellum::schema::account_identifier_t anonymous_account() {
  return vellum::schema::derive_account_identifier(
      vellum::schema::make_anonymous_principal());
}

std::vector<vellum::schema::operation_t> sample_operations() {
  auto subaccount = vellum::schema::subaccount_t{};
  subaccount.fill(0x11);
  auto hot_key = vellum::schema::make_anonymous_principal();
  return {
      vellum::schema::transfer_t{.memo = 42,
                                 .amount = {.e8s = 250'000'000},
                                 .to = anonymous_account()},
      vellum::schema::transfer_t{.memo = 7,
                                 .amount = {.e8s = 1},
                                 .fee = {.e8s = 20'000},
                                 .from_subaccount = subaccount,
                                 .to = anonymous_account(),
                                 .created_at_time = 1'700'000'000'000'000'000},
      vellum::schema::account_balance_t{.account = anonymous_account()},
      vellum::schema::notify_t{.block_height = 1234,
                               .to_canister =
                                   vellum::schema::governance_canister_id(),
                               .to_subaccount = subaccount},
      vellum::schema::claim_or_refresh_neuron_t{.memo = 1,
                                                .controller = hot_key},
      vellum::schema::claim_or_refresh_neuron_t{.memo = 2},
      vellum::schema::manage_neuron_t{
          .neuron_id = 99, .command = vellum::schema::add_hot_key_t{hot_key}},
      vellum::schema::manage_neuron_t{
          .neuron_id = 99,
          .command = vellum::schema::remove_hot_key_t{hot_key}},
      vellum::schema::manage_neuron_t{
          .neuron_id = 99, .command = vellum::schema::start_dissolving_t{}},
      vellum::schema::manage_neuron_t{
          .neuron_id = 99, .command = vellum::schema::stop_dissolving_t{}},
      vellum::schema::manage_neuron_t{
          .neuron_id = 99,
          .command = vellum::schema::increase_dissolve_delay_t{86'400}},
      vellum::schema::manage_neuron_t{
          .neuron_id = 99, .command = vellum::schema::disburse_t{}},
      vellum::schema::manage_neuron_t{
          .neuron_id = 99, .command = vellum::schema::spawn_t{}},
      vellum::schema::manage_neuron_t{
          .neuron_id = 99,
          .command = vellum::schema::split_t{{.e8s = 500'000'000}}},
      vellum::schema::manage_neuron_t{
          .neuron_id = 99, .command = vellum::schema::merge_t{12}},
      vellum::schema::manage_neuron_t{
          .neuron_id = 99, .command = vellum::schema::merge_maturity_t{50}},
      vellum::schema::list_neurons_t{},
      vellum::schema::list_neurons_t{
          .neuron_ids = {1, 2, 3}, .include_neurons_readable_by_caller = false},
  };
}

}  // namespace

TEST(operation_codec, golden_transfer_argument_bytes) {
  auto transfer = vellum::schema::transfer_t{
      .memo = 42, .amount = {.e8s = 250'000'000}, .to = anonymous_account()};
  EXPECT_EQ(vellum::schema::to_hex(candid::encode_operation(transfer)),
            vellum::testing::kGoldenTransferArg);
}

TEST(operation_codec, every_operation_decodes_back_from_its_argument) {
  for (const auto& operation : sample_operations()) {
    auto method = vellum::schema::method_of(operation);
    auto error = vellum::common::error{};
    auto args = candid::decode(candid::encode_operation(operation), error);
    ASSERT_TRUE(args.has_value()) << vellum::common::describe(error);
    auto decoded = candid::decode_operation(method.canister_id,
                                            method.method_name, *args, error);
    ASSERT_TRUE(decoded.has_value())
        << method.method_name << ": " << vellum::common::describe(error);
    EXPECT_EQ(*decoded, operation) << method.method_name;
  }
}

TEST(operation_codec, routing_of_operations) {
  auto ledger = vellum::schema::ledger_canister_id();
  auto governance = vellum::schema::governance_canister_id();
  auto operations = sample_operations();

  auto transfer = vellum::schema::method_of(operations[0]);
  EXPECT_EQ(transfer.canister_id, ledger);
  EXPECT_EQ(transfer.method_name, "send_dfx");
  EXPECT_EQ(transfer.call_type, vellum::schema::call_type_t::update);

  auto balance = vellum::schema::method_of(operations[2]);
  EXPECT_EQ(balance.canister_id, ledger);
  EXPECT_EQ(balance.method_name, "account_balance_dfx");
  EXPECT_EQ(balance.call_type, vellum::schema::call_type_t::query);

  auto claim = vellum::schema::method_of(operations[4]);
  EXPECT_EQ(claim.canister_id, governance);
  EXPECT_EQ(claim.method_name, "claim_or_refresh_neuron_from_account");

  auto list = vellum::schema::method_of(operations.back());
  EXPECT_EQ(list.canister_id, governance);
  EXPECT_EQ(list.method_name, "list_neurons");
  EXPECT_EQ(list.call_type, vellum::schema::call_type_t::query);
}

TEST(operation_codec, wrong_canister_or_method_is_rejected) {
  auto error = vellum::common::error{};
  auto args = candid::to_values(vellum::schema::transfer_t{
      .memo = 1, .amount = {.e8s = 1}, .to = anonymous_account()});
  EXPECT_FALSE(candid::decode_operation(
      vellum::schema::governance_canister_id(), "send_dfx", args, error));
  EXPECT_EQ(error.code, vellum::common::error_code::encoding);

  EXPECT_FALSE(candid::decode_operation(vellum::schema::ledger_canister_id(),
                                        "transfer", args, error));
  EXPECT_EQ(error.log, "unknown method");

  EXPECT_FALSE(candid::decode_operation(vellum::schema::ledger_canister_id(),
                                        "send_dfx", {}, error));
}

TEST(operation_codec, argument_of_another_method_does_not_match) {
  auto error = vellum::common::error{};
  auto args = candid::to_values(
      vellum::schema::account_balance_t{.account = anonymous_account()});
  EXPECT_FALSE(candid::decode_operation(vellum::schema::ledger_canister_id(),
                                        "send_dfx", args, error));
  EXPECT_EQ(error.code, vellum::common::error_code::encoding);
}
