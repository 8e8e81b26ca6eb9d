#pragma once
#include <vellum/common/error.hpp>
#include <vellum/schema/call_type.hpp>
#include <vellum/schema/operation.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/schema/principal.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Request builder: validates user supplied strings and turns them into typed
// operations with their canister, method and Candid argument. Pure; no key,
// clock or network access.
namespace vellum::request {

struct canister_call_t final {
  vellum::schema::principal_t canister_id;
  std::string method_name;
  vellum::schema::call_type_t call_type{vellum::schema::call_type_t::update};
  /// Unset for raw calls whose argument this tool does not model.
  std::optional<vellum::schema::operation_t> operation;
  vellum::schema::bytes_t arg;

  bool operator==(const canister_call_t&) const = default;
};

canister_call_t make_canister_call(const vellum::schema::operation_t& operation);

struct transfer_request_t final {
  /// Destination account identifier, 64 hex characters.
  std::string to;
  /// Tokens, "N" or "N.F".
  std::string amount;
  /// Tokens; 0.0001 when unset.
  std::optional<std::string> fee;
  std::optional<std::string> memo;
  /// 64 hex characters.
  std::optional<std::string> from_subaccount;
  /// Nanoseconds since the Unix epoch.
  std::optional<std::string> created_at_time;
};

struct notify_request_t final {
  std::string block_height;
  std::string to_canister;
  std::optional<std::string> max_fee;
  std::optional<std::string> from_subaccount;
  std::optional<std::string> to_subaccount;
};

struct neuron_stake_request_t final {
  /// Signer of the stake; owns the staking subaccount and the neuron.
  vellum::schema::principal_t controller;
  /// At most 8 ASCII characters. Exactly one of `name` and `nonce` is set.
  std::optional<std::string> name;
  std::optional<std::string> nonce;
  /// Tokens to transfer into the staking account before claiming.
  std::optional<std::string> amount;
  std::optional<std::string> fee;
};

/// Every set option becomes one manage_neuron call, in declaration order.
struct manage_neuron_request_t final {
  std::string neuron_id;
  std::optional<std::string> add_hot_key;
  std::optional<std::string> remove_hot_key;
  bool stop_dissolving{false};
  bool start_dissolving{false};
  std::optional<std::string> additional_dissolve_delay_seconds;
  bool disburse{false};
  bool spawn{false};
  /// Whole tokens to split off into a new neuron.
  std::optional<std::string> split;
  std::optional<std::string> merge_from_neuron;
  /// 1..100.
  std::optional<std::string> merge_maturity;
};

std::optional<canister_call_t> build_transfer(const transfer_request_t& request,
                                              vellum::common::error& error);

std::optional<canister_call_t> build_account_balance(
    std::string_view account,
    vellum::common::error& error);

std::optional<canister_call_t> build_notify(const notify_request_t& request,
                                            vellum::common::error& error);

/// The claim call, preceded by the funding transfer when an amount is given.
std::optional<std::vector<canister_call_t>> build_neuron_stake(
    const neuron_stake_request_t& request,
    vellum::common::error& error);

std::optional<std::vector<canister_call_t>> build_manage_neuron(
    const manage_neuron_request_t& request,
    vellum::common::error& error);

/// With no ids the query covers every neuron readable by the caller.
std::optional<canister_call_t> build_list_neurons(
    const std::vector<std::string>& neuron_ids,
    vellum::common::error& error);

/// Arbitrary method call; `arg` must be a well formed Candid message.
std::optional<canister_call_t> build_raw_call(
    std::string_view canister_id,
    std::string_view method_name,
    vellum::schema::bytes_t arg,
    vellum::schema::call_type_t call_type,
    vellum::common::error& error);

/// Neuron name packed big-endian into the low bytes of a u64.
std::optional<uint64_t> neuron_name_to_nonce(std::string_view name,
                                             vellum::common::error& error);

}  // namespace vellum::request
