#include <vellum/encoding/candid/codec.hpp>
#include <vellum/encoding/candid/operation_codec.hpp>
#include <vellum/request/builder.hpp>

#include <spdlog/spdlog.h>

#include <limits>

namespace vellum::request {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.builder"};
constexpr auto kMaxNeuronNameLength = std::size_t{8};

using namespace vellum::schema;

std::nullopt_t reject(vellum::common::error& error,
                      std::string log,
                      const std::string_view info) {
  vellum::common::fail(error, vellum::common::error_code::input,
                       std::move(log), std::string{info}, kCodespace);
  spdlog::warn("Rejected input: {} ({})", error.log, error.info);
  return std::nullopt;
}

std::optional<tokens_t> parse_fee(const std::optional<std::string>& fee,
                                  vellum::common::error& error) {
  if (!fee) {
    return tokens_t{.e8s = kDefaultTransactionFee};
  }
  return try_parse_tokens(*fee, error);
}

/// Absent is fine; present must be a valid 32-byte subaccount.
bool parse_optional_subaccount(const std::optional<std::string>& text,
                               std::optional<subaccount_t>& out,
                               vellum::common::error& error) {
  if (!text) {
    return true;
  }
  out = try_parse_subaccount(*text, error);
  return out.has_value();
}

std::optional<uint32_t> parse_u32(const std::string_view text,
                                  const std::string_view what,
                                  vellum::common::error& error) {
  auto value = try_parse_u64(text, what, error);
  if (!value) {
    return std::nullopt;
  }
  if (*value > std::numeric_limits<uint32_t>::max()) {
    return reject(error, std::string{what} + " does not fit in 32 bits", text);
  }
  return static_cast<uint32_t>(*value);
}

}  // namespace

canister_call_t make_canister_call(const operation_t& operation) {
  auto method = method_of(operation);
  auto call = canister_call_t{
      .canister_id = method.canister_id,
      .method_name = std::string{method.method_name},
      .call_type = method.call_type,
      .operation = operation,
      .arg = vellum::encoding::candid::encode_operation(operation)};
  spdlog::debug("Built {} call to {} on {}", to_string(call.call_type),
                call.method_name, to_text(call.canister_id));
  return call;
}

std::optional<canister_call_t> build_transfer(const transfer_request_t& request,
                                              vellum::common::error& error) {
  auto transfer = transfer_t{};
  auto to = try_parse_account_identifier(request.to, error);
  if (!to) {
    return std::nullopt;
  }
  transfer.to = *to;

  auto amount = try_parse_tokens(request.amount, error);
  if (!amount) {
    return std::nullopt;
  }
  transfer.amount = *amount;

  auto fee = parse_fee(request.fee, error);
  if (!fee) {
    return std::nullopt;
  }
  transfer.fee = *fee;
  // amount + fee leaves the sender's account; it must stay representable.
  if (!checked_add(transfer.amount, transfer.fee, error)) {
    return std::nullopt;
  }

  if (request.memo) {
    auto memo = try_parse_u64(*request.memo, "memo", error);
    if (!memo) {
      return std::nullopt;
    }
    transfer.memo = *memo;
  }
  if (!parse_optional_subaccount(request.from_subaccount,
                                 transfer.from_subaccount, error)) {
    return std::nullopt;
  }
  if (request.created_at_time) {
    auto created_at =
        try_parse_u64(*request.created_at_time, "created_at_time", error);
    if (!created_at) {
      return std::nullopt;
    }
    transfer.created_at_time = *created_at;
  }
  return make_canister_call(transfer);
}

std::optional<canister_call_t> build_account_balance(
    const std::string_view account,
    vellum::common::error& error) {
  auto parsed = try_parse_account_identifier(account, error);
  if (!parsed) {
    return std::nullopt;
  }
  return make_canister_call(account_balance_t{.account = *parsed});
}

std::optional<canister_call_t> build_notify(const notify_request_t& request,
                                            vellum::common::error& error) {
  auto notify = notify_t{};
  auto block_height =
      try_parse_u64(request.block_height, "block height", error);
  if (!block_height) {
    return std::nullopt;
  }
  notify.block_height = *block_height;

  auto to_canister = try_parse_principal(request.to_canister, error);
  if (!to_canister) {
    return std::nullopt;
  }
  notify.to_canister = std::move(*to_canister);

  auto max_fee = parse_fee(request.max_fee, error);
  if (!max_fee) {
    return std::nullopt;
  }
  notify.max_fee = *max_fee;

  if (!parse_optional_subaccount(request.from_subaccount,
                                 notify.from_subaccount, error) ||
      !parse_optional_subaccount(request.to_subaccount, notify.to_subaccount,
                                 error)) {
    return std::nullopt;
  }
  return make_canister_call(notify);
}

std::optional<uint64_t> neuron_name_to_nonce(const std::string_view name,
                                             vellum::common::error& error) {
  if (name.size() > kMaxNeuronNameLength) {
    return reject(error, "neuron name must be 8 characters or less", name);
  }
  auto nonce = uint64_t{0};
  for (const auto c : name) {
    if (static_cast<uint8_t>(c) > 0x7F) {
      return reject(error, "neuron name must be ASCII", name);
    }
    nonce = (nonce << 8u) | static_cast<uint8_t>(c);
  }
  return nonce;
}

std::optional<std::vector<canister_call_t>> build_neuron_stake(
    const neuron_stake_request_t& request,
    vellum::common::error& error) {
  if (request.name && request.nonce) {
    return reject(error, "neuron name and nonce are mutually exclusive",
                  *request.name);
  }
  auto nonce = std::optional<uint64_t>{};
  if (request.nonce) {
    nonce = try_parse_u64(*request.nonce, "neuron nonce", error);
  } else if (request.name) {
    nonce = neuron_name_to_nonce(*request.name, error);
  } else {
    return reject(error, "either a neuron name or a nonce is required", {});
  }
  if (!nonce) {
    return std::nullopt;
  }

  auto calls = std::vector<canister_call_t>{};
  if (request.amount) {
    auto staking_account = derive_account_identifier(
        governance_canister_id(),
        make_neuron_staking_subaccount(request.controller, *nonce));
    auto transfer = build_transfer(
        transfer_request_t{.to = to_text(staking_account),
                           .amount = *request.amount,
                           .fee = request.fee,
                           .memo = std::to_string(*nonce)},
        error);
    if (!transfer) {
      return std::nullopt;
    }
    calls.push_back(std::move(*transfer));
  } else if (request.fee) {
    return reject(error, "a fee only applies when staking an amount",
                  *request.fee);
  }

  calls.push_back(make_canister_call(claim_or_refresh_neuron_t{
      .memo = *nonce, .controller = request.controller}));
  return calls;
}

std::optional<std::vector<canister_call_t>> build_manage_neuron(
    const manage_neuron_request_t& request,
    vellum::common::error& error) {
  auto neuron_id = try_parse_u64(request.neuron_id, "neuron id", error);
  if (!neuron_id) {
    return std::nullopt;
  }

  auto commands = std::vector<neuron_command_t>{};
  if (request.add_hot_key) {
    auto key = try_parse_principal(*request.add_hot_key, error);
    if (!key) {
      return std::nullopt;
    }
    commands.emplace_back(add_hot_key_t{.new_hot_key = std::move(*key)});
  }
  if (request.remove_hot_key) {
    auto key = try_parse_principal(*request.remove_hot_key, error);
    if (!key) {
      return std::nullopt;
    }
    commands.emplace_back(
        remove_hot_key_t{.hot_key_to_remove = std::move(*key)});
  }
  if (request.stop_dissolving) {
    commands.emplace_back(stop_dissolving_t{});
  }
  if (request.start_dissolving) {
    commands.emplace_back(start_dissolving_t{});
  }
  if (request.additional_dissolve_delay_seconds) {
    auto seconds = parse_u32(*request.additional_dissolve_delay_seconds,
                             "dissolve delay", error);
    if (!seconds) {
      return std::nullopt;
    }
    commands.emplace_back(increase_dissolve_delay_t{
        .additional_dissolve_delay_seconds = *seconds});
  }
  if (request.disburse) {
    commands.emplace_back(disburse_t{});
  }
  if (request.spawn) {
    commands.emplace_back(spawn_t{});
  }
  if (request.split) {
    auto whole = try_parse_u64(*request.split, "split amount", error);
    if (!whole) {
      return std::nullopt;
    }
    auto amount = checked_from_whole_tokens(*whole, error);
    if (!amount) {
      return std::nullopt;
    }
    commands.emplace_back(split_t{.amount = *amount});
  }
  if (request.merge_from_neuron) {
    auto source =
        try_parse_u64(*request.merge_from_neuron, "source neuron id", error);
    if (!source) {
      return std::nullopt;
    }
    commands.emplace_back(merge_t{.source_neuron_id = *source});
  }
  if (request.merge_maturity) {
    auto percentage =
        parse_u32(*request.merge_maturity, "merge maturity percentage", error);
    if (!percentage) {
      return std::nullopt;
    }
    if (*percentage == 0 || *percentage > 100) {
      return reject(error, "percentage to merge must be between 1 and 100",
                    *request.merge_maturity);
    }
    commands.emplace_back(merge_maturity_t{.percentage_to_merge = *percentage});
  }

  if (commands.empty()) {
    return reject(error, "no neuron command given", request.neuron_id);
  }
  auto calls = std::vector<canister_call_t>{};
  calls.reserve(commands.size());
  for (auto& command : commands) {
    calls.push_back(make_canister_call(
        manage_neuron_t{.neuron_id = *neuron_id, .command = std::move(command)}));
  }
  return calls;
}

std::optional<canister_call_t> build_list_neurons(
    const std::vector<std::string>& neuron_ids,
    vellum::common::error& error) {
  auto list = list_neurons_t{};
  for (const auto& text : neuron_ids) {
    auto id = try_parse_u64(text, "neuron id", error);
    if (!id) {
      return std::nullopt;
    }
    list.neuron_ids.push_back(*id);
  }
  list.include_neurons_readable_by_caller = list.neuron_ids.empty();
  return make_canister_call(list);
}

std::optional<canister_call_t> build_raw_call(
    const std::string_view canister_id,
    const std::string_view method_name,
    bytes_t arg,
    const call_type_t call_type,
    vellum::common::error& error) {
  auto canister = try_parse_principal(canister_id, error);
  if (!canister) {
    return std::nullopt;
  }
  if (method_name.empty()) {
    return reject(error, "method name must not be empty", method_name);
  }
  if (!vellum::encoding::candid::decode(arg, error)) {
    return std::nullopt;
  }
  return canister_call_t{.canister_id = std::move(*canister),
                         .method_name = std::string{method_name},
                         .call_type = call_type,
                         .arg = std::move(arg)};
}

}  // namespace vellum::request
