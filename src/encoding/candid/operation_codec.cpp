#include <vellum/encoding/candid/codec.hpp>
#include <vellum/encoding/candid/operation_codec.hpp>
#include <vellum/encoding/candid/text.hpp>

#include <algorithm>
#include <initializer_list>
#include <limits>

namespace vellum::encoding::candid {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.candid"};

using namespace vellum::schema;

type_ptr_t prim(const type_code_t code) {
  return make_primitive_type(code);
}

type_ptr_t subaccount_type() {
  return make_vec_type(prim(type_code_t::nat8));
}

type_ptr_t timestamp_type() {
  return make_record_type({{"timestamp_nanos", prim(type_code_t::nat64)}});
}

type_ptr_t neuron_id_type() {
  return make_record_type({{"id", prim(type_code_t::nat64)}});
}

type_ptr_t tokens_type() {
  return make_record_type({{"e8s", prim(type_code_t::nat64)}});
}

type_ptr_t configure_operation_type() {
  auto principal = make_opt_type(prim(type_code_t::principal));
  return make_variant_type(
      {{"RemoveHotKey", make_record_type({{"hot_key_to_remove", principal}})},
       {"AddHotKey", make_record_type({{"new_hot_key", principal}})},
       {"StopDissolving", make_record_type({})},
       {"StartDissolving", make_record_type({})},
       {"IncreaseDissolveDelay",
        make_record_type({{"additional_dissolve_delay_seconds",
                           prim(type_code_t::nat32)}})}});
}

type_ptr_t command_type() {
  return make_variant_type(
      {{"Spawn",
        make_record_type(
            {{"new_controller", make_opt_type(prim(type_code_t::principal))}})},
       {"Split",
        make_record_type({{"amount_e8s", prim(type_code_t::nat64)}})},
       {"Configure",
        make_record_type(
            {{"operation", make_opt_type(configure_operation_type())}})},
       {"Merge",
        make_record_type(
            {{"source_neuron_id", make_opt_type(neuron_id_type())}})},
       {"MergeMaturity",
        make_record_type({{"percentage_to_merge", prim(type_code_t::nat32)}})},
       {"Disburse",
        make_record_type(
            {{"to_account",
              make_opt_type(make_record_type({{"hash", subaccount_type()}}))},
             {"amount", make_opt_type(tokens_type())}})}});
}

type_ptr_t neuron_id_or_subaccount_type() {
  return make_variant_type(
      {{"Subaccount", subaccount_type()}, {"NeuronId", neuron_id_type()}});
}

value_t tokens_value(const tokens_t& tokens) {
  return make_record({{"e8s", make_nat64(tokens.e8s)}});
}

value_t neuron_id_value(const uint64_t id) {
  return make_record({{"id", make_nat64(id)}});
}

value_t opt_subaccount_value(const std::optional<subaccount_t>& subaccount) {
  if (!subaccount) {
    return make_none(subaccount_type());
  }
  return make_some(make_blob(*subaccount));
}

value_t configure(const std::string_view name, value_t payload) {
  return make_variant(
      command_type(), "Configure",
      make_record({{"operation",
                    make_some(make_variant(configure_operation_type(), name,
                                           std::move(payload)))}}));
}

value_t command_value(const neuron_command_t& command) {
  return std::visit(
      overloaded{
          [](const add_hot_key_t& arg) {
            return configure(
                "AddHotKey",
                make_record({{"new_hot_key",
                              make_some(make_principal(arg.new_hot_key))}}));
          },
          [](const remove_hot_key_t& arg) {
            return configure(
                "RemoveHotKey",
                make_record(
                    {{"hot_key_to_remove",
                      make_some(make_principal(arg.hot_key_to_remove))}}));
          },
          [](const start_dissolving_t&) {
            return configure("StartDissolving", make_record({}));
          },
          [](const stop_dissolving_t&) {
            return configure("StopDissolving", make_record({}));
          },
          [](const increase_dissolve_delay_t& arg) {
            return configure(
                "IncreaseDissolveDelay",
                make_record({{"additional_dissolve_delay_seconds",
                              make_nat32(
                                  arg.additional_dissolve_delay_seconds)}}));
          },
          [](const disburse_t&) {
            return make_variant(
                command_type(), "Disburse",
                make_record(
                    {{"to_account",
                      make_none(make_record_type({{"hash", subaccount_type()}}))},
                     {"amount", make_none(tokens_type())}}));
          },
          [](const spawn_t&) {
            return make_variant(
                command_type(), "Spawn",
                make_record({{"new_controller",
                              make_none(prim(type_code_t::principal))}}));
          },
          [](const split_t& arg) {
            return make_variant(
                command_type(), "Split",
                make_record({{"amount_e8s", make_nat64(arg.amount.e8s)}}));
          },
          [](const merge_t& arg) {
            return make_variant(
                command_type(), "Merge",
                make_record({{"source_neuron_id",
                              make_some(neuron_id_value(
                                  arg.source_neuron_id))}}));
          },
          [](const merge_maturity_t& arg) {
            return make_variant(
                command_type(), "MergeMaturity",
                make_record({{"percentage_to_merge",
                              make_nat32(arg.percentage_to_merge)}}));
          }},
      command);
}

value_t operation_value(const operation_t& operation) {
  return std::visit(
      overloaded{
          [](const transfer_t& arg) {
            auto created_at =
                arg.created_at_time
                    ? make_some(make_record(
                          {{"timestamp_nanos",
                            make_nat64(*arg.created_at_time)}}))
                    : make_none(timestamp_type());
            return make_record(
                {{"memo", make_nat64(arg.memo)},
                 {"amount", tokens_value(arg.amount)},
                 {"fee", tokens_value(arg.fee)},
                 {"from_subaccount", opt_subaccount_value(arg.from_subaccount)},
                 {"to", make_text(to_text(arg.to))},
                 {"created_at_time", std::move(created_at)}});
          },
          [](const account_balance_t& arg) {
            return make_record({{"account", make_text(to_text(arg.account))}});
          },
          [](const notify_t& arg) {
            return make_record(
                {{"block_height", make_nat64(arg.block_height)},
                 {"max_fee", tokens_value(arg.max_fee)},
                 {"from_subaccount", opt_subaccount_value(arg.from_subaccount)},
                 {"to_canister", make_principal(arg.to_canister)},
                 {"to_subaccount", opt_subaccount_value(arg.to_subaccount)}});
          },
          [](const claim_or_refresh_neuron_t& arg) {
            auto controller =
                arg.controller ? make_some(make_principal(*arg.controller))
                               : make_none(prim(type_code_t::principal));
            return make_record({{"controller", std::move(controller)},
                                {"memo", make_nat64(arg.memo)}});
          },
          [](const manage_neuron_t& arg) {
            return make_record(
                {{"id", make_some(neuron_id_value(arg.neuron_id))},
                 {"command", make_some(command_value(arg.command))},
                 {"neuron_id_or_subaccount",
                  make_none(neuron_id_or_subaccount_type())}});
          },
          [](const list_neurons_t& arg) {
            auto ids = std::vector<value_t>{};
            ids.reserve(arg.neuron_ids.size());
            for (const auto id : arg.neuron_ids) {
              ids.push_back(make_nat64(id));
            }
            return make_record(
                {{"neuron_ids",
                  make_vec(prim(type_code_t::nat64), std::move(ids))},
                 {"include_neurons_readable_by_caller",
                  make_bool(arg.include_neurons_readable_by_caller)}});
          }},
      operation);
}

/// Reads typed fields out of decoded values, recording the first mismatch.
class shape final {
 public:
  explicit shape(vellum::common::error& error) : error_{error} {}

  bool ok() const { return ok_; }

  const value_t* field(const value_t* record, const std::string_view name) {
    if (!ok_) {
      return nullptr;
    }
    if (record == nullptr || record->type->code != type_code_t::record) {
      mismatch(name, "expected a record");
      return nullptr;
    }
    auto value = find_field(*record, name);
    if (value == nullptr) {
      mismatch(name, "missing field");
    }
    return value;
  }

  /// Present payload of an opt, nullptr for none or on mismatch.
  const value_t* opt(const value_t* value, const std::string_view name) {
    if (value == nullptr) {
      return nullptr;
    }
    if (value->type->code != type_code_t::opt) {
      mismatch(name, "expected an opt");
      return nullptr;
    }
    return value->items.empty() ? nullptr : &value->items.front();
  }

  const value_t* required(const value_t* value, const std::string_view name) {
    if (ok_ && value == nullptr) {
      mismatch(name, "missing value");
    }
    return value;
  }

  uint64_t nat(const value_t* value,
               const std::string_view name,
               const uint64_t max = std::numeric_limits<uint64_t>::max()) {
    if (value == nullptr) {
      return 0;
    }
    auto code = value->type->code;
    if (code != type_code_t::nat64 && code != type_code_t::nat32 &&
        code != type_code_t::nat) {
      mismatch(name, "expected a natural number");
      return 0;
    }
    auto number = std::get<uint64_t>(value->scalar);
    if (number > max) {
      mismatch(name, "natural number out of range");
      return 0;
    }
    return number;
  }

  bool boolean(const value_t* value, const std::string_view name) {
    if (value == nullptr) {
      return false;
    }
    if (value->type->code != type_code_t::boolean) {
      mismatch(name, "expected a bool");
      return false;
    }
    return std::get<bool>(value->scalar);
  }

  std::string text(const value_t* value, const std::string_view name) {
    if (value == nullptr) {
      return {};
    }
    if (value->type->code != type_code_t::text) {
      mismatch(name, "expected text");
      return {};
    }
    return std::get<std::string>(value->scalar);
  }

  principal_t principal(const value_t* value, const std::string_view name) {
    if (value == nullptr) {
      return {};
    }
    if (value->type->code != type_code_t::principal) {
      mismatch(name, "expected a principal");
      return {};
    }
    return std::get<principal_t>(value->scalar);
  }

  tokens_t tokens(const value_t* value, const std::string_view name) {
    return tokens_t{.e8s = nat(field(value, "e8s"), name)};
  }

  std::optional<subaccount_t> subaccount(const value_t* value,
                                         const std::string_view name) {
    auto payload = opt(value, name);
    if (payload == nullptr) {
      return std::nullopt;
    }
    auto blob = as_blob(*payload);
    if (!blob || blob->size() != 32) {
      mismatch(name, "expected a 32-byte subaccount");
      return std::nullopt;
    }
    auto out = subaccount_t{};
    std::ranges::copy(*blob, std::begin(out));
    return out;
  }

  /// Label name of a variant value among `names`.
  std::string_view variant(const value_t* value,
                           const std::string_view name,
                           std::initializer_list<std::string_view> names) {
    if (value == nullptr) {
      return {};
    }
    if (value->type->code != type_code_t::variant) {
      mismatch(name, "expected a variant");
      return {};
    }
    auto id = variant_label(*value);
    for (const auto candidate : names) {
      if (field_hash(candidate) == id) {
        return candidate;
      }
    }
    mismatch(name, "unsupported variant alternative");
    return {};
  }

  void mismatch(const std::string_view name, const std::string_view what) {
    if (!ok_) {
      return;
    }
    ok_ = false;
    vellum::common::fail(error_, vellum::common::error_code::encoding,
                         "unexpected argument shape",
                         std::string{name} + ": " + std::string{what},
                         kCodespace);
  }

 private:
  vellum::common::error& error_;
  bool ok_{true};
};

std::optional<neuron_command_t> read_command(shape& s, const value_t* command) {
  auto label = s.variant(command, "command",
                         {"Configure", "Disburse", "Spawn", "Split", "Merge",
                          "MergeMaturity"});
  if (!s.ok()) {
    return std::nullopt;
  }
  const auto* payload = &command->items.front();
  if (label == "Configure") {
    auto operation =
        s.required(s.opt(s.field(payload, "operation"), "operation"),
                   "operation");
    auto kind = s.variant(operation, "operation",
                          {"AddHotKey", "RemoveHotKey", "StartDissolving",
                           "StopDissolving", "IncreaseDissolveDelay"});
    if (!s.ok()) {
      return std::nullopt;
    }
    const auto* body = &operation->items.front();
    if (kind == "AddHotKey") {
      auto key = s.principal(
          s.required(s.opt(s.field(body, "new_hot_key"), "new_hot_key"),
                     "new_hot_key"),
          "new_hot_key");
      return neuron_command_t{add_hot_key_t{.new_hot_key = std::move(key)}};
    }
    if (kind == "RemoveHotKey") {
      auto key = s.principal(
          s.required(
              s.opt(s.field(body, "hot_key_to_remove"), "hot_key_to_remove"),
              "hot_key_to_remove"),
          "hot_key_to_remove");
      return neuron_command_t{
          remove_hot_key_t{.hot_key_to_remove = std::move(key)}};
    }
    if (kind == "StartDissolving") {
      return neuron_command_t{start_dissolving_t{}};
    }
    if (kind == "StopDissolving") {
      return neuron_command_t{stop_dissolving_t{}};
    }
    auto seconds = s.nat(s.field(body, "additional_dissolve_delay_seconds"),
                         "additional_dissolve_delay_seconds",
                         std::numeric_limits<uint32_t>::max());
    return neuron_command_t{increase_dissolve_delay_t{
        .additional_dissolve_delay_seconds = static_cast<uint32_t>(seconds)}};
  }
  if (label == "Disburse") {
    if (s.opt(s.field(payload, "to_account"), "to_account") != nullptr ||
        s.opt(s.field(payload, "amount"), "amount") != nullptr) {
      s.mismatch("Disburse", "only a full disburse to the controller is "
                             "supported");
    }
    return neuron_command_t{disburse_t{}};
  }
  if (label == "Spawn") {
    if (s.opt(s.field(payload, "new_controller"), "new_controller") !=
        nullptr) {
      s.mismatch("Spawn", "spawning to another controller is not supported");
    }
    return neuron_command_t{spawn_t{}};
  }
  if (label == "Split") {
    auto amount = s.nat(s.field(payload, "amount_e8s"), "amount_e8s");
    return neuron_command_t{split_t{.amount = tokens_t{.e8s = amount}}};
  }
  if (label == "Merge") {
    auto source = s.required(
        s.opt(s.field(payload, "source_neuron_id"), "source_neuron_id"),
        "source_neuron_id");
    auto id = s.nat(s.field(source, "id"), "source_neuron_id");
    return neuron_command_t{merge_t{.source_neuron_id = id}};
  }
  auto percentage = s.nat(s.field(payload, "percentage_to_merge"),
                          "percentage_to_merge",
                          std::numeric_limits<uint32_t>::max());
  return neuron_command_t{merge_maturity_t{
      .percentage_to_merge = static_cast<uint32_t>(percentage)}};
}

std::optional<operation_t> read_operation(const std::string_view method_name,
                                          const value_t& arg,
                                          vellum::common::error& error) {
  auto s = shape{error};
  auto result = std::optional<operation_t>{};

  if (method_name == "send_dfx") {
    auto to_text_value = s.text(s.field(&arg, "to"), "to");
    auto created_at = s.opt(s.field(&arg, "created_at_time"), "created_at_time");
    auto transfer = transfer_t{
        .memo = s.nat(s.field(&arg, "memo"), "memo"),
        .amount = s.tokens(s.field(&arg, "amount"), "amount"),
        .fee = s.tokens(s.field(&arg, "fee"), "fee"),
        .from_subaccount =
            s.subaccount(s.field(&arg, "from_subaccount"), "from_subaccount")};
    if (created_at != nullptr) {
      transfer.created_at_time =
          s.nat(s.field(created_at, "timestamp_nanos"), "timestamp_nanos");
    }
    if (!s.ok()) {
      return std::nullopt;
    }
    auto to = try_parse_account_identifier(to_text_value, error);
    if (!to) {
      return std::nullopt;
    }
    transfer.to = *to;
    result = transfer;
  } else if (method_name == "account_balance_dfx") {
    auto account_text = s.text(s.field(&arg, "account"), "account");
    if (!s.ok()) {
      return std::nullopt;
    }
    auto account = try_parse_account_identifier(account_text, error);
    if (!account) {
      return std::nullopt;
    }
    result = account_balance_t{.account = *account};
  } else if (method_name == "notify_dfx") {
    auto notify = notify_t{
        .block_height = s.nat(s.field(&arg, "block_height"), "block_height"),
        .max_fee = s.tokens(s.field(&arg, "max_fee"), "max_fee"),
        .from_subaccount =
            s.subaccount(s.field(&arg, "from_subaccount"), "from_subaccount"),
        .to_canister =
            s.principal(s.field(&arg, "to_canister"), "to_canister"),
        .to_subaccount =
            s.subaccount(s.field(&arg, "to_subaccount"), "to_subaccount")};
    result = notify;
  } else if (method_name == "claim_or_refresh_neuron_from_account") {
    auto claim = claim_or_refresh_neuron_t{
        .memo = s.nat(s.field(&arg, "memo"), "memo")};
    if (auto controller = s.opt(s.field(&arg, "controller"), "controller")) {
      claim.controller = s.principal(controller, "controller");
    }
    result = claim;
  } else if (method_name == "manage_neuron") {
    auto id = s.required(s.opt(s.field(&arg, "id"), "id"), "id");
    auto neuron_id = s.nat(s.field(id, "id"), "id");
    auto command =
        s.required(s.opt(s.field(&arg, "command"), "command"), "command");
    if (s.opt(s.field(&arg, "neuron_id_or_subaccount"),
              "neuron_id_or_subaccount") != nullptr) {
      s.mismatch("neuron_id_or_subaccount",
                 "neurons are addressed by id only");
    }
    if (!s.ok()) {
      return std::nullopt;
    }
    auto parsed = read_command(s, command);
    if (!parsed) {
      return std::nullopt;
    }
    result = manage_neuron_t{.neuron_id = neuron_id,
                             .command = std::move(*parsed)};
  } else if (method_name == "list_neurons") {
    auto list = list_neurons_t{};
    auto ids = s.field(&arg, "neuron_ids");
    if (ids != nullptr && ids->type->code != type_code_t::vec) {
      s.mismatch("neuron_ids", "expected a vec");
    } else if (ids != nullptr) {
      for (const auto& id : ids->items) {
        list.neuron_ids.push_back(s.nat(&id, "neuron_ids"));
      }
    }
    list.include_neurons_readable_by_caller =
        s.boolean(s.field(&arg, "include_neurons_readable_by_caller"),
                  "include_neurons_readable_by_caller");
    result = std::move(list);
  } else {
    vellum::common::fail(error, vellum::common::error_code::encoding,
                         "unknown method", std::string{method_name},
                         kCodespace);
    return std::nullopt;
  }

  if (!s.ok()) {
    return std::nullopt;
  }
  return result;
}

}  // namespace

std::vector<value_t> to_values(const operation_t& operation) {
  auto values = std::vector<value_t>{};
  values.push_back(operation_value(operation));
  return values;
}

bytes_t encode_operation(const operation_t& operation) {
  return encode(to_values(operation));
}

std::optional<operation_t> decode_operation(const principal_t& canister_id,
                                            const std::string_view method_name,
                                            const std::vector<value_t>& args,
                                            vellum::common::error& error) {
  if (args.size() != 1) {
    vellum::common::fail(error, vellum::common::error_code::encoding,
                         "expected exactly one argument",
                         std::to_string(args.size()), kCodespace);
    return std::nullopt;
  }
  auto operation = read_operation(method_name, args.front(), error);
  if (!operation) {
    return std::nullopt;
  }
  auto method = method_of(*operation);
  if (method.canister_id != canister_id) {
    vellum::common::fail(error, vellum::common::error_code::encoding,
                         "method is not served by this canister",
                         to_text(canister_id), kCodespace);
    return std::nullopt;
  }
  return operation;
}

}  // namespace vellum::encoding::candid
