#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <vellum/common/error.hpp>
#include <vellum/crypto/key_signer.hpp>
#include <vellum/request/builder.hpp>
#include <vellum/request/envelope.hpp>
#include <vellum/request/expiry_policy.hpp>
#include <vellum/request/message_file.hpp>
#include <vellum/request/signing.hpp>
#include <vellum/schema/account_identifier.hpp>
#include <vellum/schema/principal.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

constexpr auto kCodespace = std::string_view{"vellum.cli"};

int report(const vellum::common::error& error) {
  spdlog::error("{}", vellum::common::describe(error));
  return 1;
}

std::optional<std::string> get_optional(const po::variables_map& vm,
                                        const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<std::string>();
}

std::optional<std::string> get_required(const po::variables_map& vm,
                                        const std::string& name,
                                        vellum::common::error& error) {
  if (!vm.contains(name)) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "missing required option", "--" + name, kCodespace);
    return std::nullopt;
  }
  return vm[name].as<std::string>();
}

// "-" reads standard input.
std::optional<std::string> read_file(const std::string& path,
                                     vellum::common::error& error) {
  if (path == "-") {
    return std::string{std::istreambuf_iterator<char>{std::cin},
                       std::istreambuf_iterator<char>{}};
  }
  auto stream = std::ifstream{path, std::ios::binary};
  if (!stream) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "cannot open file", path, kCodespace);
    return std::nullopt;
  }
  auto buffer = std::ostringstream{};
  buffer << stream.rdbuf();
  return buffer.str();
}

bool write_output(const po::variables_map& vm,
                  const std::string& text,
                  vellum::common::error& error) {
  auto path = get_optional(vm, "output");
  if (!path || *path == "-") {
    std::cout << text << '\n';
    return true;
  }
  auto stream = std::ofstream{*path, std::ios::binary | std::ios::trunc};
  if (!stream) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "cannot open output file", *path, kCodespace);
    return false;
  }
  stream << text << '\n';
  if (!stream.flush()) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "cannot write output file", *path, kCodespace);
    return false;
  }
  spdlog::debug("Wrote message file {}", *path);
  return true;
}

std::optional<vellum::crypto::key_signer> load_signer(
    const po::variables_map& vm,
    vellum::common::error& error) {
  auto path = get_required(vm, "pem-file", error);
  if (!path) {
    return std::nullopt;
  }
  auto pem = read_file(*path, error);
  if (!pem) {
    return std::nullopt;
  }
  auto signer = vellum::crypto::key_signer::from_pem(*pem, error);
  // The key text is not needed past this point.
  std::fill(std::begin(*pem), std::end(*pem), '\0');
  return signer;
}

std::optional<vellum::request::expiry_policy_t> load_policy(
    const po::variables_map& vm,
    vellum::common::error& error) {
  if (!vm.contains("ingress-expiry-seconds")) {
    return vellum::request::expiry_policy_t{};
  }
  auto seconds = vm["ingress-expiry-seconds"].as<uint64_t>();
  if (seconds > static_cast<uint64_t>(std::chrono::seconds::max().count())) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "ingress expiry is out of range",
                         std::to_string(seconds), kCodespace);
    return std::nullopt;
  }
  return vellum::request::with_expiry_offset(
      std::chrono::seconds{static_cast<std::chrono::seconds::rep>(seconds)},
      error);
}

// Signs every call with one clock reading and writes the message file.
int sign_and_write(const po::variables_map& vm,
                   const vellum::crypto::key_signer& signer,
                   const std::vector<vellum::request::canister_call_t>& calls) {
  auto error = vellum::common::error{};
  auto policy = load_policy(vm, error);
  if (!policy) {
    return report(error);
  }
  auto now = vellum::request::now_nanoseconds();
  auto messages = std::vector<vellum::request::signed_message_t>{};
  messages.reserve(calls.size());
  for (const auto& call : calls) {
    auto metadata = vellum::request::make_call_metadata(call.call_type, now,
                                                        *policy, error);
    if (!metadata) {
      return report(error);
    }
    auto message = vellum::request::sign_call(signer, call, *metadata, error);
    if (!message) {
      return report(error);
    }
    spdlog::debug("Signed {} {} request {}", call.method_name,
                  vellum::schema::to_string(call.call_type),
                  vellum::schema::to_hex(message->ingress.request_id));
    messages.push_back(std::move(*message));
  }
  if (!write_output(vm, vellum::request::write_message_file(messages),
                    error)) {
    return report(error);
  }
  return 0;
}

int sign_and_write(const po::variables_map& vm,
                   const vellum::request::canister_call_t& call) {
  auto error = vellum::common::error{};
  auto signer = load_signer(vm, error);
  if (!signer) {
    return report(error);
  }
  return sign_and_write(vm, *signer, {call});
}

int run_public_ids(const po::variables_map& vm) {
  auto error = vellum::common::error{};
  auto signer = load_signer(vm, error);
  if (!signer) {
    return report(error);
  }
  auto account = vellum::schema::derive_account_identifier(signer->principal());
  std::cout << "Principal id: " << vellum::schema::to_text(signer->principal())
            << '\n'
            << "Account id: " << vellum::schema::to_text(account) << '\n'
            << "Scheme: " << vellum::crypto::to_string(signer->scheme())
            << '\n';
  return 0;
}

int run_account_id(const po::variables_map& vm) {
  auto error = vellum::common::error{};
  auto principal = std::optional<vellum::schema::principal_t>{};
  if (auto text = get_optional(vm, "principal")) {
    principal = vellum::schema::try_parse_principal(*text, error);
  } else if (auto signer = load_signer(vm, error)) {
    principal = signer->principal();
  }
  if (!principal) {
    return report(error);
  }
  auto subaccount = std::optional<vellum::schema::subaccount_t>{};
  if (auto hex = get_optional(vm, "subaccount")) {
    subaccount = vellum::schema::try_parse_subaccount(*hex, error);
    if (!subaccount) {
      return report(error);
    }
  }
  std::cout << vellum::schema::to_text(
                   vellum::schema::derive_account_identifier(*principal,
                                                             subaccount))
            << '\n';
  return 0;
}

int run_transfer(const po::variables_map& vm) {
  auto error = vellum::common::error{};
  auto to = get_required(vm, "to", error);
  auto amount = to ? get_required(vm, "amount", error) : std::nullopt;
  if (!amount) {
    return report(error);
  }
  auto call = vellum::request::build_transfer(
      vellum::request::transfer_request_t{
          .to = *to,
          .amount = *amount,
          .fee = get_optional(vm, "fee"),
          .memo = get_optional(vm, "memo"),
          .from_subaccount = get_optional(vm, "from-subaccount"),
          .created_at_time = get_optional(vm, "created-at-time")},
      error);
  if (!call) {
    return report(error);
  }
  return sign_and_write(vm, *call);
}

int run_account_balance(const po::variables_map& vm) {
  auto error = vellum::common::error{};
  auto signer = load_signer(vm, error);
  if (!signer) {
    return report(error);
  }
  auto account = get_optional(vm, "account").value_or(vellum::schema::to_text(
      vellum::schema::derive_account_identifier(signer->principal())));
  auto call = vellum::request::build_account_balance(account, error);
  if (!call) {
    return report(error);
  }
  return sign_and_write(vm, *signer, {*call});
}

int run_notify(const po::variables_map& vm) {
  auto error = vellum::common::error{};
  auto block_height = get_required(vm, "block-height", error);
  auto to_canister =
      block_height ? get_required(vm, "to-canister", error) : std::nullopt;
  if (!to_canister) {
    return report(error);
  }
  auto call = vellum::request::build_notify(
      vellum::request::notify_request_t{
          .block_height = *block_height,
          .to_canister = *to_canister,
          .max_fee = get_optional(vm, "max-fee"),
          .from_subaccount = get_optional(vm, "from-subaccount"),
          .to_subaccount = get_optional(vm, "to-subaccount")},
      error);
  if (!call) {
    return report(error);
  }
  return sign_and_write(vm, *call);
}

int run_neuron_stake(const po::variables_map& vm) {
  auto error = vellum::common::error{};
  auto signer = load_signer(vm, error);
  if (!signer) {
    return report(error);
  }
  auto calls = vellum::request::build_neuron_stake(
      vellum::request::neuron_stake_request_t{
          .controller = signer->principal(),
          .name = get_optional(vm, "name"),
          .nonce = get_optional(vm, "nonce"),
          .amount = get_optional(vm, "amount"),
          .fee = get_optional(vm, "fee")},
      error);
  if (!calls) {
    return report(error);
  }
  return sign_and_write(vm, *signer, *calls);
}

int run_neuron_manage(const po::variables_map& vm) {
  auto error = vellum::common::error{};
  if (!vm.contains("neuron-id") ||
      vm["neuron-id"].as<std::vector<std::string>>().size() != 1) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "neuron-manage takes exactly one --neuron-id", "",
                         kCodespace);
    return report(error);
  }
  auto calls = vellum::request::build_manage_neuron(
      vellum::request::manage_neuron_request_t{
          .neuron_id = vm["neuron-id"].as<std::vector<std::string>>().front(),
          .add_hot_key = get_optional(vm, "add-hot-key"),
          .remove_hot_key = get_optional(vm, "remove-hot-key"),
          .stop_dissolving = vm.contains("stop-dissolving"),
          .start_dissolving = vm.contains("start-dissolving"),
          .additional_dissolve_delay_seconds =
              get_optional(vm, "additional-dissolve-delay-seconds"),
          .disburse = vm.contains("disburse"),
          .spawn = vm.contains("spawn"),
          .split = get_optional(vm, "split"),
          .merge_from_neuron = get_optional(vm, "merge-from-neuron"),
          .merge_maturity = get_optional(vm, "merge-maturity")},
      error);
  if (!calls) {
    return report(error);
  }
  auto signer = load_signer(vm, error);
  if (!signer) {
    return report(error);
  }
  return sign_and_write(vm, *signer, *calls);
}

int run_list_neurons(const po::variables_map& vm) {
  auto error = vellum::common::error{};
  auto ids = vm.contains("neuron-id")
                 ? vm["neuron-id"].as<std::vector<std::string>>()
                 : std::vector<std::string>{};
  auto call = vellum::request::build_list_neurons(ids, error);
  if (!call) {
    return report(error);
  }
  return sign_and_write(vm, *call);
}

std::optional<vellum::schema::bytes_t> load_call_arg(
    const po::variables_map& vm,
    vellum::common::error& error) {
  if (vm.contains("arg") && vm.contains("arg-file")) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "--arg and --arg-file are exclusive", "", kCodespace);
    return std::nullopt;
  }
  if (auto path = get_optional(vm, "arg-file")) {
    auto contents = read_file(*path, error);
    if (!contents) {
      return std::nullopt;
    }
    return vellum::schema::make_bytes(*contents);
  }
  auto hex = get_required(vm, "arg", error);
  if (!hex) {
    return std::nullopt;
  }
  auto bytes = vellum::schema::try_from_hex(*hex);
  if (!bytes) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "argument is not valid hex", *hex, kCodespace);
    return std::nullopt;
  }
  return bytes;
}

int run_call(const po::variables_map& vm) {
  auto error = vellum::common::error{};
  auto canister = get_required(vm, "canister-id", error);
  auto method = canister ? get_required(vm, "method", error) : std::nullopt;
  auto arg = method ? load_call_arg(vm, error) : std::nullopt;
  if (!arg) {
    return report(error);
  }
  auto call = vellum::request::build_raw_call(
      *canister, *method, std::move(*arg),
      vm.contains("query") ? vellum::schema::call_type_t::query
                           : vellum::schema::call_type_t::update,
      error);
  if (!call) {
    return report(error);
  }
  return sign_and_write(vm, *call);
}

int run_dry_run(const po::variables_map& vm) {
  auto error = vellum::common::error{};
  auto text = read_file(get_optional(vm, "input").value_or("-"), error);
  if (!text) {
    return report(error);
  }
  auto entries = vellum::request::parse_message_file(*text, error);
  if (!entries) {
    return report(error);
  }
  auto index = std::size_t{0};
  for (const auto& entry : *entries) {
    std::cout << "=== Message " << ++index << " ("
              << vellum::schema::to_string(entry.call_type) << ") ===\n";
    auto ingress = vellum::request::render_human(entry.ingress, error);
    if (!ingress) {
      return report(error);
    }
    std::cout << *ingress;
    if (entry.request_status) {
      auto status = vellum::request::render_human(*entry.request_status, error);
      if (!status) {
        return report(error);
      }
      std::cout << "--- Request status ---\n" << *status;
    }
  }
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  vellum public-ids --pem-file <file>\n"
            << "  vellum account-id [--principal <id>] [--subaccount <hex>]\n"
            << "  vellum transfer --to <account> --amount <tokens> [options]\n"
            << "  vellum account-balance [--account <account>]\n"
            << "  vellum notify --block-height <n> --to-canister <id>\n"
            << "  vellum neuron-stake (--name <name> | --nonce <n>) "
               "[--amount <tokens>]\n"
            << "  vellum neuron-manage --neuron-id <id> [commands]\n"
            << "  vellum list-neurons [--neuron-id <id>...]\n"
            << "  vellum call --canister-id <id> --method <name> "
               "(--arg <hex> | --arg-file <file>) [--query]\n"
            << "  vellum dry-run [--input <file>]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"vellum options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "command to run")(
      "verbose,v", "enable debug logging")(
      "pem-file", po::value<std::string>(), "private key PEM file, - for stdin")(
      "ingress-expiry-seconds", po::value<uint64_t>(),
      "seconds until the signed requests expire")(
      "output,o", po::value<std::string>(), "message file to write")(
      "input,i", po::value<std::string>(), "message file to read")(
      "principal", po::value<std::string>(), "principal id")(
      "subaccount", po::value<std::string>(), "32-byte subaccount hex")(
      "account", po::value<std::string>(), "account identifier")(
      "to", po::value<std::string>(), "destination account identifier")(
      "amount", po::value<std::string>(), "amount in tokens")(
      "fee", po::value<std::string>(), "fee in tokens")(
      "memo", po::value<std::string>(), "transfer memo")(
      "from-subaccount", po::value<std::string>(), "source subaccount hex")(
      "created-at-time", po::value<std::string>(),
      "transfer creation time in nanoseconds")(
      "block-height", po::value<std::string>(), "ledger block to notify")(
      "to-canister", po::value<std::string>(), "canister to notify")(
      "to-subaccount", po::value<std::string>(), "notified subaccount hex")(
      "max-fee", po::value<std::string>(), "notify fee in tokens")(
      "name", po::value<std::string>(), "neuron name")(
      "nonce", po::value<std::string>(), "neuron nonce")(
      "neuron-id", po::value<std::vector<std::string>>()->multitoken(),
      "neuron id")("add-hot-key", po::value<std::string>(),
                   "principal to add as hot key")(
      "remove-hot-key", po::value<std::string>(),
      "principal to remove as hot key")("stop-dissolving", "stop dissolving")(
      "start-dissolving", "start dissolving")(
      "additional-dissolve-delay-seconds", po::value<std::string>(),
      "seconds added to the dissolve delay")("disburse", "disburse the neuron")(
      "spawn", "spawn maturity into a new neuron")(
      "split", po::value<std::string>(), "whole tokens to split off")(
      "merge-from-neuron", po::value<std::string>(), "neuron to merge in")(
      "merge-maturity", po::value<std::string>(),
      "percentage of maturity to merge")(
      "canister-id", po::value<std::string>(), "canister to call")(
      "method", po::value<std::string>(), "method to call")(
      "arg", po::value<std::string>(), "Candid argument hex")(
      "arg-file", po::value<std::string>(), "Candid argument file")(
      "query", "send the call as a query");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "vellum: " << e.what() << '\n';
    return 2;
  }

  auto logger = spdlog::stderr_color_mt("vellum");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto status = 0;
  if (command == "public-ids") {
    status = run_public_ids(vm);
  } else if (command == "account-id") {
    status = run_account_id(vm);
  } else if (command == "transfer") {
    status = run_transfer(vm);
  } else if (command == "account-balance") {
    status = run_account_balance(vm);
  } else if (command == "notify") {
    status = run_notify(vm);
  } else if (command == "neuron-stake") {
    status = run_neuron_stake(vm);
  } else if (command == "neuron-manage") {
    status = run_neuron_manage(vm);
  } else if (command == "list-neurons") {
    status = run_list_neurons(vm);
  } else if (command == "call") {
    status = run_call(vm);
  } else if (command == "dry-run") {
    status = run_dry_run(vm);
  } else {
    spdlog::error("unknown command {}", command);
    print_help(options);
    status = 2;
  }

  spdlog::shutdown();
  return status;
}
