#include <vellum/crypto/verify.hpp>
#include <vellum/encoding/candid/codec.hpp>
#include <vellum/encoding/candid/operation_codec.hpp>
#include <vellum/encoding/candid/text.hpp>
#include <vellum/request/envelope.hpp>
#include <vellum/request/request_id.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <iterator>
#include <vector>

namespace vellum::request {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.envelope"};
constexpr auto kMaxContentDepth = std::size_t{32};
// Envelope map, content map, and the self-describe tag around them.
constexpr auto kMaxCborDepth = kMaxContentDepth + 3;

using json = nlohmann::json;
using vellum::schema::bytes_t;

json to_json(const content_value_t& value) {
  return std::visit(
      overloaded{[](const bytes_t& blob) { return json::binary(blob); },
                 [](const std::string& text) { return json(text); },
                 [](const uint64_t nat) { return json(nat); },
                 [](const content_array_t& array) {
                   auto out = json::array();
                   for (const auto& item : array) {
                     out.push_back(to_json(item));
                   }
                   return out;
                 },
                 [](const content_map_t& map) {
                   auto out = json::object();
                   for (const auto& field : map) {
                     out[field.key] = to_json(field.value);
                   }
                   return out;
                 }},
      value.value);
}

std::optional<content_map_t> map_from_json(const json& object,
                                           std::size_t depth,
                                           vellum::common::error& error);

std::optional<content_value_t> value_from_json(const json& value,
                                               const std::string_view key,
                                               const std::size_t depth,
                                               vellum::common::error& error) {
  if (depth > kMaxContentDepth) {
    vellum::common::fail(error, vellum::common::error_code::encoding,
                         "content nesting too deep", std::string{key},
                         kCodespace);
    return std::nullopt;
  }
  switch (value.type()) {
    case json::value_t::binary:
      return content_value_t{
          .value = static_cast<const bytes_t&>(value.get_binary())};
    case json::value_t::string:
      return content_value_t{.value = value.get<std::string>()};
    case json::value_t::number_unsigned:
      return content_value_t{.value = value.get<uint64_t>()};
    case json::value_t::array: {
      auto array = content_array_t{};
      for (const auto& item : value) {
        auto converted = value_from_json(item, key, depth + 1, error);
        if (!converted) {
          return std::nullopt;
        }
        array.push_back(std::move(*converted));
      }
      return content_value_t{.value = std::move(array)};
    }
    case json::value_t::object: {
      auto map = map_from_json(value, depth + 1, error);
      if (!map) {
        return std::nullopt;
      }
      return content_value_t{.value = std::move(*map)};
    }
    default:
      vellum::common::fail(error, vellum::common::error_code::encoding,
                           "content value has no request id encoding",
                           fmt::format("{} ({})", key, value.type_name()),
                           kCodespace);
      return std::nullopt;
  }
}

std::optional<content_map_t> map_from_json(const json& object,
                                           const std::size_t depth,
                                           vellum::common::error& error) {
  auto map = content_map_t{};
  for (const auto& [key, value] : object.items()) {
    auto converted = value_from_json(value, key, depth, error);
    if (!converted) {
      return std::nullopt;
    }
    map.push_back({.key = key, .value = std::move(*converted)});
  }
  return map;
}

struct cbor_frame_t final {
  uint64_t remaining{};
  bool indefinite{false};
};

/// Walks the CBOR item headers with an explicit stack and reports whether
/// nesting stays within `max_depth`. Malformed input ends the walk early;
/// the parser reports it.
bool cbor_depth_within(const vellum::schema::bytes_view_t& bytes,
                       const std::size_t max_depth) {
  auto stack = std::vector<cbor_frame_t>{cbor_frame_t{.remaining = 1}};
  auto offset = std::size_t{0};
  while (!stack.empty()) {
    if (!stack.back().indefinite && stack.back().remaining == 0) {
      stack.pop_back();
      continue;
    }
    if (offset >= bytes.size()) {
      return true;
    }
    const auto initial = bytes[offset++];
    if (initial == 0xff) {
      if (!stack.back().indefinite) {
        return true;
      }
      stack.pop_back();
      continue;
    }
    if (!stack.back().indefinite) {
      --stack.back().remaining;
    }

    const auto major = initial >> 5u;
    const auto info = initial & 0x1fu;
    auto argument = uint64_t{info};
    auto indefinite = false;
    if (info >= 24 && info <= 27) {
      const auto size = std::size_t{1} << (info - 24);
      if (size > bytes.size() - offset) {
        return true;
      }
      argument = 0;
      for (std::size_t i = 0; i < size; ++i) {
        argument = (argument << 8u) | bytes[offset++];
      }
    } else if (info == 31) {
      indefinite = true;
    } else if (info > 27) {
      return true;
    }

    auto frame = std::optional<cbor_frame_t>{};
    switch (major) {
      case 2:
      case 3:
        if (indefinite) {
          frame = cbor_frame_t{.indefinite = true};
        } else if (argument > bytes.size() - offset) {
          return true;
        } else {
          offset += static_cast<std::size_t>(argument);
        }
        break;
      case 4:
      case 5: {
        const auto per_entry = major == 4 ? uint64_t{1} : uint64_t{2};
        if (indefinite) {
          frame = cbor_frame_t{.indefinite = true};
        } else if (argument > (bytes.size() - offset) / per_entry) {
          return true;
        } else {
          frame = cbor_frame_t{.remaining = argument * per_entry};
        }
        break;
      }
      case 6:
        frame = cbor_frame_t{.remaining = 1};
        break;
      default:
        break;
    }
    if (frame) {
      stack.push_back(*frame);
      if (stack.size() > max_depth + 1) {
        return false;
      }
    }
  }
  return true;
}

const bytes_t* binary_field(const json& object, const std::string_view key) {
  auto it = object.find(std::string{key});
  if (it == object.end() || !it->is_binary()) {
    return nullptr;
  }
  return &static_cast<const bytes_t&>(it->get_binary());
}

std::string format_utc(const vellum::schema::timestamp_nanoseconds_t nanos) {
  auto seconds = static_cast<std::time_t>(nanos / 1'000'000'000u);
  auto tm = std::tm{};
  if (gmtime_r(&seconds, &tm) == nullptr) {
    return "out of range";
  }
  return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02} UTC",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

std::string render_principal(const vellum::schema::principal_t& principal) {
  auto text = vellum::schema::to_text(principal);
  if (principal == vellum::schema::ledger_canister_id()) {
    text += " (ledger)";
  } else if (principal == vellum::schema::governance_canister_id()) {
    text += " (governance)";
  }
  return text;
}

std::string render_tokens(const vellum::schema::tokens_t& tokens) {
  return fmt::format("{} tokens ({} e8s)", vellum::schema::to_string(tokens),
                     vellum::encoding::candid::group_digits(
                         std::to_string(tokens.e8s)));
}

std::string render_subaccount(
    const std::optional<vellum::schema::subaccount_t>& subaccount) {
  return subaccount ? vellum::schema::to_hex(*subaccount) : "default";
}

std::string render_content_value(const content_value_t& value) {
  return std::visit(
      overloaded{
          [](const bytes_t& blob) {
            return "0x" + vellum::schema::to_hex(blob);
          },
          [](const std::string& text) { return fmt::format("\"{}\"", text); },
          [](const uint64_t nat) { return std::to_string(nat); },
          [](const content_array_t& array) {
            auto out = std::string{"["};
            for (std::size_t i = 0; i < array.size(); ++i) {
              out += (i > 0 ? ", " : "") + render_content_value(array[i]);
            }
            return out + "]";
          },
          [](const content_map_t& map) {
            auto out = std::string{"{"};
            for (std::size_t i = 0; i < map.size(); ++i) {
              out += fmt::format("{}{}: {}", i > 0 ? ", " : "", map[i].key,
                                 render_content_value(map[i].value));
            }
            return out + "}";
          }},
      value.value);
}

void line(std::string& out,
          const std::string_view label,
          const std::string_view value,
          const std::size_t indent = 0) {
  out += fmt::format("{:{}}{:<{}} {}\n", "", indent, fmt::format("{}:", label),
                     20 - indent, value);
}

void render_command(const vellum::schema::neuron_command_t& command,
                    std::string& out) {
  using namespace vellum::schema;
  line(out, "Command", to_string(kind_of(command)), 2);
  std::visit(
      overloaded{
          [&](const add_hot_key_t& arg) {
            line(out, "New hot key", to_text(arg.new_hot_key), 2);
          },
          [&](const remove_hot_key_t& arg) {
            line(out, "Hot key to remove", to_text(arg.hot_key_to_remove), 2);
          },
          [&](const increase_dissolve_delay_t& arg) {
            line(out, "Additional delay",
                 fmt::format("{} seconds",
                             arg.additional_dissolve_delay_seconds),
                 2);
          },
          [&](const disburse_t&) {
            line(out, "Destination", "controller default account", 2);
          },
          [&](const split_t& arg) {
            line(out, "Amount", render_tokens(arg.amount), 2);
          },
          [&](const merge_t& arg) {
            line(out, "Source neuron", std::to_string(arg.source_neuron_id),
                 2);
          },
          [&](const merge_maturity_t& arg) {
            line(out, "Percentage", fmt::format("{}%", arg.percentage_to_merge),
                 2);
          },
          [](const auto&) {}},
      command);
}

void render_operation(const vellum::schema::operation_t& operation,
                      std::string& out) {
  using namespace vellum::schema;
  line(out, "Operation", operation_name(operation));
  std::visit(
      overloaded{
          [&](const transfer_t& arg) {
            line(out, "To", to_text(arg.to), 2);
            line(out, "Amount", render_tokens(arg.amount), 2);
            line(out, "Fee", render_tokens(arg.fee), 2);
            line(out, "Memo", std::to_string(arg.memo), 2);
            line(out, "From subaccount", render_subaccount(arg.from_subaccount),
                 2);
            line(out, "Created at",
                 arg.created_at_time
                     ? fmt::format("{} ({})", format_utc(*arg.created_at_time),
                                   *arg.created_at_time)
                     : std::string{"not set"},
                 2);
          },
          [&](const account_balance_t& arg) {
            line(out, "Account", to_text(arg.account), 2);
          },
          [&](const notify_t& arg) {
            line(out, "Block height", std::to_string(arg.block_height), 2);
            line(out, "Max fee", render_tokens(arg.max_fee), 2);
            line(out, "From subaccount", render_subaccount(arg.from_subaccount),
                 2);
            line(out, "To canister", render_principal(arg.to_canister), 2);
            line(out, "To subaccount", render_subaccount(arg.to_subaccount), 2);
          },
          [&](const claim_or_refresh_neuron_t& arg) {
            line(out, "Memo", std::to_string(arg.memo), 2);
            line(out, "Controller",
                 arg.controller ? to_text(*arg.controller)
                                : std::string{"caller"},
                 2);
          },
          [&](const manage_neuron_t& arg) {
            line(out, "Neuron id", std::to_string(arg.neuron_id), 2);
            render_command(arg.command, out);
          },
          [&](const list_neurons_t& arg) {
            auto ids = std::string{};
            for (const auto id : arg.neuron_ids) {
              ids += (ids.empty() ? "" : ", ") + std::to_string(id);
            }
            line(out, "Neuron ids", ids.empty() ? "all" : ids, 2);
            line(out, "Readable by caller",
                 arg.include_neurons_readable_by_caller ? "yes" : "no", 2);
          }},
      operation);
}

void render_arguments(const call_content_t& call, std::string& out) {
  namespace candid = vellum::encoding::candid;
  auto error = vellum::common::error{};
  auto args = candid::decode(call.arg, error);
  if (!args) {
    line(out, "Arguments",
         fmt::format("undecodable ({})", vellum::common::describe(error)));
  } else {
    auto operation =
        candid::decode_operation(call.canister_id, call.method_name, *args,
                                 error);
    if (operation) {
      render_operation(*operation, out);
    }
    line(out, "Arguments", candid::to_text(*args));
  }
  line(out, "Argument bytes", vellum::schema::to_hex(call.arg));
}

bool is_modelled_key(const std::string_view key) {
  constexpr std::string_view kKeys[] = {
      "request_type", "canister_id", "method_name", "arg",
      "sender",       "nonce",       "paths",       "ingress_expiry"};
  return std::ranges::find(kKeys, key) != std::end(kKeys);
}

}  // namespace

envelope_t seal(content_map_t content,
                const vellum::schema::signature_t& signature,
                const bytes_t& public_key) {
  return envelope_t{
      .content = std::move(content),
      .sender_pubkey = public_key,
      .sender_sig = bytes_t(std::begin(signature), std::end(signature))};
}

bytes_t serialize(const envelope_t& envelope) {
  auto document = json::object();
  document["content"] = to_json(content_value_t{.value = envelope.content});
  document["sender_pubkey"] = json::binary(envelope.sender_pubkey);
  document["sender_sig"] = json::binary(envelope.sender_sig);

  auto out = bytes_t(std::begin(kSelfDescribeTag), std::end(kSelfDescribeTag));
  json::to_cbor(document, out);
  return out;
}

std::optional<envelope_t> deserialize(const vellum::schema::bytes_view_t& bytes,
                                      vellum::common::error& error) {
  // The CBOR parser recurses once per nesting level.
  if (!cbor_depth_within(bytes, kMaxCborDepth)) {
    vellum::common::fail(error, vellum::common::error_code::encoding,
                         "CBOR nesting too deep",
                         std::to_string(bytes.size()) + " bytes", kCodespace);
    return std::nullopt;
  }
  auto document =
      json::from_cbor(bytes.data(), bytes.data() + bytes.size(), true, false,
                      json::cbor_tag_handler_t::ignore);
  if (document.is_discarded()) {
    vellum::common::fail(error, vellum::common::error_code::encoding,
                         "malformed CBOR envelope",
                         std::to_string(bytes.size()) + " bytes", kCodespace);
    return std::nullopt;
  }
  if (!document.is_object()) {
    vellum::common::fail(error, vellum::common::error_code::encoding,
                         "envelope is not a map", document.type_name(),
                         kCodespace);
    return std::nullopt;
  }

  auto content = document.find("content");
  const auto* sender_pubkey = binary_field(document, "sender_pubkey");
  const auto* sender_sig = binary_field(document, "sender_sig");
  if (content == document.end() || !content->is_object() ||
      sender_pubkey == nullptr || sender_sig == nullptr) {
    vellum::common::fail(error, vellum::common::error_code::encoding,
                         "envelope is missing content, sender_pubkey or "
                         "sender_sig",
                         {}, kCodespace);
    return std::nullopt;
  }

  auto map = map_from_json(*content, 0, error);
  if (!map) {
    return std::nullopt;
  }
  if (!try_from_content_map(*map, error)) {
    return std::nullopt;
  }
  return envelope_t{.content = std::move(*map),
                    .sender_pubkey = *sender_pubkey,
                    .sender_sig = *sender_sig};
}

vellum::schema::request_id_t request_id(const envelope_t& envelope) {
  return compute_request_id(envelope.content);
}

bool verify(const envelope_t& envelope, vellum::common::error& error) {
  auto content = try_from_content_map(envelope.content, error);
  if (!content) {
    return false;
  }
  const auto& sender = std::visit(
      [](const auto& typed) -> const vellum::schema::principal_t& {
        return typed.sender;
      },
      *content);
  if (sender != vellum::schema::make_self_authenticating_principal(
                    envelope.sender_pubkey)) {
    vellum::common::fail(error, vellum::common::error_code::integrity,
                         "sender is not authenticated by the public key",
                         vellum::schema::to_text(sender), kCodespace);
    return false;
  }
  auto id = request_id(envelope);
  if (!vellum::crypto::verify_signature(make_signable(id),
                                        envelope.sender_pubkey,
                                        envelope.sender_sig)) {
    vellum::common::fail(error, vellum::common::error_code::integrity,
                         "signature does not verify",
                         vellum::schema::to_hex(id), kCodespace);
    return false;
  }
  return true;
}

std::optional<std::string> render_human(const envelope_t& envelope,
                                        vellum::common::error& error) {
  auto content = try_from_content_map(envelope.content, error);
  if (!content) {
    return std::nullopt;
  }

  auto out = std::string{};
  auto id = request_id(envelope);
  std::visit(
      overloaded{
          [&](const call_content_t& call) {
            line(out, "Request type",
                 fmt::format("{} ({})", request_type(*content),
                             vellum::schema::to_string(call.call_type)));
            line(out, "Sender", vellum::schema::to_text(call.sender));
            line(out, "Canister id", render_principal(call.canister_id));
            line(out, "Method name", call.method_name);
          },
          [&](const read_state_content_t& read_state) {
            line(out, "Request type", request_type(*content));
            line(out, "Sender", vellum::schema::to_text(read_state.sender));
            for (const auto& path : read_state.paths) {
              auto text = std::string{};
              for (const auto& label : path) {
                auto printable = std::ranges::all_of(label, [](uint8_t c) {
                  return c >= 0x21 && c < 0x7F;
                });
                text += "/" + (printable ? vellum::schema::make_string(label)
                                         : vellum::schema::to_hex(label));
              }
              line(out, "Path", text);
            }
          }},
      *content);

  line(out, "Request id", vellum::schema::to_hex(id));
  const auto* expiry = find(envelope.content, kIngressExpiryKey);
  auto expiry_nanos = std::get<uint64_t>(expiry->value);
  line(out, "Ingress expiry",
       fmt::format("{} ({} ns)", format_utc(expiry_nanos), expiry_nanos));
  if (const auto* call = std::get_if<call_content_t>(&*content)) {
    line(out, "Nonce",
         call->nonce ? vellum::schema::to_hex(*call->nonce)
                     : std::string{"none"});
  }
  for (const auto& field : envelope.content) {
    if (!is_modelled_key(field.key)) {
      line(out, "Extra field",
           fmt::format("{} = {}", field.key,
                       render_content_value(field.value)));
    }
  }

  auto scheme = vellum::crypto::scheme_of(envelope.sender_pubkey);
  line(out, "Public key",
       fmt::format("{} ({})", vellum::schema::to_hex(envelope.sender_pubkey),
                   scheme ? vellum::crypto::to_string(*scheme) : "unknown"));
  auto verify_error = vellum::common::error{};
  line(out, "Signature",
       fmt::format("{} ({})", vellum::schema::to_hex(envelope.sender_sig),
                   verify(envelope, verify_error) ? "valid" : "INVALID"));

  if (const auto* call = std::get_if<call_content_t>(&*content)) {
    render_arguments(*call, out);
  }
  spdlog::debug("Rendered envelope {}", vellum::schema::to_hex(id));
  return out;
}

}  // namespace vellum::request
