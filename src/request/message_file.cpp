#include <vellum/request/message_file.hpp>
#include <vellum/request/request_id.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <variant>

namespace vellum::request {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.message_file"};

using json = nlohmann::json;

json ingress_json(const signed_message_t& message) {
  auto out = json::object();
  out["call_type"] = std::string{to_string(message.call.call_type)};
  if (message.call.call_type == vellum::schema::call_type_t::query) {
    out["request_id"] = nullptr;
  } else {
    out["request_id"] = vellum::schema::to_hex(message.ingress.request_id);
  }
  out["content"] = vellum::schema::to_hex(serialize(message.ingress.envelope));
  return out;
}

std::nullopt_t malformed(vellum::common::error& error,
                         std::string log,
                         std::string info) {
  vellum::common::fail(error, vellum::common::error_code::encoding,
                       std::move(log), std::move(info), kCodespace);
  return std::nullopt;
}

const std::string* string_field(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return nullptr;
  }
  return it->get_ptr<const std::string*>();
}

std::optional<envelope_t> envelope_field(const json& object,
                                         vellum::common::error& error) {
  const auto* content = string_field(object, "content");
  if (content == nullptr) {
    return malformed(error, "message is missing its content",
                     std::string{object.type_name()});
  }
  auto bytes = vellum::schema::try_from_hex(*content);
  if (!bytes) {
    return malformed(error, "message content is not hex", *content);
  }
  return deserialize(*bytes, error);
}

/// Checks an optional stated request id against the envelope.
bool check_request_id(const json& object,
                      const envelope_t& envelope,
                      std::optional<vellum::schema::request_id_t>& out,
                      vellum::common::error& error) {
  auto it = object.find("request_id");
  if (it == object.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    malformed(error, "request id is not a string", it->type_name());
    return false;
  }
  auto stated = vellum::schema::try_make_hash32(it->get<std::string>());
  if (!stated) {
    malformed(error, "request id is not 32 bytes of hex",
              it->get<std::string>());
    return false;
  }
  if (*stated != request_id(envelope)) {
    vellum::common::fail(error, vellum::common::error_code::integrity,
                         "request id does not match its envelope",
                         it->get<std::string>(), kCodespace);
    return false;
  }
  out = *stated;
  return true;
}

/// The status envelope must be the read_state of the ingress sender asking
/// for exactly request_status/<ingress request id>.
bool check_status_polls(const envelope_t& status,
                        const envelope_t& ingress,
                        vellum::common::error& error) {
  auto polled = try_from_content_map(ingress.content, error);
  auto content = try_from_content_map(status.content, error);
  if (!polled || !content) {
    return false;
  }
  const auto* read_state = std::get_if<read_state_content_t>(&*content);
  if (read_state == nullptr) {
    malformed(error, "request status is not a read_state",
              std::string{request_type(*content)});
    return false;
  }
  const auto* call = std::get_if<call_content_t>(&*polled);
  auto id = request_id(ingress);
  if (call == nullptr || call->sender != read_state->sender ||
      read_state->paths != request_status_paths(id)) {
    vellum::common::fail(error, vellum::common::error_code::integrity,
                         "request status does not poll its ingress request",
                         vellum::schema::to_hex(id), kCodespace);
    return false;
  }
  return true;
}

std::optional<message_entry_t> parse_ingress(const json& object,
                                             vellum::common::error& error) {
  if (!object.is_object()) {
    return malformed(error, "message is not an object", object.type_name());
  }
  const auto* call_type_text = string_field(object, "call_type");
  if (call_type_text == nullptr) {
    return malformed(error, "message is missing its call type",
                     std::string{object.type_name()});
  }
  auto call_type = vellum::schema::try_from_string<vellum::schema::call_type_t>(
      *call_type_text);
  if (!call_type) {
    return malformed(error, "unknown call type", *call_type_text);
  }
  auto envelope = envelope_field(object, error);
  if (!envelope) {
    return std::nullopt;
  }
  auto content = try_from_content_map(envelope->content, error);
  if (!content) {
    return std::nullopt;
  }
  const auto* call = std::get_if<call_content_t>(&*content);
  if (call == nullptr) {
    return malformed(error, "ingress message is not a call",
                     std::string{request_type(*content)});
  }
  if (call->call_type != *call_type) {
    vellum::common::fail(error, vellum::common::error_code::integrity,
                         "call type does not match its envelope",
                         *call_type_text, kCodespace);
    return std::nullopt;
  }
  auto entry = message_entry_t{.call_type = *call_type,
                               .ingress = std::move(*envelope)};
  if (!check_request_id(object, entry.ingress, entry.request_id, error)) {
    return std::nullopt;
  }
  return entry;
}

std::optional<message_entry_t> parse_entry(const json& object,
                                           vellum::common::error& error) {
  if (!object.is_object() || !object.contains("ingress")) {
    return parse_ingress(object, error);
  }
  auto entry = parse_ingress(object.at("ingress"), error);
  if (!entry) {
    return std::nullopt;
  }
  auto status = object.find("request_status");
  if (status == object.end() || status->is_null()) {
    return entry;
  }
  if (entry->call_type == vellum::schema::call_type_t::query) {
    return malformed(error, "query messages carry no request status",
                     status->type_name());
  }
  if (!status->is_object()) {
    return malformed(error, "request status is not an object",
                     status->type_name());
  }
  auto envelope = envelope_field(*status, error);
  if (!envelope) {
    return std::nullopt;
  }
  // The status request names the ingress request it polls.
  auto polled = std::optional<vellum::schema::request_id_t>{};
  if (!check_request_id(*status, entry->ingress, polled, error)) {
    return std::nullopt;
  }
  if (!check_status_polls(*envelope, entry->ingress, error)) {
    return std::nullopt;
  }
  entry->request_status = std::move(*envelope);
  return entry;
}

}  // namespace

std::string write_message_file(const std::vector<signed_message_t>& messages) {
  auto document = json::array();
  for (const auto& message : messages) {
    if (!message.request_status) {
      document.push_back(ingress_json(message));
      continue;
    }
    auto status = json::object();
    status["canister_id"] = vellum::schema::to_text(message.call.canister_id);
    status["request_id"] = vellum::schema::to_hex(message.ingress.request_id);
    status["content"] =
        vellum::schema::to_hex(serialize(message.request_status->envelope));
    document.push_back(
        json{{"ingress", ingress_json(message)}, {"request_status", status}});
  }
  return document.dump(2);
}

std::optional<std::vector<message_entry_t>> parse_message_file(
    const std::string_view text,
    vellum::common::error& error) {
  auto document = json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    return malformed(error, "message file is not valid JSON",
                     std::to_string(text.size()) + " bytes");
  }

  auto entries = std::vector<message_entry_t>{};
  if (!document.is_array()) {
    auto entry = parse_entry(document, error);
    if (!entry) {
      return std::nullopt;
    }
    entries.push_back(std::move(*entry));
    return entries;
  }
  for (const auto& item : document) {
    auto entry = parse_entry(item, error);
    if (!entry) {
      return std::nullopt;
    }
    entries.push_back(std::move(*entry));
  }
  spdlog::debug("Parsed {} messages", entries.size());
  return entries;
}

}  // namespace vellum::request
