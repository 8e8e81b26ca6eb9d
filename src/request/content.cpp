#include <vellum/request/content.hpp>

#include <algorithm>

namespace vellum::request {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.request"};

using vellum::schema::bytes_t;
using vellum::schema::principal_t;

content_value_t blob(const bytes_t& bytes) {
  return content_value_t{.value = bytes};
}

content_value_t text(const std::string_view str) {
  return content_value_t{.value = std::string{str}};
}

content_value_t nat(const uint64_t number) {
  return content_value_t{.value = number};
}

class field_reader final {
 public:
  field_reader(const content_map_t& map, vellum::common::error& error)
      : map_{map}, error_{error} {}

  bool ok() const { return ok_; }

  const content_value_t* required(const std::string_view key) {
    auto value = find(map_, key);
    if (value == nullptr) {
      fail("missing content field", key);
    }
    return value;
  }

  template <typename T>
  std::optional<T> get(const std::string_view key, const bool optional) {
    auto value = optional ? find(map_, key) : required(key);
    if (value == nullptr) {
      return std::nullopt;
    }
    if (!std::holds_alternative<T>(value->value)) {
      fail("content field has the wrong type", key);
      return std::nullopt;
    }
    return std::get<T>(value->value);
  }

  std::optional<principal_t> principal(const std::string_view key) {
    auto bytes = get<bytes_t>(key, false);
    if (!bytes) {
      return std::nullopt;
    }
    if (bytes->size() > vellum::schema::kMaxPrincipalLength) {
      fail("content principal is longer than 29 bytes", key);
      return std::nullopt;
    }
    return principal_t{.bytes = std::move(*bytes)};
  }

  void fail(const std::string_view log, const std::string_view key) {
    if (!ok_) {
      return;
    }
    ok_ = false;
    vellum::common::fail(error_, vellum::common::error_code::encoding,
                         std::string{log}, std::string{key}, kCodespace);
  }

 private:
  const content_map_t& map_;
  vellum::common::error& error_;
  bool ok_{true};
};

}  // namespace

bool content_value_t::operator==(const content_value_t&) const = default;
bool content_field_t::operator==(const content_field_t&) const = default;

const content_value_t* find(const content_map_t& map,
                            const std::string_view key) {
  auto it = std::ranges::find(map, key, &content_field_t::key);
  return it == std::end(map) ? nullptr : &it->value;
}

std::string_view request_type(const request_content_t& content) {
  return std::visit(
      overloaded{[](const call_content_t& call) {
                   return call.call_type == vellum::schema::call_type_t::query
                              ? std::string_view{"query"}
                              : std::string_view{"call"};
                 },
                 [](const read_state_content_t&) {
                   return std::string_view{"read_state"};
                 }},
      content);
}

content_map_t to_content_map(const request_content_t& content) {
  auto map = content_map_t{};
  map.push_back({.key = "request_type", .value = text(request_type(content))});
  std::visit(
      overloaded{
          [&](const call_content_t& call) {
            map.push_back(
                {.key = "canister_id", .value = blob(call.canister_id.bytes)});
            map.push_back(
                {.key = "method_name", .value = text(call.method_name)});
            map.push_back({.key = "arg", .value = blob(call.arg)});
            map.push_back({.key = "sender", .value = blob(call.sender.bytes)});
            if (call.nonce) {
              map.push_back({.key = "nonce", .value = blob(*call.nonce)});
            }
            map.push_back({.key = std::string{kIngressExpiryKey},
                           .value = nat(call.ingress_expiry)});
          },
          [&](const read_state_content_t& read_state) {
            map.push_back(
                {.key = "sender", .value = blob(read_state.sender.bytes)});
            auto paths = content_array_t{};
            for (const auto& path : read_state.paths) {
              auto labels = content_array_t{};
              for (const auto& label : path) {
                labels.push_back(blob(label));
              }
              paths.push_back(content_value_t{.value = std::move(labels)});
            }
            map.push_back({.key = "paths",
                           .value = content_value_t{.value = std::move(paths)}});
            map.push_back({.key = std::string{kIngressExpiryKey},
                           .value = nat(read_state.ingress_expiry)});
          }},
      content);
  return map;
}

std::optional<request_content_t> try_from_content_map(
    const content_map_t& map,
    vellum::common::error& error) {
  auto reader = field_reader{map, error};
  auto type = reader.get<std::string>("request_type", false);
  auto sender = reader.principal("sender");
  auto expiry = reader.get<uint64_t>(kIngressExpiryKey, false);
  if (!reader.ok()) {
    return std::nullopt;
  }

  if (*type == "read_state") {
    auto content = read_state_content_t{.sender = std::move(*sender),
                                        .ingress_expiry = *expiry};
    auto paths = reader.get<content_array_t>("paths", false);
    if (!paths) {
      return std::nullopt;
    }
    for (const auto& path : *paths) {
      const auto* labels = std::get_if<content_array_t>(&path.value);
      if (labels == nullptr) {
        reader.fail("read_state path is not an array", "paths");
        return std::nullopt;
      }
      auto out = std::vector<bytes_t>{};
      for (const auto& label : *labels) {
        const auto* bytes = std::get_if<bytes_t>(&label.value);
        if (bytes == nullptr) {
          reader.fail("read_state path label is not a blob", "paths");
          return std::nullopt;
        }
        out.push_back(*bytes);
      }
      content.paths.push_back(std::move(out));
    }
    return content;
  }

  if (*type != "call" && *type != "query") {
    reader.fail("unknown request type", *type);
    return std::nullopt;
  }
  auto content = call_content_t{
      .call_type = *type == "query" ? vellum::schema::call_type_t::query
                                    : vellum::schema::call_type_t::update,
      .sender = std::move(*sender),
      .ingress_expiry = *expiry};
  auto canister_id = reader.principal("canister_id");
  auto method_name = reader.get<std::string>("method_name", false);
  auto arg = reader.get<bytes_t>("arg", false);
  auto nonce = reader.get<bytes_t>("nonce", true);
  if (!reader.ok()) {
    return std::nullopt;
  }
  content.canister_id = std::move(*canister_id);
  content.method_name = std::move(*method_name);
  content.arg = std::move(*arg);
  content.nonce = std::move(nonce);
  return content;
}

std::vector<std::vector<bytes_t>> request_status_paths(
    const vellum::schema::request_id_t& request_id) {
  return {{vellum::schema::make_bytes(std::string_view{"request_status"}),
           bytes_t(std::begin(request_id), std::end(request_id))}};
}

}  // namespace vellum::request
