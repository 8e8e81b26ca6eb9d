#include <vellum/encoding/candid/text.hpp>

#include <spdlog/fmt/fmt.h>

namespace vellum::encoding::candid {

namespace {

constexpr std::string_view kKnownFieldNames[] = {
    "account",
    "additional_dissolve_delay_seconds",
    "AddHotKey",
    "amount",
    "amount_e8s",
    "block_height",
    "ClaimOrRefresh",
    "command",
    "Configure",
    "controller",
    "created_at_time",
    "Disburse",
    "dissolve_delay_seconds",
    "e8s",
    "Err",
    "fee",
    "from_subaccount",
    "hash",
    "hot_key_to_remove",
    "id",
    "include_neurons_readable_by_caller",
    "IncreaseDissolveDelay",
    "max_fee",
    "memo",
    "Memo",
    "MemoAndController",
    "Merge",
    "MergeMaturity",
    "new_controller",
    "new_hot_key",
    "neuron_id_or_subaccount",
    "neuron_ids",
    "NeuronId",
    "nonce",
    "Ok",
    "operation",
    "percentage_to_merge",
    "percentage_to_spawn",
    "RemoveHotKey",
    "source_neuron_id",
    "Spawn",
    "Split",
    "StartDissolving",
    "StopDissolving",
    "Subaccount",
    "timestamp_nanos",
    "to",
    "to_account",
    "to_canister",
    "to_subaccount",
    "by",
    "full_neurons"};

void escape_into(const std::string_view text, std::string& out) {
  for (const auto c : text) {
    auto byte = static_cast<uint8_t>(c);
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (byte < 0x20 || byte == 0x7F) {
          out += fmt::format("\\{:02x}", byte);
        } else {
          out.push_back(c);
        }
    }
  }
}

std::string label(const uint32_t id) {
  auto name = field_name(id);
  return name ? std::string{*name} : std::to_string(id);
}

std::string_view annotation(const type_code_t code) {
  switch (code) {
    case type_code_t::nat8:
      return "nat8";
    case type_code_t::nat16:
      return "nat16";
    case type_code_t::nat32:
      return "nat32";
    case type_code_t::nat64:
      return "nat64";
    case type_code_t::int8:
      return "int8";
    case type_code_t::int16:
      return "int16";
    case type_code_t::int32:
      return "int32";
    case type_code_t::int64:
      return "int64";
    case type_code_t::integer:
      return "int";
    case type_code_t::float32:
      return "float32";
    case type_code_t::float64:
      return "float64";
    default:
      return {};
  }
}

void render(const value_t& value, std::string& out) {
  const auto code = value.type->code;
  switch (code) {
    case type_code_t::null:
      out += "null";
      return;
    case type_code_t::reserved:
      out += "reserved";
      return;
    case type_code_t::boolean:
      out += std::get<bool>(value.scalar) ? "true" : "false";
      return;
    case type_code_t::nat:
      out += group_digits(std::to_string(std::get<uint64_t>(value.scalar)));
      return;
    case type_code_t::nat8:
    case type_code_t::nat16:
    case type_code_t::nat32:
    case type_code_t::nat64:
      out += fmt::format(
          "{} : {}",
          group_digits(std::to_string(std::get<uint64_t>(value.scalar))),
          annotation(code));
      return;
    case type_code_t::integer:
    case type_code_t::int8:
    case type_code_t::int16:
    case type_code_t::int32:
    case type_code_t::int64: {
      auto number = std::get<int64_t>(value.scalar);
      auto magnitude = std::to_string(number);
      if (number < 0) {
        magnitude = "-" + group_digits(magnitude.substr(1));
      } else {
        magnitude = "+" + group_digits(magnitude);
      }
      out += fmt::format("{} : {}", magnitude, annotation(code));
      return;
    }
    case type_code_t::float32:
    case type_code_t::float64:
      out += fmt::format("{} : {}", std::get<double>(value.scalar),
                         annotation(code));
      return;
    case type_code_t::text:
      out.push_back('"');
      escape_into(std::get<std::string>(value.scalar), out);
      out.push_back('"');
      return;
    case type_code_t::principal:
      out += fmt::format(
          "principal \"{}\"",
          vellum::schema::to_text(
              std::get<vellum::schema::principal_t>(value.scalar)));
      return;
    case type_code_t::opt:
      if (value.items.empty()) {
        out += "null";
        return;
      }
      out += "opt ";
      render(value.items.front(), out);
      return;
    case type_code_t::vec: {
      if (auto blob = as_blob(value)) {
        out += "blob \"";
        for (const auto byte : *blob) {
          if (byte >= 0x20 && byte < 0x7F && byte != '"' && byte != '\\') {
            out.push_back(static_cast<char>(byte));
          } else {
            out += fmt::format("\\{:02x}", byte);
          }
        }
        out.push_back('"');
        return;
      }
      if (value.items.empty()) {
        out += "vec {}";
        return;
      }
      out += "vec { ";
      for (const auto& item : value.items) {
        render(item, out);
        out += "; ";
      }
      out += "}";
      return;
    }
    case type_code_t::record: {
      if (value.items.empty()) {
        out += "record {}";
        return;
      }
      out += "record { ";
      for (std::size_t i = 0; i < value.items.size(); ++i) {
        out += fmt::format("{} = ", label(value.type->fields[i].id));
        render(value.items[i], out);
        out += "; ";
      }
      out += "}";
      return;
    }
    case type_code_t::variant: {
      const auto& payload = value.items.front();
      out += fmt::format("variant {{ {}", label(variant_label(value)));
      if (payload.type->code != type_code_t::null) {
        out += " = ";
        render(payload, out);
      }
      out += " }";
      return;
    }
    default:
      out += "<unsupported>";
  }
}

}  // namespace

std::optional<std::string_view> field_name(const uint32_t id) {
  for (const auto name : kKnownFieldNames) {
    if (field_hash(name) == id) {
      return name;
    }
  }
  return std::nullopt;
}

std::string to_text(const value_t& value) {
  auto out = std::string{};
  render(value, out);
  return out;
}

std::string to_text(const std::vector<value_t>& args) {
  auto out = std::string{"("};
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    render(args[i], out);
  }
  out.push_back(')');
  return out;
}

std::string group_digits(std::string digits) {
  for (auto i = static_cast<std::ptrdiff_t>(digits.size()) - 3; i > 0;
       i -= 3) {
    digits.insert(static_cast<std::size_t>(i), 1, '_');
  }
  return digits;
}

}  // namespace vellum::encoding::candid
