#include <vellum/common/critical.hpp>
#include <vellum/encoding/candid/value.hpp>

#include <algorithm>

namespace vellum::encoding::candid {

namespace {

value_t make_scalar(const type_code_t code, scalar_t scalar) {
  return value_t{.type = make_primitive_type(code), .scalar = std::move(scalar)};
}

}  // namespace

value_t make_null() {
  return make_scalar(type_code_t::null, std::monostate{});
}

value_t make_bool(const bool value) {
  return make_scalar(type_code_t::boolean, value);
}

value_t make_nat8(const uint8_t value) {
  return make_scalar(type_code_t::nat8, uint64_t{value});
}

value_t make_nat32(const uint32_t value) {
  return make_scalar(type_code_t::nat32, uint64_t{value});
}

value_t make_nat64(const uint64_t value) {
  return make_scalar(type_code_t::nat64, value);
}

value_t make_text(std::string value) {
  return make_scalar(type_code_t::text, std::move(value));
}

value_t make_principal(vellum::schema::principal_t value) {
  return make_scalar(type_code_t::principal, std::move(value));
}

value_t make_blob(const vellum::schema::bytes_view_t& bytes) {
  auto items = std::vector<value_t>{};
  items.reserve(bytes.size());
  for (const auto byte : bytes) {
    items.push_back(make_nat8(byte));
  }
  return make_vec(make_primitive_type(type_code_t::nat8), std::move(items));
}

value_t make_some(value_t value) {
  auto out = value_t{.type = make_opt_type(value.type)};
  out.items.push_back(std::move(value));
  return out;
}

value_t make_none(type_ptr_t inner) {
  return value_t{.type = make_opt_type(std::move(inner))};
}

value_t make_vec(type_ptr_t element, std::vector<value_t> items) {
  return value_t{.type = make_vec_type(std::move(element)),
                 .items = std::move(items)};
}

value_t make_record(std::vector<std::pair<std::string_view, value_t>> fields) {
  std::ranges::sort(fields, {}, [](const auto& field) {
    return field_hash(field.first);
  });
  auto types = std::vector<std::pair<std::string_view, type_ptr_t>>{};
  types.reserve(fields.size());
  auto items = std::vector<value_t>{};
  items.reserve(fields.size());
  for (auto& [name, value] : fields) {
    types.emplace_back(name, value.type);
    items.push_back(std::move(value));
  }
  return value_t{.type = make_record_type(std::move(types)),
                 .items = std::move(items)};
}

value_t make_variant(type_ptr_t type,
                     const std::string_view name,
                     value_t value) {
  auto index = candid::find_field(*type, name);
  if (!index) {
    vellum::common::critical("unknown candid variant alternative");
  }
  auto out = value_t{.type = std::move(type), .variant_index = *index};
  out.items.push_back(std::move(value));
  return out;
}

const value_t* find_field(const value_t& record, const std::string_view name) {
  if (!record.type || record.type->code != type_code_t::record) {
    return nullptr;
  }
  auto index = candid::find_field(*record.type, name);
  if (!index || *index >= record.items.size()) {
    return nullptr;
  }
  return &record.items[*index];
}

uint32_t variant_label(const value_t& variant) {
  return variant.type->fields.at(variant.variant_index).id;
}

std::optional<vellum::schema::bytes_t> as_blob(const value_t& value) {
  if (!value.type || value.type->code != type_code_t::vec ||
      value.type->inner->code != type_code_t::nat8) {
    return std::nullopt;
  }
  auto out = vellum::schema::bytes_t{};
  out.reserve(value.items.size());
  for (const auto& item : value.items) {
    out.push_back(static_cast<uint8_t>(std::get<uint64_t>(item.scalar)));
  }
  return out;
}

}  // namespace vellum::encoding::candid
