#include <vellum/common/critical.hpp>
#include <vellum/encoding/candid/type.hpp>

#include <algorithm>

namespace vellum::encoding::candid {

namespace {

type_ptr_t make_fields_type(
    const type_code_t code,
    std::vector<std::pair<std::string_view, type_ptr_t>> fields) {
  auto type = type_t{.code = code};
  type.fields.reserve(fields.size());
  for (auto& [name, field] : fields) {
    type.fields.push_back(
        field_type_t{.id = field_hash(name), .type = std::move(field)});
  }
  std::ranges::sort(type.fields, {}, &field_type_t::id);
  auto duplicate = std::ranges::adjacent_find(
      type.fields, [](const auto& lhs, const auto& rhs) {
        return lhs.id == rhs.id;
      });
  if (duplicate != std::end(type.fields)) {
    vellum::common::critical("candid field labels collide");
  }
  return std::make_shared<const type_t>(std::move(type));
}

}  // namespace

uint32_t field_hash(const std::string_view name) {
  auto hash = uint32_t{0};
  for (const auto c : name) {
    hash = (hash * 223u) + static_cast<uint8_t>(c);
  }
  return hash;
}

bool is_primitive(const type_code_t code) {
  auto value = static_cast<int32_t>(code);
  return (value <= -1 && value >= -17) || code == type_code_t::principal;
}

type_ptr_t make_primitive_type(const type_code_t code) {
  if (!is_primitive(code)) {
    vellum::common::critical("not a primitive candid type");
  }
  return std::make_shared<const type_t>(type_t{.code = code});
}

type_ptr_t make_opt_type(type_ptr_t inner) {
  return std::make_shared<const type_t>(
      type_t{.code = type_code_t::opt, .inner = std::move(inner)});
}

type_ptr_t make_vec_type(type_ptr_t inner) {
  return std::make_shared<const type_t>(
      type_t{.code = type_code_t::vec, .inner = std::move(inner)});
}

type_ptr_t make_record_type(
    std::vector<std::pair<std::string_view, type_ptr_t>> fields) {
  return make_fields_type(type_code_t::record, std::move(fields));
}

type_ptr_t make_variant_type(
    std::vector<std::pair<std::string_view, type_ptr_t>> fields) {
  return make_fields_type(type_code_t::variant, std::move(fields));
}

std::optional<std::size_t> find_field(const type_t& type,
                                      const std::string_view name) {
  auto id = field_hash(name);
  for (std::size_t i = 0; i < type.fields.size(); ++i) {
    if (type.fields[i].id == id) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace vellum::encoding::candid
