#pragma once
#include <vellum/encoding/candid/type.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/schema/principal.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace vellum::encoding::candid {

/// Scalar payload of a value. Unsigned types (nat, nat8..nat64) share
/// uint64_t, signed ones share int64_t and floats share double.
using scalar_t = std::variant<std::monostate,
                              bool,
                              uint64_t,
                              int64_t,
                              double,
                              std::string,
                              vellum::schema::principal_t>;

/// A typed Candid value.
///
/// `items` holds the element of a present opt, the elements of a vec, the
/// record fields in type order, or the single payload of a variant, whose
/// alternative is `variant_index`.
struct value_t final {
  type_ptr_t type;
  scalar_t scalar;
  std::vector<value_t> items;
  std::size_t variant_index{};
};

value_t make_null();
value_t make_bool(bool value);
value_t make_nat8(uint8_t value);
value_t make_nat32(uint32_t value);
value_t make_nat64(uint64_t value);
value_t make_text(std::string value);
value_t make_principal(vellum::schema::principal_t value);
/// vec nat8.
value_t make_blob(const vellum::schema::bytes_view_t& bytes);
value_t make_some(value_t value);
value_t make_none(type_ptr_t inner);
value_t make_vec(type_ptr_t element, std::vector<value_t> items);
/// Field order of `fields` is irrelevant; the record is stored sorted by
/// field id.
value_t make_record(std::vector<std::pair<std::string_view, value_t>> fields);
value_t make_variant(type_ptr_t type, std::string_view name, value_t value);

/// Field `name` of a record value, or nullptr when absent.
const value_t* find_field(const value_t& record, std::string_view name);

/// Label id of the alternative held by a variant value.
uint32_t variant_label(const value_t& variant);

/// Bytes of a vec nat8 value.
std::optional<vellum::schema::bytes_t> as_blob(const value_t& value);

}  // namespace vellum::encoding::candid
