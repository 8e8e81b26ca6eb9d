#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vellum::encoding::candid {

/// Candid type opcodes as they appear on the wire (signed LEB128).
enum class type_code_t : int32_t {
  null = -1,
  boolean = -2,
  nat = -3,
  integer = -4,
  nat8 = -5,
  nat16 = -6,
  nat32 = -7,
  nat64 = -8,
  int8 = -9,
  int16 = -10,
  int32 = -11,
  int64 = -12,
  float32 = -13,
  float64 = -14,
  text = -15,
  reserved = -16,
  empty = -17,
  opt = -18,
  vec = -19,
  record = -20,
  variant = -21,
  func = -22,
  service = -23,
  principal = -24
};

struct type_t;
using type_ptr_t = std::shared_ptr<const type_t>;

struct field_type_t final {
  uint32_t id{};
  type_ptr_t type;
};

/// A Candid type. `inner` is set for opt and vec; `fields` for record and
/// variant, always sorted by field id.
struct type_t final {
  type_code_t code{type_code_t::null};
  type_ptr_t inner;
  std::vector<field_type_t> fields;
};

/// idl hash of a field label: h = h * 223 + byte (mod 2^32).
uint32_t field_hash(std::string_view name);

bool is_primitive(type_code_t code);

type_ptr_t make_primitive_type(type_code_t code);
type_ptr_t make_opt_type(type_ptr_t inner);
type_ptr_t make_vec_type(type_ptr_t inner);
type_ptr_t make_record_type(
    std::vector<std::pair<std::string_view, type_ptr_t>> fields);
type_ptr_t make_variant_type(
    std::vector<std::pair<std::string_view, type_ptr_t>> fields);

/// Index of the field `name` in a record or variant type.
std::optional<std::size_t> find_field(const type_t& type,
                                      std::string_view name);

}  // namespace vellum::encoding::candid
