#include <vellum/encoding/candid/codec.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <bit>
#include <cstring>
#include <spdlog/spdlog.h>

namespace vellum::encoding::candid {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.candid"};
// Values of zero-sized types (null, reserved) may legally repeat without
// consuming input; cap them so a short message cannot force a huge
// allocation.
constexpr auto kMaxZeroSizedVec = uint64_t{1} << 16u;
// Every decoded value is charged against a budget of one value per input
// byte plus this allowance for values that consume no input.
constexpr auto kMaxValuesWithoutInput = std::size_t{1} << 16u;

using vellum::schema::bytes_view_t;

struct raw_field_t final {
  uint32_t id{};
  int64_t reference{};
};

struct raw_entry_t final {
  type_code_t code{};
  int64_t inner{};
  std::vector<raw_field_t> fields;
};

class reader final {
 public:
  reader(const bytes_view_t& bytes, vellum::common::error& error)
      : bytes_{bytes}, error_{error} {}

  std::optional<std::vector<value_t>> read_message() {
    if (bytes_.size() < kMagic.size() ||
        std::memcmp(bytes_.data(), kMagic.data(), kMagic.size()) != 0) {
      return fail("missing DIDL magic", {});
    }
    offset_ = kMagic.size();
    value_budget_ = bytes_.size() + kMaxValuesWithoutInput;
    if (!read_table() || !resolve_table()) {
      return std::nullopt;
    }

    auto arg_count = read_uleb128();
    if (!arg_count) {
      return std::nullopt;
    }
    if (*arg_count > remaining()) {
      return fail("argument count exceeds message size",
                  std::to_string(*arg_count));
    }
    auto arg_types = std::vector<type_ptr_t>{};
    for (uint64_t i = 0; i < *arg_count; ++i) {
      auto reference = read_sleb128();
      if (!reference) {
        return std::nullopt;
      }
      auto type = lookup(*reference);
      if (!type) {
        return std::nullopt;
      }
      arg_types.push_back(std::move(type));
    }

    auto values = std::vector<value_t>{};
    values.reserve(arg_types.size());
    for (const auto& type : arg_types) {
      auto value = read_value(type, 0);
      if (!value) {
        return std::nullopt;
      }
      values.push_back(std::move(*value));
    }
    if (remaining() != 0) {
      return fail("trailing bytes after arguments",
                  std::to_string(remaining()));
    }
    return values;
  }

 private:
  std::nullopt_t fail(std::string log, std::string info) {
    vellum::common::fail(error_, vellum::common::error_code::encoding,
                         std::move(log), std::move(info), kCodespace);
    return std::nullopt;
  }

  std::size_t remaining() const { return bytes_.size() - offset_; }

  std::optional<uint8_t> read_byte() {
    if (remaining() == 0) {
      return fail("unexpected end of candid message",
                  std::to_string(offset_));
    }
    return bytes_[offset_++];
  }

  std::optional<bytes_view_t> read_bytes(const uint64_t count) {
    if (count > remaining()) {
      return fail("unexpected end of candid message",
                  std::to_string(offset_));
    }
    auto out = bytes_.subspan(offset_, count);
    offset_ += count;
    return out;
  }

  std::optional<uint64_t> read_uleb128() {
    auto result = uint64_t{0};
    for (auto shift = 0u;; shift += 7) {
      auto byte = read_byte();
      if (!byte) {
        return std::nullopt;
      }
      auto low = uint64_t{*byte & 0x7Fu};
      if (shift >= 64 || (shift == 63 && low > 1)) {
        return fail("LEB128 value overflows 64 bits", std::to_string(offset_));
      }
      result |= low << shift;
      if ((*byte & 0x80u) == 0) {
        return result;
      }
    }
  }

  std::optional<int64_t> read_sleb128() {
    auto result = int64_t{0};
    auto shift = 0u;
    auto byte = uint8_t{0};
    do {
      auto next = read_byte();
      if (!next) {
        return std::nullopt;
      }
      byte = *next;
      if (shift >= 64) {
        return fail("SLEB128 value overflows 64 bits",
                    std::to_string(offset_));
      }
      result |= static_cast<int64_t>(uint64_t{byte & 0x7Fu} << shift);
      shift += 7;
    } while ((byte & 0x80u) != 0);
    if (shift < 64 && (byte & 0x40u) != 0) {
      result |= static_cast<int64_t>(~uint64_t{0} << shift);
    }
    return result;
  }

  template <typename T>
  std::optional<T> read_le() {
    auto raw = read_bytes(sizeof(T));
    if (!raw) {
      return std::nullopt;
    }
    auto value = T{};
    std::memcpy(&value, raw->data(), sizeof(T));
    return boost::endian::little_to_native(value);
  }

  bool read_table() {
    auto count = read_uleb128();
    if (!count) {
      return false;
    }
    if (*count > remaining()) {
      fail("type table size exceeds message size", std::to_string(*count));
      return false;
    }
    for (uint64_t i = 0; i < *count; ++i) {
      auto opcode = read_sleb128();
      if (!opcode) {
        return false;
      }
      if (*opcode >= 0 || *opcode < -24) {
        fail("invalid type table opcode", std::to_string(*opcode));
        return false;
      }
      auto entry = raw_entry_t{.code = static_cast<type_code_t>(*opcode)};
      switch (entry.code) {
        case type_code_t::opt:
        case type_code_t::vec: {
          auto inner = read_sleb128();
          if (!inner) {
            return false;
          }
          entry.inner = *inner;
          break;
        }
        case type_code_t::record:
        case type_code_t::variant: {
          auto field_count = read_uleb128();
          if (!field_count) {
            return false;
          }
          if (*field_count > remaining()) {
            fail("field count exceeds message size",
                 std::to_string(*field_count));
            return false;
          }
          for (uint64_t f = 0; f < *field_count; ++f) {
            auto id = read_uleb128();
            if (!id) {
              return false;
            }
            auto reference = read_sleb128();
            if (!reference) {
              return false;
            }
            if (*id > UINT32_MAX ||
                (!entry.fields.empty() && *id <= entry.fields.back().id)) {
              fail("field ids are not strictly increasing",
                   std::to_string(*id));
              return false;
            }
            entry.fields.push_back(
                raw_field_t{.id = static_cast<uint32_t>(*id),
                            .reference = *reference});
          }
          break;
        }
        case type_code_t::func:
        case type_code_t::service:
          fail("func and service types are not supported",
               std::to_string(*opcode));
          return false;
        default:
          fail("invalid type table opcode", std::to_string(*opcode));
          return false;
      }
      raw_.push_back(std::move(entry));
    }
    return true;
  }

  bool resolve_table() {
    resolved_.resize(raw_.size());
    depths_.assign(raw_.size(), 0);
    visiting_.assign(raw_.size(), false);
    for (std::size_t i = 0; i < raw_.size(); ++i) {
      if (!resolve(i, 0)) {
        return false;
      }
    }
    return true;
  }

  /// Nesting depth of a resolved reference; primitives have depth 0.
  std::size_t depth_of(const int64_t reference) const {
    return reference < 0 ? 0 : depths_[static_cast<std::size_t>(reference)];
  }

  type_ptr_t resolve_reference(const int64_t reference,
                               const std::size_t depth) {
    if (reference < 0) {
      if (reference < -24 ||
          !is_primitive(static_cast<type_code_t>(reference))) {
        fail("invalid primitive type", std::to_string(reference));
        return nullptr;
      }
      return make_primitive_type(static_cast<type_code_t>(reference));
    }
    if (static_cast<uint64_t>(reference) >= raw_.size()) {
      fail("type reference out of range", std::to_string(reference));
      return nullptr;
    }
    return resolve(static_cast<std::size_t>(reference), depth);
  }

  // `depth` counts the entries being resolved on the way here, the stored
  // depth the entries nested below; both are bounded by kMaxDepth.
  type_ptr_t resolve(const std::size_t index, const std::size_t depth) {
    if (resolved_[index]) {
      return resolved_[index];
    }
    if (visiting_[index]) {
      fail("recursive types are not supported", std::to_string(index));
      return nullptr;
    }
    if (depth > kMaxDepth) {
      fail("candid type nesting too deep", std::to_string(index));
      return nullptr;
    }
    visiting_[index] = true;
    const auto& entry = raw_[index];
    auto type = type_t{.code = entry.code};
    auto nested = std::size_t{0};
    if (entry.code == type_code_t::opt || entry.code == type_code_t::vec) {
      type.inner = resolve_reference(entry.inner, depth + 1);
      if (!type.inner) {
        return nullptr;
      }
      nested = depth_of(entry.inner);
    } else {
      for (const auto& field : entry.fields) {
        auto field_type = resolve_reference(field.reference, depth + 1);
        if (!field_type) {
          return nullptr;
        }
        nested = std::max(nested, depth_of(field.reference));
        type.fields.push_back(
            field_type_t{.id = field.id, .type = std::move(field_type)});
      }
    }
    if (nested + 1 > kMaxDepth) {
      fail("candid type nesting too deep", std::to_string(index));
      return nullptr;
    }
    visiting_[index] = false;
    depths_[index] = nested + 1;
    resolved_[index] = std::make_shared<const type_t>(std::move(type));
    return resolved_[index];
  }

  type_ptr_t lookup(const int64_t reference) {
    return resolve_reference(reference, 0);
  }

  std::optional<value_t> read_scalar(const type_ptr_t& type) {
    auto value = value_t{.type = type};
    switch (type->code) {
      case type_code_t::null:
      case type_code_t::reserved:
        return value;
      case type_code_t::boolean: {
        auto byte = read_byte();
        if (!byte) {
          return std::nullopt;
        }
        if (*byte > 1) {
          return fail("invalid bool", std::to_string(*byte));
        }
        value.scalar = *byte == 1;
        return value;
      }
      case type_code_t::nat: {
        auto nat = read_uleb128();
        if (!nat) {
          return std::nullopt;
        }
        value.scalar = *nat;
        return value;
      }
      case type_code_t::integer: {
        auto integer = read_sleb128();
        if (!integer) {
          return std::nullopt;
        }
        value.scalar = *integer;
        return value;
      }
      case type_code_t::nat8:
        return assign_unsigned<uint8_t>(std::move(value));
      case type_code_t::nat16:
        return assign_unsigned<uint16_t>(std::move(value));
      case type_code_t::nat32:
        return assign_unsigned<uint32_t>(std::move(value));
      case type_code_t::nat64:
        return assign_unsigned<uint64_t>(std::move(value));
      case type_code_t::int8:
        return assign_signed<int8_t>(std::move(value));
      case type_code_t::int16:
        return assign_signed<int16_t>(std::move(value));
      case type_code_t::int32:
        return assign_signed<int32_t>(std::move(value));
      case type_code_t::int64:
        return assign_signed<int64_t>(std::move(value));
      case type_code_t::float32: {
        auto raw = read_le<uint32_t>();
        if (!raw) {
          return std::nullopt;
        }
        value.scalar = static_cast<double>(std::bit_cast<float>(*raw));
        return value;
      }
      case type_code_t::float64: {
        auto raw = read_le<uint64_t>();
        if (!raw) {
          return std::nullopt;
        }
        value.scalar = std::bit_cast<double>(*raw);
        return value;
      }
      case type_code_t::text: {
        auto size = read_uleb128();
        if (!size) {
          return std::nullopt;
        }
        auto raw = read_bytes(*size);
        if (!raw) {
          return std::nullopt;
        }
        value.scalar = vellum::schema::make_string(*raw);
        return value;
      }
      case type_code_t::principal: {
        auto tag = read_byte();
        if (!tag) {
          return std::nullopt;
        }
        if (*tag != 1) {
          return fail("opaque principal references are not supported",
                      std::to_string(*tag));
        }
        auto size = read_uleb128();
        if (!size) {
          return std::nullopt;
        }
        auto raw = read_bytes(*size);
        if (!raw) {
          return std::nullopt;
        }
        if (raw->size() > vellum::schema::kMaxPrincipalLength) {
          return fail("principal is longer than 29 bytes",
                      std::to_string(raw->size()));
        }
        value.scalar = vellum::schema::principal_t{
            .bytes = vellum::schema::make_bytes(*raw)};
        return value;
      }
      default:
        return fail("type has no values", std::to_string(
                                              static_cast<int>(type->code)));
    }
  }

  template <typename T>
  std::optional<value_t> assign_unsigned(value_t value) {
    auto raw = read_le<T>();
    if (!raw) {
      return std::nullopt;
    }
    value.scalar = uint64_t{*raw};
    return value;
  }

  template <typename T>
  std::optional<value_t> assign_signed(value_t value) {
    auto raw = read_le<T>();
    if (!raw) {
      return std::nullopt;
    }
    value.scalar = int64_t{*raw};
    return value;
  }

  std::optional<value_t> read_value(const type_ptr_t& type,
                                    const std::size_t depth) {
    if (depth > kMaxDepth) {
      return fail("candid value nesting too deep", std::to_string(depth));
    }
    if (value_budget_ == 0) {
      return fail("candid message decodes to too many values",
                  std::to_string(bytes_.size()) + " bytes");
    }
    --value_budget_;
    if (is_primitive(type->code)) {
      return read_scalar(type);
    }
    auto value = value_t{.type = type};
    switch (type->code) {
      case type_code_t::opt: {
        auto tag = read_byte();
        if (!tag) {
          return std::nullopt;
        }
        if (*tag > 1) {
          return fail("invalid opt tag", std::to_string(*tag));
        }
        if (*tag == 1) {
          auto inner = read_value(type->inner, depth + 1);
          if (!inner) {
            return std::nullopt;
          }
          value.items.push_back(std::move(*inner));
        }
        return value;
      }
      case type_code_t::vec: {
        auto count = read_uleb128();
        if (!count) {
          return std::nullopt;
        }
        auto zero_sized = type->inner->code == type_code_t::null ||
                          type->inner->code == type_code_t::reserved;
        if ((!zero_sized && *count > remaining()) ||
            (zero_sized && *count > kMaxZeroSizedVec)) {
          return fail("vec length exceeds message size",
                      std::to_string(*count));
        }
        value.items.reserve(*count);
        for (uint64_t i = 0; i < *count; ++i) {
          auto item = read_value(type->inner, depth + 1);
          if (!item) {
            return std::nullopt;
          }
          value.items.push_back(std::move(*item));
        }
        return value;
      }
      case type_code_t::record: {
        for (const auto& field : type->fields) {
          auto item = read_value(field.type, depth + 1);
          if (!item) {
            return std::nullopt;
          }
          value.items.push_back(std::move(*item));
        }
        return value;
      }
      case type_code_t::variant: {
        auto index = read_uleb128();
        if (!index) {
          return std::nullopt;
        }
        if (*index >= type->fields.size()) {
          return fail("variant index out of range", std::to_string(*index));
        }
        value.variant_index = static_cast<std::size_t>(*index);
        auto item = read_value(type->fields[value.variant_index].type,
                               depth + 1);
        if (!item) {
          return std::nullopt;
        }
        value.items.push_back(std::move(*item));
        return value;
      }
      default:
        return fail("unsupported candid type", std::to_string(
                                                   static_cast<int>(type->code)));
    }
  }

  bytes_view_t bytes_;
  vellum::common::error& error_;
  std::size_t offset_{};
  std::vector<raw_entry_t> raw_;
  std::vector<type_ptr_t> resolved_;
  std::vector<std::size_t> depths_;
  std::vector<bool> visiting_;
  std::size_t value_budget_{};
};

}  // namespace

std::optional<std::vector<value_t>> decode(const bytes_view_t& bytes,
                                           vellum::common::error& error) {
  auto values = reader{bytes, error}.read_message();
  if (!values) {
    spdlog::debug("Rejected candid message: {}", error.log);
  }
  return values;
}

}  // namespace vellum::encoding::candid
