#include <vellum/common/critical.hpp>
#include <vellum/encoding/candid/codec.hpp>

#include <boost/endian/conversion.hpp>

#include <bit>
#include <iterator>
#include <map>

namespace vellum::encoding::candid {

namespace {

using vellum::schema::bytes_t;

/// Composite types are emitted post order and deduplicated by their encoded
/// entry, so structurally equal types share one table slot.
class type_table final {
 public:
  bytes_t reference(const type_t& type) {
    auto out = bytes_t{};
    if (is_primitive(type.code)) {
      write_sleb128(static_cast<int32_t>(type.code), out);
      return out;
    }
    auto entry = bytes_t{};
    write_sleb128(static_cast<int32_t>(type.code), entry);
    switch (type.code) {
      case type_code_t::opt:
      case type_code_t::vec: {
        auto inner = reference(*type.inner);
        entry.insert(std::end(entry), std::begin(inner), std::end(inner));
        break;
      }
      case type_code_t::record:
      case type_code_t::variant: {
        write_uleb128(type.fields.size(), entry);
        for (const auto& field : type.fields) {
          auto inner = reference(*field.type);
          write_uleb128(field.id, entry);
          entry.insert(std::end(entry), std::begin(inner), std::end(inner));
        }
        break;
      }
      default:
        vellum::common::critical("unsupported candid type in encoder");
    }
    auto [it, inserted] = index_.try_emplace(entry, entries_.size());
    if (inserted) {
      entries_.push_back(std::move(entry));
    }
    write_sleb128(static_cast<int64_t>(it->second), out);
    return out;
  }

  void write(bytes_t& out) const {
    write_uleb128(entries_.size(), out);
    for (const auto& entry : entries_) {
      out.insert(std::end(out), std::begin(entry), std::end(entry));
    }
  }

 private:
  std::vector<bytes_t> entries_;
  std::map<bytes_t, std::size_t> index_;
};

template <typename T>
void write_le(const T value, bytes_t& out) {
  auto le = boost::endian::native_to_little(value);
  auto* begin = reinterpret_cast<const uint8_t*>(&le);
  out.insert(std::end(out), begin, begin + sizeof(T));
}

void write_value(const value_t& value, bytes_t& out) {
  switch (value.type->code) {
    case type_code_t::null:
    case type_code_t::reserved:
      break;
    case type_code_t::boolean:
      out.push_back(std::get<bool>(value.scalar) ? 1 : 0);
      break;
    case type_code_t::nat:
      write_uleb128(std::get<uint64_t>(value.scalar), out);
      break;
    case type_code_t::integer:
      write_sleb128(std::get<int64_t>(value.scalar), out);
      break;
    case type_code_t::nat8:
      out.push_back(static_cast<uint8_t>(std::get<uint64_t>(value.scalar)));
      break;
    case type_code_t::nat16:
      write_le(static_cast<uint16_t>(std::get<uint64_t>(value.scalar)), out);
      break;
    case type_code_t::nat32:
      write_le(static_cast<uint32_t>(std::get<uint64_t>(value.scalar)), out);
      break;
    case type_code_t::nat64:
      write_le(std::get<uint64_t>(value.scalar), out);
      break;
    case type_code_t::int8:
      out.push_back(static_cast<uint8_t>(std::get<int64_t>(value.scalar)));
      break;
    case type_code_t::int16:
      write_le(static_cast<int16_t>(std::get<int64_t>(value.scalar)), out);
      break;
    case type_code_t::int32:
      write_le(static_cast<int32_t>(std::get<int64_t>(value.scalar)), out);
      break;
    case type_code_t::int64:
      write_le(std::get<int64_t>(value.scalar), out);
      break;
    case type_code_t::float32:
      write_le(std::bit_cast<uint32_t>(
                   static_cast<float>(std::get<double>(value.scalar))),
               out);
      break;
    case type_code_t::float64:
      write_le(std::bit_cast<uint64_t>(std::get<double>(value.scalar)), out);
      break;
    case type_code_t::text: {
      const auto& text = std::get<std::string>(value.scalar);
      write_uleb128(text.size(), out);
      out.insert(std::end(out), std::begin(text), std::end(text));
      break;
    }
    case type_code_t::principal: {
      const auto& principal =
          std::get<vellum::schema::principal_t>(value.scalar);
      out.push_back(0x01);
      write_uleb128(principal.bytes.size(), out);
      out.insert(std::end(out), std::begin(principal.bytes),
                 std::end(principal.bytes));
      break;
    }
    case type_code_t::opt:
      out.push_back(value.items.empty() ? 0 : 1);
      if (!value.items.empty()) {
        write_value(value.items.front(), out);
      }
      break;
    case type_code_t::vec:
      write_uleb128(value.items.size(), out);
      for (const auto& item : value.items) {
        write_value(item, out);
      }
      break;
    case type_code_t::record:
      for (const auto& item : value.items) {
        write_value(item, out);
      }
      break;
    case type_code_t::variant:
      write_uleb128(value.variant_index, out);
      write_value(value.items.front(), out);
      break;
    default:
      vellum::common::critical("unsupported candid value in encoder");
  }
}

}  // namespace

void write_uleb128(uint64_t value, bytes_t& out) {
  do {
    auto byte = static_cast<uint8_t>(value & 0x7Fu);
    value >>= 7u;
    if (value != 0) {
      byte |= 0x80u;
    }
    out.push_back(byte);
  } while (value != 0);
}

void write_sleb128(int64_t value, bytes_t& out) {
  while (true) {
    auto byte = static_cast<uint8_t>(value & 0x7F);
    value >>= 7;
    if ((value == 0 && (byte & 0x40u) == 0) ||
        (value == -1 && (byte & 0x40u) != 0)) {
      out.push_back(byte);
      return;
    }
    out.push_back(byte | 0x80u);
  }
}

bytes_t encode(const std::vector<value_t>& args) {
  auto table = type_table{};
  auto references = bytes_t{};
  for (const auto& arg : args) {
    auto reference = table.reference(*arg.type);
    references.insert(std::end(references), std::begin(reference),
                      std::end(reference));
  }

  auto out = vellum::schema::make_bytes(kMagic);
  table.write(out);
  write_uleb128(args.size(), out);
  out.insert(std::end(out), std::begin(references), std::end(references));
  for (const auto& arg : args) {
    write_value(arg, out);
  }
  return out;
}

}  // namespace vellum::encoding::candid
