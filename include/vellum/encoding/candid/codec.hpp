#pragma once
#include <vellum/common/error.hpp>
#include <vellum/encoding/candid/value.hpp>
#include <vellum/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <vector>

// Candid binary format: "DIDL", the type table, the argument types, then
// the argument values.
namespace vellum::encoding::candid {

inline constexpr auto kMagic = std::string_view{"DIDL"};
inline constexpr auto kMaxDepth = std::size_t{64};

vellum::schema::bytes_t encode(const std::vector<value_t>& args);

/// Decodes a complete message. Func and service types are not supported;
/// recursive types are rejected; trailing bytes are an error.
std::optional<std::vector<value_t>> decode(
    const vellum::schema::bytes_view_t& bytes,
    vellum::common::error& error);

void write_uleb128(uint64_t value, vellum::schema::bytes_t& out);
void write_sleb128(int64_t value, vellum::schema::bytes_t& out);

}  // namespace vellum::encoding::candid
