#pragma once

#include <vellum/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: call type.
// Update calls go through consensus and return a request id to poll; query
// calls are answered directly by one replica.
namespace vellum::schema {

enum class call_type_t : uint8_t { update = 0, query = 1 };

inline constexpr auto kCallTypeMappings = std::array{
    std::pair<std::string_view, call_type_t>{"update", call_type_t::update},
    std::pair<std::string_view, call_type_t>{"query", call_type_t::query}};

template <>
inline std::optional<call_type_t> try_from_string<call_type_t>(
    const std::string_view value) {
  return from_string(value, kCallTypeMappings);
}

inline constexpr std::string_view to_string(const call_type_t value) {
  return to_string(value, kCallTypeMappings).value_or("unknown");
}

}  // namespace vellum::schema
