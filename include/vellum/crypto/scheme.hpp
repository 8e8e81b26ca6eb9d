#pragma once

#include <vellum/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vellum::crypto {

enum class signature_scheme_t : uint8_t { ed25519 = 0, secp256k1 = 1 };

inline constexpr auto kSignatureSchemeMappings = std::array{
    std::pair<std::string_view, signature_scheme_t>{
        "ed25519", signature_scheme_t::ed25519},
    std::pair<std::string_view, signature_scheme_t>{
        "secp256k1", signature_scheme_t::secp256k1}};

inline constexpr std::string_view to_string(const signature_scheme_t value) {
  return vellum::schema::to_string(value, kSignatureSchemeMappings)
      .value_or("unknown");
}

}  // namespace vellum::crypto

namespace vellum::schema {

template <>
inline std::optional<vellum::crypto::signature_scheme_t>
try_from_string<vellum::crypto::signature_scheme_t>(
    const std::string_view value) {
  return from_string(value, vellum::crypto::kSignatureSchemeMappings);
}

}  // namespace vellum::schema
