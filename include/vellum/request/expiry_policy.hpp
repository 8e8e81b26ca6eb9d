#pragma once
#include <vellum/common/error.hpp>
#include <vellum/schema/primitives.hpp>

#include <chrono>
#include <optional>

// Ingress expiry: a signed request is only accepted while its expiry lies in
// (now, now + window]. Expiries are set `drift` short of the window so a
// replica whose clock runs ahead still accepts them.
namespace vellum::request {

inline constexpr auto kNonceSize = std::size_t{32};

struct expiry_policy_t final {
  std::chrono::nanoseconds window{std::chrono::minutes{5}};
  std::chrono::nanoseconds drift{std::chrono::seconds{60}};
  /// Distance between signing time and expiry.
  std::chrono::nanoseconds offset{std::chrono::minutes{5} -
                                  std::chrono::seconds{60}};
};

/// Policy whose expiries lie `seconds` after signing. Fails unless
/// 0 < seconds <= window.
std::optional<expiry_policy_t> with_expiry_offset(
    std::chrono::seconds seconds,
    vellum::common::error& error,
    const expiry_policy_t& base = {});

/// now + offset, failing on overflow of the nanosecond timestamp.
std::optional<vellum::schema::timestamp_nanoseconds_t> compute_expiry(
    vellum::schema::timestamp_nanoseconds_t now,
    vellum::common::error& error,
    const expiry_policy_t& policy = {});

/// now < expiry <= now + window.
bool validate_expiry(vellum::schema::timestamp_nanoseconds_t expiry,
                     vellum::schema::timestamp_nanoseconds_t now,
                     const expiry_policy_t& policy = {});

/// Nanoseconds since the Unix epoch from the system clock.
vellum::schema::timestamp_nanoseconds_t now_nanoseconds();

/// 32 bytes from the OpenSSL CSPRNG; an entropy error when it cannot
/// deliver.
std::optional<vellum::schema::bytes_t> make_nonce(vellum::common::error& error);

}  // namespace vellum::request
