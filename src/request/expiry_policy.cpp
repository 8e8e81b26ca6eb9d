#include <vellum/request/expiry_policy.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <limits>

namespace vellum::request {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.expiry"};

}  // namespace

std::optional<expiry_policy_t> with_expiry_offset(
    const std::chrono::seconds seconds,
    vellum::common::error& error,
    const expiry_policy_t& base) {
  if (seconds.count() <= 0 || seconds > base.window) {
    vellum::common::fail(
        error, vellum::common::error_code::input,
        "ingress expiry must lie within the expiry window",
        std::to_string(seconds.count()) + "s", kCodespace);
    return std::nullopt;
  }
  auto policy = base;
  policy.offset = seconds;
  return policy;
}

std::optional<vellum::schema::timestamp_nanoseconds_t> compute_expiry(
    const vellum::schema::timestamp_nanoseconds_t now,
    vellum::common::error& error,
    const expiry_policy_t& policy) {
  auto offset = static_cast<uint64_t>(policy.offset.count());
  if (now > std::numeric_limits<uint64_t>::max() - offset) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "ingress expiry overflows", std::to_string(now),
                         kCodespace);
    return std::nullopt;
  }
  spdlog::debug("Ingress expiry {} (now {})", now + offset, now);
  return now + offset;
}

bool validate_expiry(const vellum::schema::timestamp_nanoseconds_t expiry,
                     const vellum::schema::timestamp_nanoseconds_t now,
                     const expiry_policy_t& policy) {
  if (expiry <= now) {
    return false;
  }
  return expiry - now <= static_cast<uint64_t>(policy.window.count());
}

vellum::schema::timestamp_nanoseconds_t now_nanoseconds() {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<vellum::schema::timestamp_nanoseconds_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch)
          .count());
}

std::optional<vellum::schema::bytes_t> make_nonce(
    vellum::common::error& error) {
  auto nonce = vellum::schema::bytes_t(kNonceSize);
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    vellum::common::fail(error, vellum::common::error_code::entropy,
                         "secure random generator unavailable",
                         std::to_string(ERR_get_error()), kCodespace);
    return std::nullopt;
  }
  return nonce;
}

}  // namespace vellum::request
