#pragma once

#include <vellum/schema/enum_string.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace vellum::common {

/// Failure classes surfaced by the signing engine. Every class is
/// deterministic for a given input, so none of them is worth retrying.
enum class error_code : uint32_t {
  none = 0,
  // Malformed or out-of-range user supplied field.
  input = 1,
  // Malformed or unsupported key material.
  key = 2,
  // Malformed bytes handed to a decoder.
  encoding = 3,
  // Checksum mismatch.
  integrity = 4,
  // No cryptographically secure randomness available.
  entropy = 5,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"none", error_code::none},
    std::pair<std::string_view, error_code>{"input", error_code::input},
    std::pair<std::string_view, error_code>{"key", error_code::key},
    std::pair<std::string_view, error_code>{"encoding", error_code::encoding},
    std::pair<std::string_view, error_code>{"integrity",
                                            error_code::integrity},
    std::pair<std::string_view, error_code>{"entropy", error_code::entropy}};

inline constexpr std::string_view to_string(const error_code value) {
  return vellum::schema::to_string(value, kErrorCodeMappings)
      .value_or("unknown");
}

/// Failure report filled in by every fallible operation.
///
/// `log` is a short, stable description of what went wrong; `info` carries
/// the offending value or the underlying library message; `codespace` names
/// the component that rejected the input.
struct error final {
  error_code code{error_code::none};
  std::string log;
  std::string info;
  std::string codespace;
};

inline void fail(error& out,
                 const error_code code,
                 std::string log,
                 std::string info,
                 const std::string_view codespace) {
  out.code = code;
  out.log = std::move(log);
  out.info = std::move(info);
  out.codespace = std::string{codespace};
}

/// One line suitable for a terminal: "<codespace>: <code> error: <log> (<info>)".
std::string describe(const error& value);

}  // namespace vellum::common
