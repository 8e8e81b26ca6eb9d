#include <vellum/schema/principal.hpp>
#include <vellum/sha2/hash.hpp>

#include <boost/crc.hpp>
#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>

namespace vellum::schema {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.principal"};
constexpr auto kBase32Alphabet =
    std::string_view{"abcdefghijklmnopqrstuvwxyz234567"};

uint32_t crc32(const bytes_view_t& bytes) {
  auto crc = boost::crc_32_type{};
  crc.process_bytes(bytes.data(), bytes.size());
  return crc.checksum();
}

std::string base32_encode(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() * 8) + 4) / 5);
  auto buffer = uint32_t{0};
  auto bits = 0;
  for (const auto byte : bytes) {
    buffer = (buffer << 8u) | byte;
    bits += 8;
    while (bits >= 5) {
      out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1Fu]);
      bits -= 5;
    }
  }
  if (bits > 0) {
    out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1Fu]);
  }
  return out;
}

std::optional<bytes_t> base32_decode(const std::string_view text) {
  auto out = bytes_t{};
  out.reserve((text.size() * 5) / 8);
  auto buffer = uint32_t{0};
  auto bits = 0;
  for (const auto c : text) {
    auto position = kBase32Alphabet.find(c);
    if (position == std::string_view::npos) {
      return std::nullopt;
    }
    buffer = (buffer << 5u) | static_cast<uint32_t>(position);
    bits += 5;
    if (bits >= 8) {
      out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFFu));
      bits -= 8;
    }
  }
  // Leftover bits must be zero padding of the final quantum.
  if (bits >= 5 || (buffer & ((1u << bits) - 1u)) != 0) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

principal_t make_self_authenticating_principal(
    const bytes_view_t& der_public_key) {
  auto digest = vellum::sha2::sha224(der_public_key);
  auto principal = principal_t{};
  principal.bytes.reserve(digest.size() + 1);
  principal.bytes.insert(std::end(principal.bytes), std::begin(digest),
                         std::end(digest));
  principal.bytes.push_back(kSelfAuthenticatingSuffix);
  return principal;
}

principal_t make_anonymous_principal() {
  return principal_t{.bytes = bytes_t{kAnonymousSuffix}};
}

principal_t make_canister_principal(const uint64_t canister_index) {
  // Canister ids are the big-endian index followed by the opaque-id class
  // bytes 0x01 0x01.
  auto principal = principal_t{};
  principal.bytes.resize(8);
  boost::endian::store_big_u64(principal.bytes.data(), canister_index);
  principal.bytes.push_back(0x01);
  principal.bytes.push_back(0x01);
  return principal;
}

std::optional<principal_t> try_make_principal(const bytes_view_t& bytes,
                                              vellum::common::error& error) {
  if (bytes.size() > kMaxPrincipalLength) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "principal is longer than 29 bytes",
                         std::to_string(bytes.size()), kCodespace);
    return std::nullopt;
  }
  return principal_t{.bytes = make_bytes(bytes)};
}

std::string to_text(const principal_t& principal) {
  auto material = bytes_t(4);
  boost::endian::store_big_u32(material.data(),
                               crc32(make_bytes_view(principal.bytes)));
  material.insert(std::end(material), std::begin(principal.bytes),
                  std::end(principal.bytes));
  auto encoded = base32_encode(make_bytes_view(material));

  auto out = std::string{};
  out.reserve(encoded.size() + (encoded.size() / 5));
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    if (i > 0 && (i % 5) == 0) {
      out.push_back('-');
    }
    out.push_back(encoded[i]);
  }
  return out;
}

std::optional<principal_t> try_parse_principal(const std::string_view text,
                                               vellum::common::error& error) {
  auto compact = std::string{};
  compact.reserve(text.size());
  auto group = std::size_t{0};
  for (const auto c : text) {
    if (c == '-') {
      if (group != 5) {
        vellum::common::fail(error, vellum::common::error_code::input,
                             "malformed principal grouping",
                             std::string{text}, kCodespace);
        return std::nullopt;
      }
      group = 0;
      continue;
    }
    compact.push_back(static_cast<char>(
        std::tolower(static_cast<unsigned char>(c))));
    ++group;
  }
  if (compact.empty() || group == 0 || group > 5) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "malformed principal grouping", std::string{text},
                         kCodespace);
    return std::nullopt;
  }

  auto decoded = base32_decode(compact);
  if (!decoded || decoded->size() < 4) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "principal is not valid base32", std::string{text},
                         kCodespace);
    return std::nullopt;
  }

  auto body = bytes_view_t{decoded->data() + 4, decoded->size() - 4};
  auto principal = try_make_principal(body, error);
  if (!principal) {
    return std::nullopt;
  }
  if (boost::endian::load_big_u32(decoded->data()) != crc32(body)) {
    vellum::common::fail(error, vellum::common::error_code::integrity,
                         "principal checksum mismatch", std::string{text},
                         kCodespace);
    return std::nullopt;
  }
  // Text and bytes stay one to one: only the canonical grouping is accepted.
  auto lowered = std::string{};
  std::ranges::transform(text, std::back_inserter(lowered), [](const char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  if (to_text(*principal) != lowered) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "principal is not in canonical form",
                         std::string{text}, kCodespace);
    return std::nullopt;
  }
  return principal;
}

principal_t ledger_canister_id() {
  return make_canister_principal(2);
}

principal_t governance_canister_id() {
  return make_canister_principal(1);
}

}  // namespace vellum::schema
