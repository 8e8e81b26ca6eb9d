#include <vellum/schema/account_identifier.hpp>
#include <vellum/sha2/hash.hpp>

#include <boost/crc.hpp>
#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <iterator>

namespace vellum::schema {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.account"};
constexpr auto kAccountDomainSeparator = std::string_view{"\x0A" "account-id"};
constexpr auto kNeuronStakeDomain = std::string_view{"neuron-stake"};

uint32_t crc32(const bytes_view_t& bytes) {
  auto crc = boost::crc_32_type{};
  crc.process_bytes(bytes.data(), bytes.size());
  return crc.checksum();
}

}  // namespace

account_identifier_t derive_account_identifier(
    const principal_t& principal,
    const std::optional<subaccount_t>& subaccount) {
  auto material = make_bytes(kAccountDomainSeparator);
  material.insert(std::end(material), std::begin(principal.bytes),
                  std::end(principal.bytes));
  auto effective = subaccount.value_or(subaccount_t{});
  material.insert(std::end(material), std::begin(effective),
                  std::end(effective));

  auto hash = vellum::sha2::sha224(make_bytes_view(material));
  auto account = account_identifier_t{};
  boost::endian::store_big_u32(account.bytes.data(),
                               crc32(bytes_view_t{hash.data(), hash.size()}));
  std::ranges::copy(hash, std::begin(account.bytes) + 4);
  return account;
}

std::string to_text(const account_identifier_t& account) {
  return to_hex(bytes_view_t{account.bytes.data(), account.bytes.size()});
}

bool validate_account_identifier(const std::string_view text) {
  auto error = vellum::common::error{};
  return try_parse_account_identifier(text, error).has_value();
}

std::optional<account_identifier_t> try_parse_account_identifier(
    const std::string_view text,
    vellum::common::error& error) {
  if (text.size() != 64) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "account identifier must be 64 hex characters",
                         std::string{text}, kCodespace);
    return std::nullopt;
  }
  auto decoded = try_make_hash32(text);
  if (!decoded) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "account identifier is not hex", std::string{text},
                         kCodespace);
    return std::nullopt;
  }
  auto expected = crc32(bytes_view_t{decoded->data() + 4, 28});
  if (boost::endian::load_big_u32(decoded->data()) != expected) {
    vellum::common::fail(error, vellum::common::error_code::integrity,
                         "account identifier checksum mismatch",
                         std::string{text}, kCodespace);
    return std::nullopt;
  }
  return account_identifier_t{.bytes = *decoded};
}

std::optional<subaccount_t> try_make_subaccount(const bytes_view_t& bytes,
                                                vellum::common::error& error) {
  auto subaccount = subaccount_t{};
  if (bytes.size() != subaccount.size()) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "subaccount must be exactly 32 bytes",
                         std::to_string(bytes.size()), kCodespace);
    return std::nullopt;
  }
  std::ranges::copy(bytes, std::begin(subaccount));
  return subaccount;
}

std::optional<subaccount_t> try_parse_subaccount(const std::string_view hex,
                                                 vellum::common::error& error) {
  auto decoded = try_from_hex(hex);
  if (!decoded) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "subaccount is not hex", std::string{hex},
                         kCodespace);
    return std::nullopt;
  }
  return try_make_subaccount(make_bytes_view(*decoded), error);
}

subaccount_t make_neuron_staking_subaccount(const principal_t& controller,
                                            const uint64_t nonce) {
  auto nonce_be = std::array<uint8_t, 8>{};
  boost::endian::store_big_u64(nonce_be.data(), nonce);
  return vellum::sha2::sha256_hasher{}
      .update(static_cast<uint8_t>(kNeuronStakeDomain.size()))
      .update(kNeuronStakeDomain)
      .update(make_bytes_view(controller.bytes))
      .update(bytes_view_t{nonce_be.data(), nonce_be.size()})
      .finalize();
}

}  // namespace vellum::schema
