#include <vellum/encoding/candid/codec.hpp>
#include <vellum/request/request_id.hpp>
#include <vellum/sha2/hash.hpp>

#include <algorithm>
#include <iterator>

namespace vellum::request {

namespace {

using vellum::schema::bytes_t;
using vellum::schema::hash32_t;

hash32_t hash_value(const content_value_t& value) {
  return std::visit(
      overloaded{
          [](const bytes_t& blob) {
            return vellum::sha2::sha256(vellum::schema::make_bytes_view(blob));
          },
          [](const std::string& text) { return vellum::sha2::sha256(text); },
          [](const uint64_t nat) {
            auto encoded = bytes_t{};
            vellum::encoding::candid::write_uleb128(nat, encoded);
            return vellum::sha2::sha256(
                vellum::schema::make_bytes_view(encoded));
          },
          [](const content_array_t& array) {
            auto hasher = vellum::sha2::sha256_hasher{};
            for (const auto& item : array) {
              auto digest = hash_value(item);
              hasher.update(vellum::schema::bytes_view_t{digest});
            }
            return hasher.finalize();
          },
          [](const content_map_t& map) { return compute_request_id(map); }},
      value.value);
}

}  // namespace

vellum::schema::request_id_t compute_request_id(const content_map_t& content) {
  auto pairs = std::vector<std::array<uint8_t, 64>>{};
  pairs.reserve(content.size());
  for (const auto& field : content) {
    auto key_hash = vellum::sha2::sha256(field.key);
    auto value_hash = hash_value(field.value);
    auto pair = std::array<uint8_t, 64>{};
    std::ranges::copy(key_hash, std::begin(pair));
    std::ranges::copy(value_hash, std::begin(pair) + 32);
    pairs.push_back(pair);
  }
  std::ranges::sort(pairs);

  auto hasher = vellum::sha2::sha256_hasher{};
  for (const auto& pair : pairs) {
    hasher.update(vellum::schema::bytes_view_t{pair});
  }
  return hasher.finalize();
}

vellum::schema::request_id_t compute_request_id(
    const request_content_t& content) {
  return compute_request_id(to_content_map(content));
}

bytes_t make_signable(const vellum::schema::request_id_t& request_id) {
  auto out = vellum::schema::make_bytes(kRequestDomainSeparator);
  out.insert(std::end(out), std::begin(request_id), std::end(request_id));
  return out;
}

}  // namespace vellum::request
