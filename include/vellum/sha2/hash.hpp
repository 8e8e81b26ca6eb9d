#pragma once
#include <vellum/schema/primitives.hpp>

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace vellum::sha2 {

/// Incremental SHA-256 over an OpenSSL digest context.
class sha256_hasher final {
 public:
  sha256_hasher();

  sha256_hasher& update(const std::string_view& str);
  sha256_hasher& update(const vellum::schema::bytes_view_t& bytes);
  sha256_hasher& update(uint8_t byte);

  vellum::schema::hash32_t finalize();

 private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
};

vellum::schema::hash32_t sha256(const std::string_view& str);
vellum::schema::hash32_t sha256(const vellum::schema::bytes_view_t& bytes);
vellum::schema::hash28_t sha224(const vellum::schema::bytes_view_t& bytes);

}  // namespace vellum::sha2
