#include <vellum/common/critical.hpp>
#include <vellum/sha2/hash.hpp>

namespace vellum::sha2 {

namespace {

template <typename Digest>
Digest one_shot(const EVP_MD* algorithm,
                const vellum::schema::bytes_view_t& bytes) {
  auto output = Digest{};
  auto size = static_cast<unsigned int>(output.size());
  if (EVP_Digest(bytes.data(), bytes.size(), output.data(), &size, algorithm,
                 nullptr) != 1 ||
      size != output.size()) {
    vellum::common::critical("OpenSSL digest failed");
  }
  return output;
}

}  // namespace

sha256_hasher::sha256_hasher() : context_{EVP_MD_CTX_new(), EVP_MD_CTX_free} {
  if (!context_ ||
      EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1) {
    vellum::common::critical("failed to initialize SHA-256 context");
  }
}

sha256_hasher& sha256_hasher::update(const std::string_view& str) {
  if (EVP_DigestUpdate(context_.get(), str.data(), str.size()) != 1) {
    vellum::common::critical("SHA-256 update failed");
  }
  return *this;
}

sha256_hasher& sha256_hasher::update(
    const vellum::schema::bytes_view_t& bytes) {
  if (EVP_DigestUpdate(context_.get(), bytes.data(), bytes.size()) != 1) {
    vellum::common::critical("SHA-256 update failed");
  }
  return *this;
}

sha256_hasher& sha256_hasher::update(const uint8_t byte) {
  return update(vellum::schema::bytes_view_t{&byte, 1});
}

vellum::schema::hash32_t sha256_hasher::finalize() {
  auto output = vellum::schema::hash32_t{};
  auto size = static_cast<unsigned int>(output.size());
  if (EVP_DigestFinal_ex(context_.get(), output.data(), &size) != 1 ||
      size != output.size()) {
    vellum::common::critical("SHA-256 finalize failed");
  }
  return output;
}

vellum::schema::hash32_t sha256(const std::string_view& str) {
  return one_shot<vellum::schema::hash32_t>(
      EVP_sha256(), vellum::schema::make_bytes_view(str));
}

vellum::schema::hash32_t sha256(const vellum::schema::bytes_view_t& bytes) {
  return one_shot<vellum::schema::hash32_t>(EVP_sha256(), bytes);
}

vellum::schema::hash28_t sha224(const vellum::schema::bytes_view_t& bytes) {
  return one_shot<vellum::schema::hash28_t>(EVP_sha224(), bytes);
}

}  // namespace vellum::sha2
