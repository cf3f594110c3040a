#include <stakeline/common/critical.hpp>
#include <stakeline/crypto/sha256.hpp>

#include <openssl/evp.h>

#include <initializer_list>
#include <memory>

namespace stakeline::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

stakeline::schema::hash32_t digest(
    std::initializer_list<stakeline::schema::bytes_view_t> parts) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    stakeline::common::critical("failed to initialize SHA-256 context");
  }
  for (const auto& part : parts) {
    if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      stakeline::common::critical("failed to update SHA-256 digest");
    }
  }
  auto output = stakeline::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    stakeline::common::critical("failed to finalize SHA-256 digest");
  }
  return output;
}

}  // namespace

stakeline::schema::hash32_t sha256(
    const stakeline::schema::bytes_view_t& bytes) {
  return digest({bytes});
}

stakeline::schema::hash32_t sha256(
    const stakeline::schema::bytes_view_t& left,
    const stakeline::schema::bytes_view_t& right) {
  return digest({left, right});
}

}  // namespace stakeline::crypto
