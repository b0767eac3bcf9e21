#include "sha256.h"

#include "mbedtls/sha256.h"
#include "util.h"

#include <memory>
#include <stdexcept>

namespace strata {

sha256_t sha256(void const *data, std::size_t length) {
  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);

  std::unique_ptr<decltype(ctx), decltype(&mbedtls_sha256_free)> ctx_scope(
      &ctx,
      &mbedtls_sha256_free);

  if (mbedtls_sha256_starts(&ctx, 0)) {
    throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
  }

  if (length > 0 &&
      mbedtls_sha256_update(&ctx, static_cast<unsigned char const *>(data), length)) {
    throw std::runtime_error("sha256: mbedtls_sha256_update failed");
  }

  sha256_t digest{};
  if (mbedtls_sha256_finish(&ctx, digest.data())) {
    throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
  }

  return digest;
}

std::string sha256_hex(std::string_view text) {
  auto const digest{ sha256(text) };
  return util_bytes_to_hex(digest.data(), digest.size());
}

}  // namespace strata
