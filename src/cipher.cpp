#include "cipher.h"

#include "errors.h"
#include "sha256.h"
#include "util.h"

#include "mbedtls/ctr_drbg.h"
#include "mbedtls/entropy.h"
#include "mbedtls/gcm.h"
#include "mbedtls/platform_util.h"

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace strata {

namespace {

constexpr std::size_t kHeaderSize{ kCipherMagic.size() + kCipherNonceSize +
                                   kCipherTagSize };
constexpr char kDrbgPersonalization[]{ "strata-cipher" };

std::vector<unsigned char> make_aad(std::string_view context) {
  std::vector<unsigned char> aad(kCipherMagic.begin(), kCipherMagic.end());
  aad.insert(aad.end(), context.begin(), context.end());
  return aad;
}

struct gcm_ctx {
  mbedtls_gcm_context ctx;

  explicit gcm_ctx(cipher_key_t const &key) {
    mbedtls_gcm_init(&ctx);
    if (mbedtls_gcm_setkey(&ctx,
                           MBEDTLS_CIPHER_ID_AES,
                           key.data(),
                           static_cast<unsigned>(key.size() * 8)) != 0) {
      mbedtls_gcm_free(&ctx);
      throw std::runtime_error("cipher: mbedtls_gcm_setkey failed");
    }
  }
  ~gcm_ctx() { mbedtls_gcm_free(&ctx); }

  gcm_ctx(gcm_ctx const &) = delete;
  gcm_ctx &operator=(gcm_ctx const &) = delete;
};

}  // namespace

std::vector<unsigned char> cipher_random_bytes(std::size_t count) {
  mbedtls_entropy_context entropy;
  mbedtls_ctr_drbg_context drbg;
  mbedtls_entropy_init(&entropy);
  mbedtls_ctr_drbg_init(&drbg);

  std::unique_ptr<decltype(entropy), decltype(&mbedtls_entropy_free)> entropy_scope(
      &entropy,
      &mbedtls_entropy_free);
  std::unique_ptr<decltype(drbg), decltype(&mbedtls_ctr_drbg_free)> drbg_scope(
      &drbg,
      &mbedtls_ctr_drbg_free);

  if (mbedtls_ctr_drbg_seed(&drbg,
                            mbedtls_entropy_func,
                            &entropy,
                            reinterpret_cast<unsigned char const *>(kDrbgPersonalization),
                            sizeof(kDrbgPersonalization) - 1) != 0) {
    throw std::runtime_error("cipher: mbedtls_ctr_drbg_seed failed");
  }

  std::vector<unsigned char> out(count);
  if (count > 0 && mbedtls_ctr_drbg_random(&drbg, out.data(), out.size()) != 0) {
    throw std::runtime_error("cipher: mbedtls_ctr_drbg_random failed");
  }
  return out;
}

cipher_key_t cipher_generate_key() {
  auto bytes{ cipher_random_bytes(kCipherKeySize) };
  cipher_key_t key{};
  std::memcpy(key.data(), bytes.data(), key.size());
  cipher_zeroize(bytes.data(), bytes.size());
  return key;
}

cipher_key_t cipher_key_from_hex(std::string_view hex) {
  auto const trimmed{ util_trim(hex) };
  if (trimmed.size() != kCipherKeySize * 2) {
    throw std::runtime_error("key must be " + std::to_string(kCipherKeySize * 2) +
                             " hex characters, got " + std::to_string(trimmed.size()));
  }

  auto bytes{ util_hex_to_bytes(std::string{ trimmed }) };
  cipher_key_t key{};
  std::memcpy(key.data(), bytes.data(), key.size());
  cipher_zeroize(bytes.data(), bytes.size());
  return key;
}

std::string cipher_key_id(cipher_key_t const &key) {
  auto const digest{ sha256(key.data(), key.size()) };
  return util_bytes_to_hex(digest.data(), 8);
}

std::vector<unsigned char> cipher_seal(cipher_key_t const &key,
                                       std::string_view context,
                                       void const *plaintext,
                                       std::size_t length) {
  auto const nonce{ cipher_random_bytes(kCipherNonceSize) };
  auto const aad{ make_aad(context) };

  std::vector<unsigned char> sealed(kHeaderSize + length);
  std::memcpy(sealed.data(), kCipherMagic.data(), kCipherMagic.size());
  std::memcpy(sealed.data() + kCipherMagic.size(), nonce.data(), nonce.size());

  unsigned char *const tag{ sealed.data() + kCipherMagic.size() + kCipherNonceSize };
  unsigned char *const body{ sealed.data() + kHeaderSize };

  gcm_ctx gcm{ key };
  if (mbedtls_gcm_crypt_and_tag(&gcm.ctx,
                                MBEDTLS_GCM_ENCRYPT,
                                length,
                                nonce.data(),
                                nonce.size(),
                                aad.data(),
                                aad.size(),
                                static_cast<unsigned char const *>(plaintext),
                                body,
                                kCipherTagSize,
                                tag) != 0) {
    throw std::runtime_error("cipher: mbedtls_gcm_crypt_and_tag failed");
  }

  return sealed;
}

std::vector<unsigned char> cipher_open(cipher_key_t const &key,
                                       std::string_view context,
                                       std::vector<unsigned char> const &sealed) {
  if (sealed.size() < kHeaderSize ||
      std::memcmp(sealed.data(), kCipherMagic.data(), kCipherMagic.size()) != 0) {
    throw credential_error(error_kind::decryption_error,
                           "not a sealed secret bundle (bad header)");
  }

  auto const aad{ make_aad(context) };
  unsigned char const *const nonce{ sealed.data() + kCipherMagic.size() };
  unsigned char const *const tag{ nonce + kCipherNonceSize };
  unsigned char const *const body{ sealed.data() + kHeaderSize };
  std::size_t const body_size{ sealed.size() - kHeaderSize };

  std::vector<unsigned char> plaintext(body_size);

  gcm_ctx gcm{ key };
  int const rc{ mbedtls_gcm_auth_decrypt(&gcm.ctx,
                                         body_size,
                                         nonce,
                                         kCipherNonceSize,
                                         aad.data(),
                                         aad.size(),
                                         tag,
                                         kCipherTagSize,
                                         body,
                                         plaintext.data()) };
  if (rc == MBEDTLS_ERR_GCM_AUTH_FAILED) {
    cipher_zeroize(plaintext.data(), plaintext.size());
    throw credential_error(error_kind::decryption_error,
                           "authentication failed (wrong key, wrong profile, or "
                           "tampered ciphertext)");
  }
  if (rc != 0) {
    cipher_zeroize(plaintext.data(), plaintext.size());
    throw credential_error(error_kind::decryption_error,
                           "mbedtls_gcm_auth_decrypt failed: " + std::to_string(rc));
  }

  return plaintext;
}

void cipher_zeroize(void *data, std::size_t length) {
  if (data && length > 0) { mbedtls_platform_zeroize(data, length); }
}

}  // namespace strata
