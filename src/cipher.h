#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// AES-256-GCM sealing for secret bundles.
//
// Sealed layout: "STRSEC01" | nonce (12) | tag (16) | ciphertext
//
// The additional authenticated data is the magic followed by the caller's
// context string (the profile name), so a bundle sealed for one profile never
// opens under another even when both share key material.

inline constexpr std::size_t kCipherKeySize{ 32 };
inline constexpr std::size_t kCipherNonceSize{ 12 };
inline constexpr std::size_t kCipherTagSize{ 16 };
inline constexpr std::string_view kCipherMagic{ "STRSEC01" };

using cipher_key_t = std::array<unsigned char, kCipherKeySize>;

// Random bytes from a CTR-DRBG seeded by the platform entropy source.
std::vector<unsigned char> cipher_random_bytes(std::size_t count);

cipher_key_t cipher_generate_key();

// Parse 64 hex characters (surrounding whitespace ignored). Throws
// std::runtime_error describing the defect.
cipher_key_t cipher_key_from_hex(std::string_view hex);

// Short stable identifier for logs; never reveals key material.
std::string cipher_key_id(cipher_key_t const &key);

std::vector<unsigned char> cipher_seal(cipher_key_t const &key,
                                       std::string_view context,
                                       void const *plaintext,
                                       std::size_t length);

// Throws credential_error(decryption_error) on a malformed header or a failed
// authentication check.
std::vector<unsigned char> cipher_open(cipher_key_t const &key,
                                       std::string_view context,
                                       std::vector<unsigned char> const &sealed);

// Overwrite memory that held key or plaintext material.
void cipher_zeroize(void *data, std::size_t length);

}  // namespace strata
