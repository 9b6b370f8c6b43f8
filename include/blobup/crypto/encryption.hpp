#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace blobup::crypto {

// Thrown on RNG failure, malformed key material, or an OpenSSL error.
// Never recovered into default values.
class CryptoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Per-upload symmetric parameters, lowercase hex.
/// Handed to the caller; the engine keeps no copy.
struct EncryptionParams {
    std::string key;    ///< 32 bytes (64 hex chars)
    std::string nonce;  ///< 16 bytes (32 hex chars)
};

/// Draw a fresh 32-byte key and 16-byte nonce from the OpenSSL CSPRNG.
/// @throws CryptoError if the RNG fails
EncryptionParams generate_params();

/// AES-256-GCM with a 16-byte IV and empty AAD.
/// @return ciphertext followed by the 16-byte authentication tag
/// @throws CryptoError on bad params or any primitive failure
std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext,
                             const EncryptionParams& params);

/// Inverse of encrypt().
/// @throws CryptoError on bad params, short input, or tag mismatch
std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext,
                             const EncryptionParams& params);

/// SHA-256 of data as 64 lowercase hex chars
std::string sha256_hex(const uint8_t* data, size_t len);
std::string sha256_hex(const std::vector<uint8_t>& data);
std::string sha256_hex(const std::string& data);

std::string hex_encode(const uint8_t* data, size_t len);
std::string hex_encode(const std::vector<uint8_t>& data);

// nullopt on odd length or a non-hex digit
std::optional<std::vector<uint8_t>> hex_decode(const std::string& hex);

} // namespace blobup::crypto
