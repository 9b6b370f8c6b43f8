#include "blobup/crypto/encryption.hpp"
#include "blobup/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <climits>
#include <memory>

namespace blobup::crypto {

using namespace blobup::constants;

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

struct KeyMaterial {
    std::vector<uint8_t> key;
    std::vector<uint8_t> nonce;
};

KeyMaterial decode_params(const EncryptionParams& params) {
    auto key = hex_decode(params.key);
    if (!key || key->size() != KEY_SIZE) {
        throw CryptoError("Invalid key: expected " + std::to_string(KEY_SIZE * 2) + " hex chars");
    }
    auto nonce = hex_decode(params.nonce);
    if (!nonce || nonce->size() != NONCE_SIZE) {
        throw CryptoError("Invalid nonce: expected " + std::to_string(NONCE_SIZE * 2) + " hex chars");
    }
    return {std::move(*key), std::move(*nonce)};
}

CipherCtx new_context() {
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw CryptoError("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

void check_length(size_t len) {
    if (len > static_cast<size_t>(INT_MAX)) {
        throw CryptoError("Payload too large for a single GCM pass");
    }
}

} // namespace

EncryptionParams generate_params() {
    uint8_t key[KEY_SIZE];
    uint8_t nonce[NONCE_SIZE];

    if (RAND_bytes(key, sizeof(key)) != 1 || RAND_bytes(nonce, sizeof(nonce)) != 1) {
        throw CryptoError("RAND_bytes failed");
    }

    EncryptionParams params;
    params.key = hex_encode(key, sizeof(key));
    params.nonce = hex_encode(nonce, sizeof(nonce));
    OPENSSL_cleanse(key, sizeof(key));
    return params;
}

std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext,
                             const EncryptionParams& params) {
    KeyMaterial km = decode_params(params);
    check_length(plaintext.size());

    CipherCtx ctx = new_context();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, km.key.data(), km.nonce.data()) != 1) {
        throw CryptoError("AES-256-GCM init failed");
    }

    std::vector<uint8_t> out(plaintext.size() + TAG_SIZE);
    int outl = 0;
    int finl = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), out.data(), &outl, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
        throw CryptoError("AES-256-GCM encrypt failed");
    }
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + outl, &finl) != 1) {
        throw CryptoError("AES-256-GCM finalize failed");
    }
    if (static_cast<size_t>(outl + finl) != plaintext.size()) {
        throw CryptoError("AES-256-GCM produced unexpected length");
    }

    // Tag is appended after the ciphertext
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                            out.data() + plaintext.size()) != 1) {
        throw CryptoError("AES-256-GCM tag export failed");
    }

    return out;
}

std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext,
                             const EncryptionParams& params) {
    KeyMaterial km = decode_params(params);
    if (ciphertext.size() < TAG_SIZE) {
        throw CryptoError("Ciphertext shorter than authentication tag");
    }
    size_t body_len = ciphertext.size() - TAG_SIZE;
    check_length(body_len);

    CipherCtx ctx = new_context();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, km.key.data(), km.nonce.data()) != 1) {
        throw CryptoError("AES-256-GCM init failed");
    }

    std::vector<uint8_t> out(body_len);
    int outl = 0;
    int finl = 0;
    if (body_len > 0 &&
        EVP_DecryptUpdate(ctx.get(), out.data(), &outl, ciphertext.data(),
                          static_cast<int>(body_len)) != 1) {
        throw CryptoError("AES-256-GCM decrypt failed");
    }

    std::vector<uint8_t> tag(ciphertext.end() - TAG_SIZE, ciphertext.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                            tag.data()) != 1) {
        throw CryptoError("AES-256-GCM tag import failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + outl, &finl) != 1) {
        throw CryptoError("AES-256-GCM authentication failed");
    }

    out.resize(static_cast<size_t>(outl + finl));
    return out;
}

std::string sha256_hex(const uint8_t* data, size_t len) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, len, hash);
    return hex_encode(hash, SHA256_DIGEST_LENGTH);
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

std::string sha256_hex(const std::string& data) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string hex_encode(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    return hex_encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace blobup::crypto
