#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace hookvault::crypto {

constexpr size_t kKeySize = 32;
constexpr size_t kIvSize = 12;
constexpr size_t kTagSize = 16;
constexpr size_t kStreamBufferSize = 64 * 1024;

using Key = std::array<uint8_t, kKeySize>;
using Bytes = std::vector<uint8_t>;

/// AES-256 key = SHA-256(master key).
Key derive_key(const std::string& master_key);

/// Fresh random 12-byte GCM nonce.
Bytes random_iv();

/// Random lowercase hex string of `bytes` random bytes.
std::string random_hex(size_t bytes);

/// Standard padded base64, used to keep iv and tag bytes in text columns.
std::string to_base64(const Bytes& data);
Bytes from_base64(const std::string& text);

/// Incremental SHA-256.
class Sha256 {
public:
    Sha256();
    ~Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const uint8_t* data, size_t len);
    std::string hex_digest();

private:
    EVP_MD_CTX* ctx_;
};

std::string sha256_hex(const uint8_t* data, size_t len);
std::string sha256_hex(const Bytes& data);

/// Streaming AES-256-GCM encryption. Ciphertext has the plaintext's length;
/// the 16-byte tag comes out of finish().
class GcmEncryptor {
public:
    GcmEncryptor(const Key& key, const Bytes& iv);
    ~GcmEncryptor();
    GcmEncryptor(const GcmEncryptor&) = delete;
    GcmEncryptor& operator=(const GcmEncryptor&) = delete;

    void update(const uint8_t* in, size_t len, Bytes& out);
    Bytes finish();

private:
    EVP_CIPHER_CTX* ctx_;
};

/// Streaming AES-256-GCM decryption. finish() verifies the tag and throws
/// Error{AuthenticationFailed} on mismatch.
class GcmDecryptor {
public:
    GcmDecryptor(const Key& key, const Bytes& iv, const Bytes& tag);
    ~GcmDecryptor();
    GcmDecryptor(const GcmDecryptor&) = delete;
    GcmDecryptor& operator=(const GcmDecryptor&) = delete;

    void update(const uint8_t* in, size_t len, Bytes& out);
    void finish();

private:
    EVP_CIPHER_CTX* ctx_;
};

struct SealResult {
    Bytes iv;
    Bytes tag;
    uint64_t bytes = 0;
};

/// Encrypt `in` to `out` with bounded buffers. A given iv is reused (resuming a
/// whole-archive upload must reproduce the same ciphertext); otherwise a fresh
/// one is drawn.
SealResult encrypt_stream(std::istream& in, std::ostream& out, const Key& key,
                          const std::optional<Bytes>& iv = std::nullopt);

/// Decrypt `in` to `out`, verifying the tag at the end. Returns plaintext bytes.
uint64_t decrypt_stream(std::istream& in, std::ostream& out, const Key& key,
                        const Bytes& iv, const Bytes& tag);

SealResult encrypt_file(const std::filesystem::path& input, const std::filesystem::path& output,
                        const Key& key, const std::optional<Bytes>& iv = std::nullopt);

Bytes decrypt_buffer(const Bytes& ciphertext, const Key& key, const Bytes& iv, const Bytes& tag);

}  // namespace hookvault::crypto
