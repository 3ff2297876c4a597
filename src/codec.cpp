#include "hookvault/codec.hpp"
#include "hookvault/error.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cstring>
#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace hookvault::crypto {

namespace {

std::string to_hex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

// Frees the context before throwing; constructors call this ahead of any init
void check_iv(EVP_CIPHER_CTX* ctx, const Bytes& iv) {
    if (iv.size() != kIvSize) {
        EVP_CIPHER_CTX_free(ctx);
        throw Error(ErrorKind::AuthenticationFailed,
                    "invalid GCM iv length " + std::to_string(iv.size()));
    }
}

}  // namespace

Key derive_key(const std::string& master_key) {
    Key key{};
    SHA256(reinterpret_cast<const unsigned char*>(master_key.data()), master_key.size(),
           key.data());
    return key;
}

Bytes random_iv() {
    Bytes iv(kIvSize);
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return iv;
}

std::string random_hex(size_t bytes) {
    Bytes buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(buf.data(), buf.size());
}

std::string to_base64(const Bytes& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                            static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

Bytes from_base64(const std::string& text) {
    if (text.empty()) return {};
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("base64 length not a multiple of 4");
    }
    Bytes out(text.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) {
        throw std::invalid_argument("malformed base64");
    }
    // DecodeBlock keeps the bytes that stand in for '=' padding
    size_t len = static_cast<size_t>(n);
    if (text.back() == '=') --len;
    if (text.size() >= 2 && text[text.size() - 2] == '=') --len;
    out.resize(len);
    return out;
}

// --- Sha256 ---

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const uint8_t* data, size_t len) {
    if (len == 0) return;
    EVP_DigestUpdate(ctx_, data, len);
}

std::string Sha256::hex_digest() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_, digest, &len);
    return to_hex(digest, len);
}

std::string sha256_hex(const uint8_t* data, size_t len) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(data, len, digest);
    return to_hex(digest, sizeof(digest));
}

std::string sha256_hex(const Bytes& data) {
    return sha256_hex(data.data(), data.size());
}

// --- GcmEncryptor ---

GcmEncryptor::GcmEncryptor(const Key& key, const Bytes& iv) : ctx_(EVP_CIPHER_CTX_new()) {
    check_iv(ctx_, iv);
    if (!ctx_ ||
        EVP_EncryptInit_ex(ctx_, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx_, nullptr, nullptr, key.data(), iv.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx_);
        throw std::runtime_error("AES-256-GCM encrypt init failed");
    }
}

GcmEncryptor::~GcmEncryptor() {
    EVP_CIPHER_CTX_free(ctx_);
}

void GcmEncryptor::update(const uint8_t* in, size_t len, Bytes& out) {
    out.resize(len);
    if (len == 0) return;
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx_, out.data(), &out_len, in, static_cast<int>(len)) != 1) {
        throw std::runtime_error("EVP_EncryptUpdate failed");
    }
    out.resize(static_cast<size_t>(out_len));
}

Bytes GcmEncryptor::finish() {
    unsigned char trailing[16];
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx_, trailing, &final_len) != 1) {
        throw std::runtime_error("EVP_EncryptFinal_ex failed");
    }
    Bytes tag(kTagSize);
    if (EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        throw std::runtime_error("reading GCM tag failed");
    }
    return tag;
}

// --- GcmDecryptor ---

GcmDecryptor::GcmDecryptor(const Key& key, const Bytes& iv, const Bytes& tag)
    : ctx_(EVP_CIPHER_CTX_new()) {
    check_iv(ctx_, iv);
    if (tag.size() != kTagSize) {
        EVP_CIPHER_CTX_free(ctx_);
        throw Error(ErrorKind::AuthenticationFailed,
                    "invalid GCM tag length " + std::to_string(tag.size()));
    }
    if (!ctx_ ||
        EVP_DecryptInit_ex(ctx_, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx_, nullptr, nullptr, key.data(), iv.data()) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()),
                            const_cast<uint8_t*>(tag.data())) != 1) {
        EVP_CIPHER_CTX_free(ctx_);
        throw std::runtime_error("AES-256-GCM decrypt init failed");
    }
}

GcmDecryptor::~GcmDecryptor() {
    EVP_CIPHER_CTX_free(ctx_);
}

void GcmDecryptor::update(const uint8_t* in, size_t len, Bytes& out) {
    out.resize(len);
    if (len == 0) return;
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx_, out.data(), &out_len, in, static_cast<int>(len)) != 1) {
        throw std::runtime_error("EVP_DecryptUpdate failed");
    }
    out.resize(static_cast<size_t>(out_len));
}

void GcmDecryptor::finish() {
    unsigned char trailing[16];
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx_, trailing, &final_len) != 1) {
        throw Error(ErrorKind::AuthenticationFailed, "GCM authentication tag mismatch");
    }
}

// --- Stream helpers ---

SealResult encrypt_stream(std::istream& in, std::ostream& out, const Key& key,
                          const std::optional<Bytes>& iv) {
    SealResult result;
    result.iv = iv ? *iv : random_iv();

    GcmEncryptor enc(key, result.iv);
    Bytes buffer(kStreamBufferSize);
    Bytes cipher;

    while (in) {
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto n = static_cast<size_t>(in.gcount());
        if (n == 0) break;
        enc.update(buffer.data(), n, cipher);
        out.write(reinterpret_cast<const char*>(cipher.data()),
                  static_cast<std::streamsize>(cipher.size()));
        if (!out) {
            throw Error(ErrorKind::ResourceExhausted, "write failed while encrypting");
        }
        result.bytes += n;
    }
    if (in.bad()) {
        throw std::runtime_error("read failed while encrypting");
    }

    result.tag = enc.finish();
    return result;
}

uint64_t decrypt_stream(std::istream& in, std::ostream& out, const Key& key,
                        const Bytes& iv, const Bytes& tag) {
    GcmDecryptor dec(key, iv, tag);
    Bytes buffer(kStreamBufferSize);
    Bytes plain;
    uint64_t total = 0;

    while (in) {
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto n = static_cast<size_t>(in.gcount());
        if (n == 0) break;
        dec.update(buffer.data(), n, plain);
        out.write(reinterpret_cast<const char*>(plain.data()),
                  static_cast<std::streamsize>(plain.size()));
        if (!out) {
            throw Error(ErrorKind::ResourceExhausted, "write failed while decrypting");
        }
        total += n;
    }
    if (in.bad()) {
        throw std::runtime_error("read failed while decrypting");
    }

    dec.finish();
    return total;
}

SealResult encrypt_file(const std::filesystem::path& input, const std::filesystem::path& output,
                        const Key& key, const std::optional<Bytes>& iv) {
    std::ifstream ifs(input, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("cannot open " + input.string());
    }
    std::ofstream ofs(output, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw Error(ErrorKind::ResourceExhausted, "cannot create " + output.string());
    }

    auto result = encrypt_stream(ifs, ofs, key, iv);
    ofs.close();
    if (!ofs.good()) {
        throw Error(ErrorKind::ResourceExhausted, "cannot flush " + output.string());
    }
    return result;
}

Bytes decrypt_buffer(const Bytes& ciphertext, const Key& key, const Bytes& iv, const Bytes& tag) {
    GcmDecryptor dec(key, iv, tag);
    Bytes plain;
    dec.update(ciphertext.data(), ciphertext.size(), plain);
    dec.finish();
    return plain;
}

}  // namespace hookvault::crypto
