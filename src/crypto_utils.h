#ifndef CRYPTO_UTILS_H
#define CRYPTO_UTILS_H

#ifndef NOMINMAX
#define NOMINMAX
#endif

// =============================================================================
// FileBridge Hub: Cryptographic Utilities
// =============================================================================
// Provides:
//   - HMAC-SHA256 signing (hex digest) for packet envelopes
//   - SHA-256 of in-memory buffers via the EVP API
//   - Constant-time string comparison (CRYPTO_memcmp)
//   - Base64 decode/encode for chunked transfers
//   - Random hex identifiers (msg_id, file_id)
//   - CRL loading for the optional TLS listener
// =============================================================================

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <stdexcept>

#include <openssl/ssl.h>
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/pem.h>

constexpr size_t SHA256_DIGEST_LEN = 32;

inline std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

// =============================================================================
// HMAC-SHA256: hex digest of `data` under `key`
// =============================================================================
// Empty string on OpenSSL failure; an empty signature never verifies.
// =============================================================================
inline std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    unsigned char* result = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(data.data()), data.size(),
        out, &out_len);
    if (result == nullptr || out_len != SHA256_DIGEST_LEN) return "";
    return to_hex(out, out_len);
}

// =============================================================================
// SHA-256: hex digest of an in-memory buffer (EVP API)
// =============================================================================
inline std::string sha256_hex(const std::string& data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1
           && EVP_DigestUpdate(ctx, data.data(), data.size()) == 1
           && EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);

    return ok ? to_hex(hash, hash_len) : "";
}

// =============================================================================
// CONSTANT-TIME COMPARE
// =============================================================================
// Running time depends only on the length of `expected`. Different lengths
// never match.
// =============================================================================
inline bool constant_time_equals(const std::string& given, const std::string& expected) {
    if (given.size() != expected.size()) {
        // Burn the same work so the length check is not the only cost
        CRYPTO_memcmp(expected.data(), expected.data(), expected.size());
        return false;
    }
    if (expected.empty()) return true;
    return CRYPTO_memcmp(given.data(), expected.data(), expected.size()) == 0;
}

// =============================================================================
// BASE64
// =============================================================================
// Standard alphabet with padding. Line breaks and blanks are ignored; any other
// stray character or a length that is not a multiple of 4 fails the decode.
// =============================================================================
inline bool base64_decode(const std::string& in, std::string& out) {
    std::string clean;
    clean.reserve(in.size());
    for (char c : in) {
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
        clean += c;
    }
    out.clear();
    if (clean.empty()) return true;
    if (clean.size() % 4 != 0) return false;

    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') padding++;
    if (clean[clean.size() - 2] == '=') padding++;

    std::vector<unsigned char> buf(clean.size() / 4 * 3);
    int n = EVP_DecodeBlock(buf.data(),
                            reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0 || static_cast<size_t>(n) < padding) return false;

    out.assign(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n) - padding);
    return true;
}

inline std::string base64_encode(const std::string& in) {
    if (in.empty()) return "";
    std::vector<unsigned char> buf(4 * ((in.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(buf.data(),
                            reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    return std::string(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
}

// =============================================================================
// RANDOM IDENTIFIERS
// =============================================================================
// `bytes` random bytes from the OpenSSL CSPRNG, hex encoded (2 chars per byte).
// Throws if the generator is not seeded; ids must never silently collide.
// =============================================================================
inline std::string random_hex_id(size_t bytes = 8) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(buf.data(), buf.size());
}

// =============================================================================
// CRL LOADING: Add Certificate Revocation List to SSL_CTX
// =============================================================================
// Loads a PEM-formatted CRL file and enables CRL checking on the
// X509 verification store. Errors are written to `err`.
// =============================================================================
inline bool load_crl(SSL_CTX* ctx, const std::string& crl_path, std::string& err) {
    if (crl_path.empty()) { err = "empty CRL path"; return false; }

    FILE* fp = std::fopen(crl_path.c_str(), "r");
    if (!fp) { err = "cannot open CRL file: " + crl_path; return false; }

    X509_CRL* crl = PEM_read_X509_CRL(fp, nullptr, nullptr, nullptr);
    std::fclose(fp);
    if (!crl) { err = "failed to parse CRL from: " + crl_path; return false; }

    X509_STORE* store = SSL_CTX_get_cert_store(ctx);
    if (!store || X509_STORE_add_crl(store, crl) != 1) {
        X509_CRL_free(crl);
        err = "failed to add CRL to store";
        return false;
    }

    X509_STORE_set_flags(store,
        X509_V_FLAG_CRL_CHECK |          // Check CRL for leaf cert
        X509_V_FLAG_CRL_CHECK_ALL);      // Check CRL for entire chain

    X509_CRL_free(crl);
    return true;
}

#endif
