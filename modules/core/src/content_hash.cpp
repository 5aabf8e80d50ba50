#include "content_hash.h"
#include "upload_errors.h"
#include "logger.h"

#include <sodium.h>

#include <fstream>
#include <mutex>
#include <stdexcept>

namespace chunkflow {

namespace {

void ensure_sodium() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (sodium_init() < 0) {
            nativeLog("HASH: libsodium initialization failed!");
            throw std::runtime_error("libsodium init failed");
        }
    });
}

std::string to_hex(const unsigned char* bytes, size_t len) {
    static const char* hex_chars = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
    }
    return out;
}

} // namespace

std::string sha256_hex(const uint8_t* data, size_t len) {
    ensure_sodium();
    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest, data, static_cast<unsigned long long>(len));
    return to_hex(digest, sizeof(digest));
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

std::string sha256_file_hex(const std::string& path) {
    ensure_sodium();
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw StorageError("Cannot open file for hashing: " + path);
    }

    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    std::vector<char> buf(64 * 1024);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize got = in.gcount();
        if (got > 0) {
            crypto_hash_sha256_update(&state,
                                      reinterpret_cast<const unsigned char*>(buf.data()),
                                      static_cast<unsigned long long>(got));
        }
    }
    if (in.bad()) {
        throw StorageError("Read error while hashing: " + path);
    }

    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&state, digest);
    return to_hex(digest, sizeof(digest));
}

std::string generate_uuid() {
    ensure_sodium();
    unsigned char b[16];
    randombytes_buf(b, sizeof(b));
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);  // variant 1

    const std::string hex = to_hex(b, sizeof(b));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string random_hex(size_t n_bytes) {
    ensure_sodium();
    std::vector<unsigned char> b(n_bytes);
    if (n_bytes > 0) {
        randombytes_buf(b.data(), b.size());
    }
    return to_hex(b.data(), b.size());
}

} // namespace chunkflow
