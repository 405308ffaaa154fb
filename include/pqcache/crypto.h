#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/crypto.h — SHA-256 digests for cache fingerprints
// ═══════════════════════════════════════════════════════════════════

#include <cstddef>
#include <string>
#include <string_view>

#include <openssl/sha.h>

namespace pqcache::crypto {

// Lowercase hex, two characters per byte.
inline std::string toHex(const unsigned char* data, std::size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; i++) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

inline std::string sha256(std::string_view input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

} // namespace pqcache::crypto
