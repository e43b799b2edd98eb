/**
 * @file tsg_entropy.cpp
 * @brief Digests and deterministic streams on top of libsodium
 */

#include "tsg_entropy.hpp"

#include <sodium.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace tsg {

void init_sodium() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] { ok = (sodium_init() >= 0); });
    if (!ok) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

std::string blake2b_hex(std::string_view data, size_t out_len) {
    init_sodium();
    if (out_len < crypto_generichash_BYTES_MIN || out_len > crypto_generichash_BYTES_MAX) {
        throw std::invalid_argument("blake2b_hex: unsupported digest length");
    }
    std::vector<unsigned char> digest(out_len);
    crypto_generichash(digest.data(), digest.size(),
                       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                       nullptr, 0);
    std::string hex(out_len * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    hex.resize(out_len * 2);
    return hex;
}

std::array<uint8_t, 32> derive_seed(std::string_view material) {
    init_sodium();
    static_assert(randombytes_SEEDBYTES == 32, "unexpected libsodium seed size");
    std::array<uint8_t, 32> seed{};
    crypto_generichash(seed.data(), seed.size(),
                       reinterpret_cast<const unsigned char*>(material.data()), material.size(),
                       nullptr, 0);
    return seed;
}

std::string base64_encode(std::string_view bytes) {
    init_sodium();
    const size_t len = sodium_base64_encoded_len(bytes.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(len, '\0');
    sodium_bin2base64(out.data(), out.size(),
                      reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    out.resize(len - 1);  // drop terminating NUL
    return out;
}

bool base64_decode(std::string_view encoded, std::string& out) {
    init_sodium();
    std::vector<unsigned char> bin(encoded.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(bin.data(), bin.size(), encoded.data(), encoded.size(),
                          nullptr, &bin_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0) {
        return false;
    }
    if (end != encoded.data() + encoded.size()) return false;
    out.assign(reinterpret_cast<const char*>(bin.data()), bin_len);
    return true;
}

// ==================== DeterministicStream ====================

DeterministicStream::DeterministicStream(const std::array<uint8_t, 32>& seed)
    : seed_(seed) {
    init_sodium();
}

DeterministicStream::DeterministicStream(std::string_view seed_material)
    : DeterministicStream(derive_seed(seed_material)) {}

void DeterministicStream::refill() {
    unsigned char material[32 + 8];
    std::copy(seed_.begin(), seed_.end(), material);
    for (int i = 0; i < 8; ++i) {
        material[32 + i] = static_cast<unsigned char>(block_index_ >> (8 * i));
    }
    unsigned char block_seed[randombytes_SEEDBYTES];
    crypto_generichash(block_seed, sizeof(block_seed), material, sizeof(material), nullptr, 0);
    randombytes_buf_deterministic(block_.data(), block_.size(), block_seed);
    sodium_memzero(block_seed, sizeof(block_seed));
    ++block_index_;
    pos_ = 0;
}

uint8_t DeterministicStream::next_byte() {
    if (pos_ >= block_.size()) refill();
    return block_[pos_++];
}

uint32_t DeterministicStream::next_u32() {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v = (v << 8) | next_byte();
    return v;
}

uint64_t DeterministicStream::next_u64() {
    const uint64_t hi = next_u32();
    const uint64_t lo = next_u32();
    return (hi << 32) | lo;
}

uint32_t DeterministicStream::uniform(uint32_t upper_bound) {
    if (upper_bound < 2) return 0;
    // Rejection sampling, same approach as randombytes_uniform()
    const uint32_t min = (1U + ~upper_bound) % upper_bound;
    uint32_t r;
    do {
        r = next_u32();
    } while (r < min);
    return r % upper_bound;
}

uint64_t DeterministicStream::range(uint64_t lo, uint64_t hi) {
    if (hi <= lo) return lo;
    const uint64_t span = hi - lo;
    if (span < 0xFFFFFFFFULL) {
        return lo + uniform(static_cast<uint32_t>(span + 1));
    }
    return lo + next_u64() % (span + 1);
}

double DeterministicStream::unit() {
    return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);
}

} // namespace tsg
