#pragma once

/**
 * @file tsg_entropy.hpp
 * @brief libsodium-backed digests, deterministic byte streams and base64
 *
 * Everything that must be reproducible from a seed (mutation cases,
 * synthetic corpora, trace identifiers) draws from here.
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tsg {

/// Initialise libsodium once per process. Throws std::runtime_error on failure.
void init_sodium();

/// BLAKE2b digest of @p data, @p out_len bytes (16..64), lower-case hex.
std::string blake2b_hex(std::string_view data, size_t out_len = 32);

/// 32-byte seed derived from arbitrary material.
std::array<uint8_t, 32> derive_seed(std::string_view material);

/// Standard base64 (with padding).
std::string base64_encode(std::string_view bytes);

/// Returns false if @p encoded is not valid standard base64.
bool base64_decode(std::string_view encoded, std::string& out);

/**
 * @brief Reproducible byte stream
 *
 * Output is randombytes_buf_deterministic() over a chain of block seeds
 * (block seed = BLAKE2b(root seed || block index)), so the same seed always
 * yields the same sequence regardless of how the draws are chunked.
 */
class DeterministicStream {
public:
    explicit DeterministicStream(const std::array<uint8_t, 32>& seed);
    explicit DeterministicStream(std::string_view seed_material);

    uint8_t next_byte();
    uint32_t next_u32();
    uint64_t next_u64();

    /// Uniform integer in [0, upper_bound). upper_bound == 0 returns 0.
    uint32_t uniform(uint32_t upper_bound);

    /// Uniform integer in [lo, hi].
    uint64_t range(uint64_t lo, uint64_t hi);

    /// Uniform double in [0, 1).
    double unit();

    template<class T>
    const T& pick(const std::vector<T>& items) {
        return items[uniform(static_cast<uint32_t>(items.size()))];
    }

private:
    void refill();

    static constexpr size_t kBlockSize = 256;

    std::array<uint8_t, 32> seed_;
    uint64_t block_index_ = 0;
    std::array<uint8_t, kBlockSize> block_{};
    size_t pos_ = kBlockSize;
};

} // namespace tsg
