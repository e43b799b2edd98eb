#pragma once

#include "tsg_types.hpp"

#include <string>

namespace tsg {

class Config;

enum class GuardConfigError {
    NONE = 0,
    INVALID_WINDOW_SIZE,
    INVALID_RATE_THRESHOLD,
    INVALID_SENSITIVITY,
    INVALID_SCAN_LIMIT,
    INVALID_WINDOW_CAPACITY,
    INVALID_HARD_BLOCK_MULTIPLIER,
    INVALID_IDLE_TTL
};

const char* guard_config_error_to_string(GuardConfigError e) noexcept;

enum class BlockOn {
    TOKEN_STORM,
    SUSPECTED,
    NEVER
};

const char* block_on_to_string(BlockOn b) noexcept;
bool block_on_from_string(const std::string& s, BlockOn& out) noexcept;

/**
 * @brief Maps a verdict to ALLOW / WARN / BLOCK
 *
 * Degraded (rate-only) verdicts never BLOCK unless the rate exceeds
 * hard_block_rate_multiplier x threshold.
 */
struct ResponsePolicy {
    BlockOn block_on = BlockOn::TOKEN_STORM;
    double hard_block_rate_multiplier = 4.0;

    ResponseAction decide(const Verdict& v, double token_rate_threshold) const noexcept;
};

/**
 * @brief Detector tuning
 *
 * Immutable once handed to a detector; reconfiguration swaps the whole value.
 * Defaults are an example operating point, not a recommendation.
 */
struct GuardConfig {
    Millis window_size{8000};
    double token_rate_threshold = 800.0;   // tokens per second
    double pattern_sensitivity = 0.85;     // pattern score threshold, [0, 1]
    size_t max_scan_bytes = 16384;
    size_t max_window_records = 4096;
    Millis identity_idle_ttl{300000};     // wall-clock silence before an identity's window is dropped
    ResponsePolicy policy;

    GuardConfigError validate() const noexcept;
    bool is_valid() const noexcept { return validate() == GuardConfigError::NONE; }

    /// Build from "guard.*" keys. Throws ConfigError on malformed or invalid values.
    static GuardConfig from_config(const Config& cfg);

    std::string to_string() const;
};

} // namespace tsg
