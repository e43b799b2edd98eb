#include "tsg_guard_config.hpp"
#include "tsg_config.hpp"
#include "tsg_errors.hpp"

#include <cmath>
#include <sstream>

namespace tsg {

const char* classification_to_string(Classification c) noexcept {
    switch (c) {
        case Classification::BENIGN:      return "benign";
        case Classification::SUSPECTED:   return "suspected";
        case Classification::TOKEN_STORM: return "token_storm";
        default: return "unknown";
    }
}

const char* action_to_string(ResponseAction a) noexcept {
    switch (a) {
        case ResponseAction::ALLOW: return "allow";
        case ResponseAction::WARN:  return "warn";
        case ResponseAction::BLOCK: return "block";
        default: return "unknown";
    }
}

const char* guard_config_error_to_string(GuardConfigError e) noexcept {
    switch (e) {
        case GuardConfigError::NONE:                          return "ok";
        case GuardConfigError::INVALID_WINDOW_SIZE:           return "window_size must be positive";
        case GuardConfigError::INVALID_RATE_THRESHOLD:        return "token_rate_threshold must be positive and finite";
        case GuardConfigError::INVALID_SENSITIVITY:           return "pattern_sensitivity must be in [0, 1]";
        case GuardConfigError::INVALID_SCAN_LIMIT:            return "max_scan_bytes must be at least 64";
        case GuardConfigError::INVALID_WINDOW_CAPACITY:       return "max_window_records must be at least 1";
        case GuardConfigError::INVALID_HARD_BLOCK_MULTIPLIER: return "hard_block_rate_multiplier must be >= 1";
        case GuardConfigError::INVALID_IDLE_TTL:              return "identity_idle_ttl must be positive";
        default: return "unknown";
    }
}

const char* block_on_to_string(BlockOn b) noexcept {
    switch (b) {
        case BlockOn::TOKEN_STORM: return "token_storm";
        case BlockOn::SUSPECTED:   return "suspected";
        case BlockOn::NEVER:       return "never";
        default: return "unknown";
    }
}

bool block_on_from_string(const std::string& s, BlockOn& out) noexcept {
    if (s == "token_storm") { out = BlockOn::TOKEN_STORM; return true; }
    if (s == "suspected")   { out = BlockOn::SUSPECTED;   return true; }
    if (s == "never")       { out = BlockOn::NEVER;       return true; }
    return false;
}

ResponseAction ResponsePolicy::decide(const Verdict& v, double token_rate_threshold) const noexcept {
    if (v.classification == Classification::BENIGN) return ResponseAction::ALLOW;

    bool block = false;
    switch (block_on) {
        case BlockOn::TOKEN_STORM:
            block = v.classification == Classification::TOKEN_STORM;
            break;
        case BlockOn::SUSPECTED:
            block = true;
            break;
        case BlockOn::NEVER:
            block = false;
            break;
    }

    if (block && v.degraded) {
        block = v.token_rate > hard_block_rate_multiplier * token_rate_threshold;
    }
    return block ? ResponseAction::BLOCK : ResponseAction::WARN;
}

GuardConfigError GuardConfig::validate() const noexcept {
    if (window_size.count() <= 0) return GuardConfigError::INVALID_WINDOW_SIZE;
    if (!std::isfinite(token_rate_threshold) || token_rate_threshold <= 0.0)
        return GuardConfigError::INVALID_RATE_THRESHOLD;
    if (!std::isfinite(pattern_sensitivity) || pattern_sensitivity < 0.0 || pattern_sensitivity > 1.0)
        return GuardConfigError::INVALID_SENSITIVITY;
    if (max_scan_bytes < 64) return GuardConfigError::INVALID_SCAN_LIMIT;
    if (max_window_records < 1) return GuardConfigError::INVALID_WINDOW_CAPACITY;
    if (!std::isfinite(policy.hard_block_rate_multiplier) || policy.hard_block_rate_multiplier < 1.0)
        return GuardConfigError::INVALID_HARD_BLOCK_MULTIPLIER;
    if (identity_idle_ttl.count() <= 0) return GuardConfigError::INVALID_IDLE_TTL;
    return GuardConfigError::NONE;
}

GuardConfig GuardConfig::from_config(const Config& cfg) {
    GuardConfig gc;
    gc.window_size = Millis(cfg.getInt("guard.window_size_ms", gc.window_size.count()));
    gc.token_rate_threshold = cfg.getDouble("guard.token_rate_threshold", gc.token_rate_threshold);
    gc.pattern_sensitivity = cfg.getDouble("guard.pattern_sensitivity", gc.pattern_sensitivity);
    gc.max_scan_bytes = static_cast<size_t>(cfg.getUInt("guard.max_scan_bytes", gc.max_scan_bytes));
    gc.max_window_records = static_cast<size_t>(
        cfg.getUInt("guard.max_window_records", gc.max_window_records));
    gc.identity_idle_ttl = Millis(cfg.getInt("guard.identity_idle_ttl_ms", gc.identity_idle_ttl.count()));
    gc.policy.hard_block_rate_multiplier = cfg.getDouble(
        "guard.hard_block_rate_multiplier", gc.policy.hard_block_rate_multiplier);

    std::string block_on = cfg.get("guard.block_on", "token_storm");
    if (!block_on_from_string(block_on, gc.policy.block_on)) {
        throw ConfigError("guard.block_on must be token_storm, suspected or never (got '" +
                          block_on + "')");
    }

    GuardConfigError err = gc.validate();
    if (err != GuardConfigError::NONE) {
        throw ConfigError(std::string("invalid guard configuration: ") +
                          guard_config_error_to_string(err));
    }
    return gc;
}

std::string GuardConfig::to_string() const {
    std::ostringstream oss;
    oss << "window=" << window_size.count() << "ms"
        << " threshold=" << token_rate_threshold << "tok/s"
        << " sensitivity=" << pattern_sensitivity
        << " block_on=" << block_on_to_string(policy.block_on);
    return oss.str();
}

} // namespace tsg
