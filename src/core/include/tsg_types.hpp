#pragma once

/**
 * @file tsg_types.hpp
 * @brief Records and verdicts shared by capture, detection and the harness
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace tsg {

using Millis = std::chrono::milliseconds;

/**
 * @brief One normalized request/response exchange
 *
 * Produced only by TelemetryCapture. Texts are either inline (sanitized,
 * possibly truncated) or carried as an opaque reference.
 */
struct TrafficRecord {
    std::string id;
    Millis timestamp{0};          // epoch milliseconds
    std::string identity;
    std::string connection_id;
    uint64_t sequence = 0;        // strictly increasing per connection

    std::string prompt;
    std::string prompt_ref;
    std::string response;
    std::string response_ref;

    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    Millis latency{0};

    bool sanitized = false;
    bool truncated = false;

    uint64_t total_tokens() const noexcept { return input_tokens + output_tokens; }
    bool has_inline_prompt() const noexcept { return prompt_ref.empty() || !prompt.empty(); }
    bool has_inline_response() const noexcept { return response_ref.empty() || !response.empty(); }
};

enum class Classification {
    BENIGN,
    SUSPECTED,
    TOKEN_STORM
};

enum class ResponseAction {
    ALLOW,
    WARN,
    BLOCK
};

const char* classification_to_string(Classification c) noexcept;
const char* action_to_string(ResponseAction a) noexcept;

/**
 * @brief Detector output for one record
 */
struct Verdict {
    std::string record_id;
    std::string identity;
    Millis timestamp{0};

    Classification classification = Classification::BENIGN;
    double confidence = 0.0;                  // [0, 1]

    double token_rate = 0.0;                  // tokens per second over the window
    double pattern_score = 0.0;               // [0, 1]
    bool rate_signal = false;
    bool pattern_signal = false;

    // Pattern scoring failed; classification came from the rate signal only.
    bool degraded = false;
    // Window for this identity was reset while processing this record.
    bool window_reset = false;

    std::vector<std::string> matched_patterns;
    std::string primary_pattern;
    size_t window_records = 0;

    ResponseAction action = ResponseAction::ALLOW;

    bool flagged() const noexcept { return classification != Classification::BENIGN; }
};

} // namespace tsg
