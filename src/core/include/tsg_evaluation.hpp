#pragma once

/**
 * @file tsg_evaluation.hpp
 * @brief Labeled corpora and measured FP/TP rates for a GuardConfig
 */

#include "tsg_guard_config.hpp"
#include "tsg_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tsg {

struct LabeledRecord {
    TrafficRecord record;
    bool attack = false;
};

/**
 * @brief Deterministic synthetic traffic
 *
 * Benign traffic mixes conversational identities with document-heavy
 * identities that sustain a few hundred tokens per second. Attack traffic
 * carries amplification instructions in the response and large output
 * counts. Same seed, same corpus.
 */
class LabeledCorpus {
public:
    struct Options {
        size_t benign_records = 465;
        size_t attack_records = 466;
        size_t benign_identities = 31;
        size_t attack_identities = 34;
        uint64_t seed = 20240607;
        Millis start{1700000000000};
    };

    static std::vector<LabeledRecord> benign(const Options& opts);
    static std::vector<LabeledRecord> attack(const Options& opts);
    static std::vector<LabeledRecord> benign() { return benign(Options()); }
    static std::vector<LabeledRecord> attack() { return attack(Options()); }
};

struct DetectionRates {
    // Indexed by Classification
    size_t benign_as[3] = {0, 0, 0};
    size_t attack_as[3] = {0, 0, 0};
    size_t degraded = 0;

    size_t benign_total() const noexcept { return benign_as[0] + benign_as[1] + benign_as[2]; }
    size_t attack_total() const noexcept { return attack_as[0] + attack_as[1] + attack_as[2]; }

    /// Flagged = suspected or token_storm (anything that raises an alert).
    double true_positive_rate() const noexcept;
    double false_positive_rate() const noexcept;

    /// Only token_storm counts as positive.
    double storm_true_positive_rate() const noexcept;
    double storm_false_positive_rate() const noexcept;

    double benign_suspected_rate() const noexcept;
    double attack_suspected_rate() const noexcept;

    std::string to_string() const;
};

/// Run each corpus through a fresh detector in order and count outcomes.
DetectionRates evaluate(const GuardConfig& config,
                        const std::vector<LabeledRecord>& benign,
                        const std::vector<LabeledRecord>& attack);

struct SweepPoint {
    GuardConfig config;
    DetectionRates rates;
};

std::vector<SweepPoint> sweep(const std::vector<GuardConfig>& grid,
                              const std::vector<LabeledRecord>& benign,
                              const std::vector<LabeledRecord>& attack);

/// True if lowering token_rate_threshold never lowers TP or FP rate among
/// points that share window_size and pattern_sensitivity.
bool is_monotone_in_threshold(const std::vector<SweepPoint>& points);

} // namespace tsg
