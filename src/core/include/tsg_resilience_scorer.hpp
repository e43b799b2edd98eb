#pragma once

/**
 * @file tsg_resilience_scorer.hpp
 * @brief Mutation, replay and fault outcomes -> one ResilienceReport
 *
 * Category score = weighted mean of that category's metrics. The overall
 * score is the mean of category scores after capping each at
 * (lowest category score + max_spread), so one failing category drags the
 * result down no matter how well the others did.
 */

#include "tsg_fault_injector.hpp"
#include "tsg_mutation_engine.hpp"
#include "tsg_replay.hpp"
#include "tsg_types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tsg {

class Config;

namespace Chaos {

/// What actually happened to one mutation case.
struct MutationOutcome {
    MutationCategory category = MutationCategory::BIT_FLIP;
    std::string reproduction;
    std::string variant;
    ExpectedHandling expected = ExpectedHandling::REJECT;
    ExpectedHandling actual = ExpectedHandling::REJECT;
    bool handled = true;          // false if capture or detector threw
    Millis elapsed{0};
    std::string detail;

    bool correct() const noexcept { return handled && actual == expected; }
};

struct ScoringWeights {
    double accuracy = 0.7;
    double latency = 0.3;
    double recovery = 0.4;
    double health = 0.2;
    double requests = 0.2;
    double integrity = 0.2;

    double pass_threshold = 0.75;
    double max_spread = 0.5;
    Millis mutation_time_bound{250};
    Millis sla{2000};

    std::string validate() const;

    /// "scoring.*" keys. Throws ConfigError on invalid values.
    static ScoringWeights from_config(const Config& cfg);
};

struct CategoryScore {
    std::string name;             // "mutation:bit_flip", "replay:clock_skew", "fault:process_kill"
    std::string kind;             // "mutation" | "replay" | "fault"
    double score = 0.0;
    double contribution = 0.0;    // score after the cap
    size_t cases = 0;
    size_t failures = 0;
    std::map<std::string, double> metrics;
};

struct Finding {
    std::string kind;             // "mutation", "replay", "fault", "leak", "error"
    std::string category;
    std::string message;
    std::string reproduction;
};

enum class ReportStatus {
    PASS,
    FAIL,
    NO_DATA,
    ABORTED
};

const char* report_status_to_string(ReportStatus s) noexcept;

struct ResilienceReport {
    ReportStatus status = ReportStatus::NO_DATA;
    std::optional<double> overall;
    std::string band;
    double pass_threshold = 0.0;
    std::vector<CategoryScore> categories;
    std::vector<Finding> failing;
    std::vector<std::string> coverage_warnings;
    std::vector<std::string> not_applied;
    std::string abort_reason;
    size_t mutation_cases = 0;
    size_t inapplicable_cases = 0;
    size_t fault_scenarios = 0;
    size_t replay_modes = 0;

    bool passed() const noexcept { return status == ReportStatus::PASS; }

    nlohmann::json to_json() const;
    std::string to_text() const;

    /// Write to_json() to @p path. Throws Error on I/O failure.
    void save(const std::string& path) const;
};

class ResilienceScorer {
public:
    explicit ResilienceScorer(ScoringWeights weights = {});

    ResilienceReport score(const std::vector<MutationOutcome>& mutations,
                           const std::vector<RecoveryMetrics>& faults,
                           size_t inapplicable_cases = 0,
                           const std::vector<ReplayOutcome>& replays = {}) const;

    /// Monotonic non-increasing in @p duration, 1.0 at zero, 0.5 at the SLA.
    static double recovery_efficiency(Millis duration, Millis sla) noexcept;

    static const char* status_band(double score) noexcept;

    const ScoringWeights& weights() const noexcept { return weights_; }

private:
    CategoryScore score_mutations(const std::string& name,
                                  const std::vector<const MutationOutcome*>& outcomes) const;
    /// 0.5 x verdict agreement + 0.25 x share of records without a
    /// window reset + 0.25 if the service settled.
    CategoryScore score_replay(const std::string& name, const ReplayOutcome& replay) const;
    CategoryScore score_faults(const std::string& name,
                               const std::vector<const RecoveryMetrics*>& scenarios) const;

    ScoringWeights weights_;
};

} // namespace Chaos
} // namespace tsg
