#pragma once

/**
 * @file tsg_fault_injector.hpp
 * @brief Apply one fault, remove it, observe recovery under a hard ceiling
 */

#include "tsg_chaos_driver.hpp"
#include "tsg_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tsg {

class Config;

namespace Chaos {

struct InjectorSettings {
    Millis sample_interval{50};
    uint32_t required_successes = 3;
    Millis ceiling{5000};             // recovery observation never exceeds this
    Millis drain_timeout{1000};
    double memory_tolerance = 1.5;    // post <= baseline * tolerance + slack
    size_t memory_slack_bytes = 1024 * 1024;
    double connection_tolerance = 2.0;
    size_t connection_slack = 4;
    uint32_t max_restarts = 3;        // per scenario
    Millis sla{2000};

    /// Empty string if usable, otherwise the reason.
    std::string validate() const;

    /// "chaos.*" and "scoring.sla_ms". Throws ConfigError on invalid values.
    static InjectorSettings from_config(const Config& cfg);
};

enum class ScenarioOutcome {
    RECOVERED,
    FATAL,
    NOT_APPLIED
};

const char* outcome_to_string(ScenarioOutcome o) noexcept;

struct RecoveryMetrics {
    FaultScenario scenario;
    ScenarioOutcome outcome = ScenarioOutcome::NOT_APPLIED;

    Millis recovery_duration{0};     // fault removal -> stabilization
    Millis observed{0};              // time spent sampling

    uint32_t health_checks = 0;
    uint32_t health_passed = 0;
    uint32_t requests_sent = 0;
    uint32_t requests_passed = 0;

    ResourceSnapshot baseline;
    ResourceSnapshot after;
    bool memory_leaked = false;
    bool connections_leaked = false;
    bool graceful_shutdown = true;
    uint32_t restart_count = 0;
    bool restart_budget_exceeded = false;

    double efficiency_score = 0.0;
    std::string note;

    double health_rate() const noexcept;
    double request_rate() const noexcept;
    bool scored() const noexcept { return outcome != ScenarioOutcome::NOT_APPLIED; }
};

/// Monotonic non-increasing SLA-normalized score of a recovery duration, in [0, 1].
double time_score(Millis duration, Millis sla) noexcept;

/// 0.4*time + 0.3*health + 0.3*requests, x0.8 per leak, x0.7 on failed drain; 0 for FATAL.
double recovery_efficiency(const RecoveryMetrics& m, Millis sla) noexcept;

class FaultInjector {
public:
    FaultInjector(IChaosDriver& driver, IServiceProbe& probe, InjectorSettings settings = {});

    /// Never blocks longer than duration + ceiling + drain timeout (plus one sample).
    RecoveryMetrics run(const FaultScenario& scenario);

    std::vector<RecoveryMetrics> run_all(const std::vector<FaultScenario>& scenarios);

    const InjectorSettings& settings() const noexcept { return settings_; }

private:
    IChaosDriver& driver_;
    IServiceProbe& probe_;
    InjectorSettings settings_;
};

} // namespace Chaos
} // namespace tsg
