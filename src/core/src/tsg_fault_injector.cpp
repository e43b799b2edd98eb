#include "tsg_fault_injector.hpp"
#include "tsg_config.hpp"
#include "tsg_errors.hpp"
#include "tsg_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace tsg {
namespace Chaos {

namespace {

using Clock = std::chrono::steady_clock;

Millis since(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration_cast<Millis>(to - from);
}

// Time left before @p deadline, never below 1ms.
Millis remaining(Clock::time_point deadline) {
    return std::max(Millis(1), since(Clock::now(), deadline));
}

double ratio(uint32_t num, uint32_t den) noexcept {
    return den == 0 ? 0.0 : static_cast<double>(num) / static_cast<double>(den);
}

// Removes the fault if anything between apply() and the planned removal throws.
class FaultGuard {
public:
    FaultGuard(IChaosDriver& driver, const FaultScenario& scenario)
        : driver_(driver), scenario_(scenario) {}

    ~FaultGuard() {
        if (armed_) {
            try {
                driver_.remove(scenario_);
            } catch (const std::exception& e) {
                TSG_LOG_ERROR("fault removal failed for " + scenario_.name + ": " + e.what());
            }
        }
    }

    void remove_now() {
        armed_ = false;
        driver_.remove(scenario_);
    }

private:
    IChaosDriver& driver_;
    const FaultScenario& scenario_;
    bool armed_ = true;
};

} // anonymous namespace

// ==================== InjectorSettings ====================

std::string InjectorSettings::validate() const {
    if (sample_interval.count() <= 0) return "sample interval must be positive";
    if (required_successes == 0) return "required successes must be at least 1";
    if (ceiling.count() <= 0) return "ceiling must be positive";
    if (ceiling < sample_interval) return "ceiling must be at least one sample interval";
    if (drain_timeout.count() < 0) return "drain timeout must not be negative";
    if (!std::isfinite(memory_tolerance) || memory_tolerance < 1.0) return "memory tolerance must be >= 1";
    if (!std::isfinite(connection_tolerance) || connection_tolerance < 1.0) {
        return "connection tolerance must be >= 1";
    }
    if (sla.count() <= 0) return "sla must be positive";
    return {};
}

InjectorSettings InjectorSettings::from_config(const Config& cfg) {
    InjectorSettings s;
    s.sample_interval = Millis(cfg.getInt("chaos.sample_interval_ms", s.sample_interval.count()));
    s.required_successes = static_cast<uint32_t>(
        cfg.getUInt("chaos.required_successes", s.required_successes));
    s.ceiling = Millis(cfg.getInt("chaos.ceiling_ms", s.ceiling.count()));
    s.drain_timeout = Millis(cfg.getInt("chaos.drain_timeout_ms", s.drain_timeout.count()));
    s.memory_tolerance = cfg.getDouble("chaos.memory_tolerance", s.memory_tolerance);
    s.memory_slack_bytes = static_cast<size_t>(
        cfg.getUInt("chaos.memory_slack_bytes", s.memory_slack_bytes));
    s.connection_tolerance = cfg.getDouble("chaos.connection_tolerance", s.connection_tolerance);
    s.connection_slack = static_cast<size_t>(cfg.getUInt("chaos.connection_slack", s.connection_slack));
    s.max_restarts = static_cast<uint32_t>(cfg.getUInt("chaos.max_restarts", s.max_restarts));
    s.sla = Millis(cfg.getInt("scoring.sla_ms", s.sla.count()));

    const std::string err = s.validate();
    if (!err.empty()) throw ConfigError("invalid chaos settings: " + err);
    return s;
}

const char* outcome_to_string(ScenarioOutcome o) noexcept {
    switch (o) {
        case ScenarioOutcome::RECOVERED:   return "recovered";
        case ScenarioOutcome::FATAL:       return "fatal";
        case ScenarioOutcome::NOT_APPLIED: return "not_applied";
    }
    return "unknown";
}

// ==================== metrics ====================

double RecoveryMetrics::health_rate() const noexcept {
    return ratio(health_passed, health_checks);
}

double RecoveryMetrics::request_rate() const noexcept {
    return ratio(requests_passed, requests_sent);
}

double time_score(Millis duration, Millis sla) noexcept {
    if (sla.count() <= 0) return 0.0;
    const double d = static_cast<double>(std::max<int64_t>(0, duration.count()));
    const double s = static_cast<double>(sla.count());
    if (d <= s) return 1.0 - 0.5 * d / s;
    return 0.5 * s / d;
}

double recovery_efficiency(const RecoveryMetrics& m, Millis sla) noexcept {
    if (m.outcome != ScenarioOutcome::RECOVERED) return 0.0;
    double score = 0.4 * time_score(m.recovery_duration, sla) +
                   0.3 * m.health_rate() +
                   0.3 * m.request_rate();
    if (m.memory_leaked) score *= 0.8;
    if (m.connections_leaked) score *= 0.8;
    if (!m.graceful_shutdown) score *= 0.7;
    return std::clamp(score, 0.0, 1.0);
}

// ==================== FaultInjector ====================

FaultInjector::FaultInjector(IChaosDriver& driver, IServiceProbe& probe, InjectorSettings settings)
    : driver_(driver)
    , probe_(probe)
    , settings_(settings) {
    const std::string err = settings_.validate();
    if (!err.empty()) throw ConfigError("invalid chaos settings: " + err);
}

RecoveryMetrics FaultInjector::run(const FaultScenario& scenario) {
    RecoveryMetrics m;
    m.scenario = scenario;

    const std::string invalid = scenario.validate();
    if (!invalid.empty()) {
        m.note = "invalid scenario: " + invalid;
        TSG_LOG_WARN("scenario not applied (" + scenario.name + "): " + m.note);
        return m;
    }
    if (!driver_.supports(scenario.type)) {
        m.note = "driver '" + driver_.name() + "' does not support " +
                 fault_type_to_string(scenario.type);
        TSG_LOG_WARN("scenario not applied (" + scenario.name + "): " + m.note);
        return m;
    }

    m.baseline = probe_.snapshot();
    const uint32_t restarts_before = probe_.restart_count();

    TSG_LOG_INFO("applying fault: " + scenario.describe());
    try {
        driver_.apply(scenario);
    } catch (const FaultApplicationError& e) {
        try {
            driver_.remove(scenario);
        } catch (const std::exception& cleanup) {
            TSG_LOG_ERROR("cleanup after failed apply: " + std::string(cleanup.what()));
        }
        m.note = e.what();
        TSG_LOG_WARN("scenario not applied (" + scenario.name + "): " + m.note);
        return m;
    }

    {
        FaultGuard guard(driver_, scenario);
        std::this_thread::sleep_for(scenario.duration);
        guard.remove_now();
    }
    const auto removed_at = Clock::now();
    const auto deadline = removed_at + settings_.ceiling;
    TSG_LOG_INFO("fault removed, observing recovery: " + scenario.name);

    uint32_t streak = 0;
    Clock::time_point streak_start = removed_at;
    bool recovered = false;

    while (true) {
        const auto tick = Clock::now();
        if (tick >= deadline) break;

        const bool healthy = probe_.health_check(remaining(deadline));
        ++m.health_checks;
        if (healthy) ++m.health_passed;

        const bool served = probe_.synthetic_request(remaining(deadline));
        ++m.requests_sent;
        if (served) ++m.requests_passed;

        if (healthy && served) {
            if (streak == 0) streak_start = tick;
            if (++streak >= settings_.required_successes) {
                recovered = true;
                break;
            }
        } else {
            streak = 0;
        }

        const auto next = std::min(tick + settings_.sample_interval, deadline);
        std::this_thread::sleep_until(next);
    }
    m.observed = since(removed_at, Clock::now());

    if (recovered) {
        m.outcome = ScenarioOutcome::RECOVERED;
        m.recovery_duration = since(removed_at, streak_start);
    } else {
        m.outcome = ScenarioOutcome::FATAL;
        m.recovery_duration = settings_.ceiling;
        m.note = "no stable recovery within " + std::to_string(settings_.ceiling.count()) + "ms";
    }

    const uint32_t restarts_after = probe_.restart_count();
    m.restart_count = restarts_after >= restarts_before ? restarts_after - restarts_before : 0;
    if (m.restart_count > settings_.max_restarts) {
        m.restart_budget_exceeded = true;
        m.outcome = ScenarioOutcome::FATAL;
        m.note = "restart budget exceeded (" + std::to_string(m.restart_count) + " > " +
                 std::to_string(settings_.max_restarts) + ")";
    }

    m.after = probe_.snapshot();
    const double mem_limit = static_cast<double>(m.baseline.memory_bytes) * settings_.memory_tolerance +
                             static_cast<double>(settings_.memory_slack_bytes);
    m.memory_leaked = static_cast<double>(m.after.memory_bytes) > mem_limit;
    const double conn_limit = static_cast<double>(m.baseline.open_connections) *
                              settings_.connection_tolerance +
                              static_cast<double>(settings_.connection_slack);
    m.connections_leaked = static_cast<double>(m.after.open_connections) > conn_limit;

    m.graceful_shutdown = m.outcome == ScenarioOutcome::RECOVERED &&
                          probe_.drain(settings_.drain_timeout);
    m.efficiency_score = recovery_efficiency(m, settings_.sla);

    if (m.outcome == ScenarioOutcome::FATAL) {
        TSG_LOG_ERROR("scenario FATAL (" + scenario.name + "): " + m.note);
    } else {
        TSG_LOG_INFO("scenario recovered (" + scenario.name + ") in " +
                     std::to_string(m.recovery_duration.count()) + "ms, efficiency " +
                     std::to_string(m.efficiency_score));
    }
    if (m.memory_leaked) TSG_LOG_WARN("memory above baseline band after " + scenario.name);
    if (m.connections_leaked) TSG_LOG_WARN("connections above baseline band after " + scenario.name);
    return m;
}

std::vector<RecoveryMetrics> FaultInjector::run_all(const std::vector<FaultScenario>& scenarios) {
    std::vector<RecoveryMetrics> out;
    out.reserve(scenarios.size());
    for (const auto& s : scenarios) {
        out.push_back(run(s));
    }
    return out;
}

} // namespace Chaos
} // namespace tsg
