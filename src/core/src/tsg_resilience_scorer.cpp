#include "tsg_resilience_scorer.hpp"
#include "tsg_config.hpp"
#include "tsg_errors.hpp"
#include "tsg_logger.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace tsg {
namespace Chaos {

namespace {

bool weight_ok(double w) noexcept {
    return std::isfinite(w) && w >= 0.0;
}

double checked(double value, const std::string& category, const char* metric) {
    if (!std::isfinite(value)) {
        throw ScoringError(category, std::string("non-finite ") + metric);
    }
    return std::clamp(value, 0.0, 1.0);
}

} // anonymous namespace

// ==================== ScoringWeights ====================

std::string ScoringWeights::validate() const {
    for (double w : {accuracy, latency, recovery, health, requests, integrity}) {
        if (!weight_ok(w)) return "weights must be finite and non-negative";
    }
    if (accuracy + latency <= 0.0) return "mutation weights sum to zero";
    if (recovery + health + requests + integrity <= 0.0) return "fault weights sum to zero";
    if (!std::isfinite(pass_threshold) || pass_threshold < 0.0 || pass_threshold > 1.0) {
        return "pass threshold must be in [0, 1]";
    }
    if (!std::isfinite(max_spread) || max_spread < 0.0 || max_spread > 1.0) {
        return "max spread must be in [0, 1]";
    }
    if (mutation_time_bound.count() <= 0) return "mutation time bound must be positive";
    if (sla.count() <= 0) return "sla must be positive";
    return {};
}

ScoringWeights ScoringWeights::from_config(const Config& cfg) {
    ScoringWeights w;
    w.accuracy = cfg.getDouble("scoring.weight.accuracy", w.accuracy);
    w.latency = cfg.getDouble("scoring.weight.latency", w.latency);
    w.recovery = cfg.getDouble("scoring.weight.recovery", w.recovery);
    w.health = cfg.getDouble("scoring.weight.health", w.health);
    w.requests = cfg.getDouble("scoring.weight.requests", w.requests);
    w.integrity = cfg.getDouble("scoring.weight.integrity", w.integrity);
    w.pass_threshold = cfg.getDouble("scoring.pass_threshold", w.pass_threshold);
    w.max_spread = cfg.getDouble("scoring.max_spread", w.max_spread);
    w.mutation_time_bound = Millis(cfg.getInt("scoring.mutation_time_bound_ms",
                                              w.mutation_time_bound.count()));
    w.sla = Millis(cfg.getInt("scoring.sla_ms", w.sla.count()));

    const std::string err = w.validate();
    if (!err.empty()) throw ConfigError("invalid scoring configuration: " + err);
    return w;
}

const char* report_status_to_string(ReportStatus s) noexcept {
    switch (s) {
        case ReportStatus::PASS:    return "pass";
        case ReportStatus::FAIL:    return "fail";
        case ReportStatus::NO_DATA: return "no_data";
        case ReportStatus::ABORTED: return "aborted";
    }
    return "unknown";
}

// ==================== ResilienceReport ====================

nlohmann::json ResilienceReport::to_json() const {
    nlohmann::json j;
    j["status"] = report_status_to_string(status);
    j["overall"] = overall ? nlohmann::json(*overall) : nlohmann::json(nullptr);
    j["band"] = band;
    j["pass_threshold"] = pass_threshold;
    j["mutation_cases"] = mutation_cases;
    j["inapplicable_cases"] = inapplicable_cases;
    j["fault_scenarios"] = fault_scenarios;
    j["replay_modes"] = replay_modes;
    if (!abort_reason.empty()) j["abort_reason"] = abort_reason;

    nlohmann::json cats = nlohmann::json::array();
    for (const auto& c : categories) {
        cats.push_back({
            {"name", c.name},
            {"kind", c.kind},
            {"score", c.score},
            {"contribution", c.contribution},
            {"cases", c.cases},
            {"failures", c.failures},
            {"metrics", c.metrics},
        });
    }
    j["categories"] = cats;

    nlohmann::json fails = nlohmann::json::array();
    for (const auto& f : failing) {
        fails.push_back({
            {"kind", f.kind},
            {"category", f.category},
            {"message", f.message},
            {"reproduction", f.reproduction},
        });
    }
    j["failing"] = fails;
    j["coverage_warnings"] = coverage_warnings;
    j["not_applied"] = not_applied;
    return j;
}

std::string ResilienceReport::to_text() const {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(3);
    oss << "Resilience report: " << report_status_to_string(status);
    if (overall) oss << "  overall=" << *overall << " (" << band << ")";
    oss << "  threshold=" << pass_threshold << "\n";
    if (!abort_reason.empty()) oss << "  aborted: " << abort_reason << "\n";
    oss << "  mutation cases: " << mutation_cases << " (+" << inapplicable_cases
        << " inapplicable), replay modes: " << replay_modes
        << ", fault scenarios: " << fault_scenarios << "\n";
    for (const auto& c : categories) {
        oss << "  " << c.name << ": " << c.score;
        if (c.contribution < c.score) oss << " (capped " << c.contribution << ")";
        oss << "  " << c.failures << "/" << c.cases << " failing\n";
    }
    for (const auto& w : coverage_warnings) oss << "  coverage: " << w << "\n";
    for (const auto& n : not_applied) oss << "  not applied: " << n << "\n";
    for (const auto& f : failing) {
        oss << "  [" << f.kind << "] " << f.category << ": " << f.message
            << "  repro: " << f.reproduction << "\n";
    }
    return oss.str();
}

void ResilienceReport::save(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw Error("cannot open report file: " + path);
    out << to_json().dump(2) << "\n";
    if (!out) throw Error("failed writing report file: " + path);
}

// ==================== ResilienceScorer ====================

ResilienceScorer::ResilienceScorer(ScoringWeights weights)
    : weights_(weights) {
    const std::string err = weights_.validate();
    if (!err.empty()) throw ConfigError("invalid scoring configuration: " + err);
}

double ResilienceScorer::recovery_efficiency(Millis duration, Millis sla) noexcept {
    return time_score(duration, sla);
}

const char* ResilienceScorer::status_band(double score) noexcept {
    if (score >= 0.9) return "EXCELLENT";
    if (score >= 0.75) return "GOOD";
    if (score >= 0.6) return "ACCEPTABLE";
    if (score >= 0.4) return "NEEDS_IMPROVEMENT";
    return "CRITICAL";
}

CategoryScore ResilienceScorer::score_mutations(
        const std::string& name, const std::vector<const MutationOutcome*>& outcomes) const {
    if (outcomes.empty()) throw ScoringError(name, "no applicable cases");

    CategoryScore cs;
    cs.name = name;
    cs.kind = "mutation";
    cs.cases = outcomes.size();

    size_t correct = 0;
    size_t in_time = 0;
    for (const auto* o : outcomes) {
        if (o->correct()) {
            ++correct;
        } else {
            ++cs.failures;
        }
        if (o->elapsed <= weights_.mutation_time_bound) ++in_time;
    }
    const double n = static_cast<double>(outcomes.size());
    const double accuracy = checked(correct / n, name, "accuracy");
    const double latency = checked(in_time / n, name, "latency compliance");

    cs.metrics["detection_accuracy"] = accuracy;
    cs.metrics["latency_compliance"] = latency;
    cs.score = checked((weights_.accuracy * accuracy + weights_.latency * latency) /
                       (weights_.accuracy + weights_.latency), name, "score");
    return cs;
}

CategoryScore ResilienceScorer::score_replay(const std::string& name, const ReplayOutcome& replay) const {
    if (replay.compared() == 0) throw ScoringError(name, "no compared records");

    CategoryScore cs;
    cs.name = name;
    cs.kind = "replay";
    cs.cases = replay.compared();
    cs.failures = replay.compared() - std::min(replay.agreed, replay.compared());

    const double agreement = checked(replay.agreement(), name, "agreement");
    const double resets = static_cast<double>(replay.window_resets) / static_cast<double>(replay.records);
    const double ordering = checked(1.0 - std::min(1.0, resets), name, "ordering");
    const double settled = replay.settled ? 1.0 : 0.0;

    cs.metrics["verdict_agreement"] = agreement;
    cs.metrics["ordering"] = ordering;
    cs.metrics["settled"] = settled;
    cs.metrics["served"] = static_cast<double>(replay.served);
    cs.metrics["elapsed_ms"] = static_cast<double>(replay.elapsed.count());
    cs.score = checked(0.5 * agreement + 0.25 * ordering + 0.25 * settled, name, "score");
    return cs;
}

CategoryScore ResilienceScorer::score_faults(
        const std::string& name, const std::vector<const RecoveryMetrics*>& scenarios) const {
    if (scenarios.empty()) throw ScoringError(name, "no applied scenarios");

    CategoryScore cs;
    cs.name = name;
    cs.kind = "fault";
    cs.cases = scenarios.size();

    double efficiency = 0.0;
    double health = 0.0;
    double requests = 0.0;
    double integrity = 0.0;
    double duration_ms = 0.0;
    for (const auto* m : scenarios) {
        if (m->outcome != ScenarioOutcome::RECOVERED) ++cs.failures;
        efficiency += recovery_efficiency(m->recovery_duration, weights_.sla);
        health += m->health_rate();
        requests += m->request_rate();
        int intact = 3;
        if (m->memory_leaked) --intact;
        if (m->connections_leaked) --intact;
        if (!m->graceful_shutdown) --intact;
        integrity += intact / 3.0;
        duration_ms += static_cast<double>(m->recovery_duration.count());
    }
    const double n = static_cast<double>(scenarios.size());
    efficiency = checked(efficiency / n, name, "recovery efficiency");
    health = checked(health / n, name, "health rate");
    requests = checked(requests / n, name, "request rate");
    integrity = checked(integrity / n, name, "integrity");

    cs.metrics["recovery_efficiency"] = efficiency;
    cs.metrics["health_rate"] = health;
    cs.metrics["request_rate"] = requests;
    cs.metrics["integrity"] = integrity;
    cs.metrics["mean_recovery_ms"] = duration_ms / n;

    const double wsum = weights_.recovery + weights_.health + weights_.requests + weights_.integrity;
    cs.score = checked((weights_.recovery * efficiency + weights_.health * health +
                        weights_.requests * requests + weights_.integrity * integrity) / wsum,
                       name, "score");
    return cs;
}

ResilienceReport ResilienceScorer::score(const std::vector<MutationOutcome>& mutations,
                                         const std::vector<RecoveryMetrics>& faults,
                                         size_t inapplicable_cases,
                                         const std::vector<ReplayOutcome>& replays) const {
    ResilienceReport report;
    report.pass_threshold = weights_.pass_threshold;
    report.mutation_cases = mutations.size();
    report.inapplicable_cases = inapplicable_cases;
    report.replay_modes = replays.size();

    for (const auto& r : replays) {
        if (r.clean()) continue;
        const std::string mode = replay_mode_to_string(r.mode);
        std::string msg = std::to_string(r.agreed) + "/" + std::to_string(r.compared()) +
                          " verdicts agree, " + std::to_string(r.window_resets) + " window resets";
        if (!r.settled) msg += ", not settled";
        if (!r.note.empty()) msg += " (" + r.note + ")";
        report.failing.push_back({"replay", mode, msg,
                                  r.disagreements.empty() ? "replay " + mode : r.disagreements.front()});
    }

    std::map<std::string, std::vector<const MutationOutcome*>> by_mutation;
    for (const auto& o : mutations) {
        const std::string cat = category_to_string(o.category);
        by_mutation["mutation:" + cat].push_back(&o);
        if (!o.correct()) {
            std::string msg = std::string("expected ") + handling_to_string(o.expected);
            msg += o.handled ? std::string(", got ") + handling_to_string(o.actual)
                             : std::string(", handling failed");
            if (!o.detail.empty()) msg += " (" + o.detail + ")";
            report.failing.push_back({"mutation", cat, msg, o.reproduction});
        }
    }

    std::map<std::string, std::vector<const RecoveryMetrics*>> by_fault;
    for (const auto& m : faults) {
        const std::string cat = fault_type_to_string(m.scenario.type);
        if (!m.scored()) {
            report.not_applied.push_back(m.scenario.name + ": " + m.note);
            continue;
        }
        ++report.fault_scenarios;
        by_fault["fault:" + cat].push_back(&m);
        if (m.outcome == ScenarioOutcome::FATAL) {
            report.failing.push_back({"fault", cat, m.note, m.scenario.describe()});
        }
        if (m.memory_leaked || m.connections_leaked) {
            std::string what = m.memory_leaked ? "memory" : "";
            if (m.connections_leaked) what += what.empty() ? "connections" : " and connections";
            report.failing.push_back({"leak", cat, what + " above baseline band",
                                      m.scenario.describe()});
        }
    }

    auto collect = [&](auto&& fn) {
        try {
            report.categories.push_back(fn());
        } catch (const ScoringError& e) {
            report.coverage_warnings.push_back(e.category() + " excluded: " + e.what());
            TSG_LOG_WARN("scoring coverage reduced, " + e.category() + ": " + e.what());
        }
    };
    for (const auto& kv : by_mutation) {
        collect([&] { return score_mutations(kv.first, kv.second); });
    }
    for (const auto& r : replays) {
        collect([&] { return score_replay(std::string("replay:") + replay_mode_to_string(r.mode), r); });
    }
    for (const auto& kv : by_fault) {
        collect([&] { return score_faults(kv.first, kv.second); });
    }

    if (report.categories.empty()) {
        report.status = ReportStatus::NO_DATA;
        report.coverage_warnings.push_back("no scorable categories");
        TSG_LOG_WARN("resilience report has no scorable categories");
        return report;
    }

    double floor = 1.0;
    for (const auto& c : report.categories) floor = std::min(floor, c.score);
    const double cap = std::min(1.0, floor + weights_.max_spread);

    double sum = 0.0;
    for (auto& c : report.categories) {
        c.contribution = std::min(c.score, cap);
        sum += c.contribution;
    }
    const double overall = std::clamp(sum / static_cast<double>(report.categories.size()), 0.0, 1.0);
    report.overall = overall;
    report.band = status_band(overall);
    report.status = overall >= weights_.pass_threshold ? ReportStatus::PASS : ReportStatus::FAIL;

    TSG_LOG_INFO("resilience score " + std::to_string(overall) + " (" + report.band + "), " +
                 std::to_string(report.failing.size()) + " failing findings");
    return report;
}

} // namespace Chaos
} // namespace tsg
