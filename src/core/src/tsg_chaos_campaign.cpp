#include "tsg_chaos_campaign.hpp"
#include "tsg_config.hpp"
#include "tsg_errors.hpp"
#include "tsg_logger.hpp"

#include <chrono>

namespace tsg {
namespace Chaos {

namespace {

FaultScenario scenario(const char* name, FaultType type, const std::string& target,
                       Millis duration, double intensity) {
    FaultScenario s;
    s.name = name;
    s.type = type;
    s.target = target;
    s.duration = duration;
    s.intensity = intensity;
    return s;
}

} // anonymous namespace

std::vector<FaultScenario> default_scenarios(const std::string& target, Millis duration) {
    return {
        scenario("kill", FaultType::PROCESS_KILL, target, duration, 1.0),
        scenario("pause", FaultType::PROCESS_PAUSE, target, duration, 1.0),
        scenario("partition", FaultType::NETWORK_PARTITION, target, duration, 1.0),
        scenario("delay", FaultType::NETWORK_DELAY, target, duration, 0.5),
        scenario("cpu", FaultType::CPU_PRESSURE, target, duration, 0.5),
        scenario("memory", FaultType::MEMORY_PRESSURE, target, duration, 0.5),
        scenario("connections", FaultType::CONNECTION_EXHAUSTION, target, duration, 1.0),
    };
}

CampaignConfig CampaignConfig::from_config(const Config& cfg) {
    CampaignConfig c;
    c.mutation = MutationSettings::from_config(cfg);
    c.injector = InjectorSettings::from_config(cfg);
    c.replay = ReplaySettings::from_config(cfg);
    c.weights = ScoringWeights::from_config(cfg);

    const int64_t duration = cfg.getInt("chaos.fault_duration_ms", 300);
    if (duration < 0) throw ConfigError("chaos.fault_duration_ms must not be negative");
    c.scenarios = default_scenarios(cfg.get("chaos.target", "tsguard"), Millis(duration));
    return c;
}

// ==================== ChaosCampaign ====================

ChaosCampaign::ChaosCampaign(std::shared_ptr<GuardService> service, IChaosDriver& driver,
                             IServiceProbe& probe, CampaignConfig config)
    : service_(std::move(service))
    , driver_(driver)
    , probe_(probe)
    , config_(std::move(config))
    , engine_(service_ ? service_->capture_limits() : CaptureLimits{}) {}

bool ChaosCampaign::target_reachable() const {
    return service_ != nullptr && probe_.reachable();
}

MutationOutcome ChaosCampaign::judge(const MutationCase& mc) {
    MutationOutcome out;
    out.category = mc.category;
    out.reproduction = mc.reproduction();
    out.variant = mc.variant;
    out.expected = mc.expected;

    const auto start = std::chrono::steady_clock::now();
    try {
        SubmitResult r = service_->handle(mc.payload);
        if (!r.ok()) {
            out.handled = false;
            out.detail = r.error;
        } else if (!r.capture.accepted()) {
            out.actual = ExpectedHandling::REJECT;
            if (r.capture.rejection) {
                out.detail = std::string(reason_to_string(r.capture.rejection->reason)) + ": " +
                             r.capture.rejection->message;
            }
        } else {
            out.actual = r.capture.record->sanitized ? ExpectedHandling::SANITIZE
                                                     : ExpectedHandling::PASS;
            if (!r.verdict) {
                out.handled = false;
                out.detail = "accepted record produced no verdict";
            }
        }
    } catch (const std::exception& e) {
        out.handled = false;
        out.detail = std::string("unhandled exception: ") + e.what();
    }
    out.elapsed = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);
    if (!out.correct()) {
        out.detail = out.variant + (out.detail.empty() ? "" : ", " + out.detail);
    }
    return out;
}

CampaignResult ChaosCampaign::run(const std::vector<TrafficRecord>& bases) {
    CampaignResult result;
    ResilienceScorer scorer(config_.weights);

    if (!target_reachable()) {
        result.report = scorer.score({}, {});
        result.report.status = ReportStatus::ABORTED;
        result.report.abort_reason = "target '" + probe_.target() + "' unreachable before start";
        TSG_LOG_ERROR("campaign aborted: " + result.report.abort_reason);
        return result;
    }

    std::vector<Finding> extra;
    const auto cases = engine_.generate(bases, config_.mutation);
    TSG_LOG_INFO("campaign: " + std::to_string(cases.size()) + " mutation cases over " +
                 std::to_string(bases.size()) + " base records");

    for (const auto& mc : cases) {
        if (!mc.applied()) {
            ++result.inapplicable;
            TSG_LOG_DEBUG("inapplicable: " + mc.reproduction() + " (" + mc.inapplicable_reason + ")");
            continue;
        }
        result.mutations.push_back(judge(mc));
    }
    if (!service_->synthetic_request()) {
        extra.push_back({"error", "detector", "service stopped serving after mutation cases",
                         "mutation batch"});
    }

    if (config_.replay.enabled && !bases.empty()) {
        TrafficReplayer replayer(service_, config_.replay);
        result.replays = replayer.run_all(bases);
    }

    std::string abort_reason;
    FaultInjector injector(driver_, probe_, config_.injector);
    for (const auto& s : config_.scenarios) {
        if (!probe_.reachable()) {
            abort_reason = "target '" + probe_.target() + "' became unreachable before " + s.name;
            break;
        }
        result.faults.push_back(injector.run(s));
    }

    result.report = scorer.score(result.mutations, result.faults, result.inapplicable, result.replays);
    for (auto& f : extra) result.report.failing.push_back(std::move(f));
    if (!abort_reason.empty()) {
        result.report.status = ReportStatus::ABORTED;
        result.report.abort_reason = abort_reason;
        TSG_LOG_ERROR("campaign aborted with partial results: " + abort_reason);
    }
    return result;
}

} // namespace Chaos
} // namespace tsg
