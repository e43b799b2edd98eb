#pragma once

/**
 * @file tsg_chaos_campaign.hpp
 * @brief Full resilience run: mutation cases, traffic replay, fault scenarios, then scoring
 */

#include "tsg_chaos_driver.hpp"
#include "tsg_fault_injector.hpp"
#include "tsg_guard_service.hpp"
#include "tsg_mutation_engine.hpp"
#include "tsg_replay.hpp"
#include "tsg_resilience_scorer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tsg {

class Config;

namespace Chaos {

/// One scenario per fault type against @p target.
std::vector<FaultScenario> default_scenarios(const std::string& target, Millis duration);

struct CampaignConfig {
    MutationSettings mutation;
    InjectorSettings injector;
    ReplaySettings replay;
    ScoringWeights weights;
    std::vector<FaultScenario> scenarios;

    /// Throws ConfigError on invalid values.
    static CampaignConfig from_config(const Config& cfg);
};

struct CampaignResult {
    std::vector<MutationOutcome> mutations;
    std::vector<ReplayOutcome> replays;
    std::vector<RecoveryMetrics> faults;
    size_t inapplicable = 0;
    ResilienceReport report;
};

class ChaosCampaign {
public:
    ChaosCampaign(std::shared_ptr<GuardService> service, IChaosDriver& driver,
                  IServiceProbe& probe, CampaignConfig config);

    /// Feed one case through the live service and record what happened.
    MutationOutcome judge(const MutationCase& mc);

    /// Never throws for intrinsic failures; those become findings. Aborts
    /// only when the target cannot be reached, keeping partial results.
    CampaignResult run(const std::vector<TrafficRecord>& bases);

    const CampaignConfig& config() const noexcept { return config_; }

private:
    bool target_reachable() const;

    std::shared_ptr<GuardService> service_;
    IChaosDriver& driver_;
    IServiceProbe& probe_;
    CampaignConfig config_;
    MutationEngine engine_;
};

} // namespace Chaos
} // namespace tsg
