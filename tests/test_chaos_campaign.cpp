/**
 * @file test_chaos_campaign.cpp
 * @brief End-to-end resilience runs against an in-process service
 */

#include <gtest/gtest.h>
#include "tsg_chaos_campaign.hpp"
#include "tsg_config.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace tsg;
using namespace tsg::Chaos;

namespace {

std::vector<TrafficRecord> bases() {
    TrafficRecord a;
    a.id = "base-a";
    a.identity = "user-1";
    a.connection_id = "conn-1";
    a.timestamp = Millis(1700000000000);
    a.prompt = "What is the capital of Portugal?";
    a.response = "Lisbon is the capital of Portugal.";
    a.input_tokens = 12;
    a.output_tokens = 9;
    a.latency = Millis(400);

    TrafficRecord b = a;
    b.id = "base-b";
    b.identity = "user-2";
    b.connection_id = "conn-2";
    b.prompt.clear();
    b.response.clear();
    b.prompt_ref = "blob://prompts/b";
    b.response_ref = "blob://responses/b";
    return {a, b};
}

/// Delegates to a real probe but stops being reachable after a number of checks.
class FlakyReachProbe : public IServiceProbe {
public:
    FlakyReachProbe(IServiceProbe& inner, int reachable_checks)
        : inner_(inner), remaining_(reachable_checks) {}

    std::string target() const override { return inner_.target(); }
    bool reachable() const override { return remaining_-- > 0; }
    bool health_check(Millis budget) override { return inner_.health_check(budget); }
    bool synthetic_request(Millis budget) override { return inner_.synthetic_request(budget); }
    ResourceSnapshot snapshot() override { return inner_.snapshot(); }
    bool drain(Millis timeout) override { return inner_.drain(timeout); }
    uint32_t restart_count() const override { return inner_.restart_count(); }

private:
    IServiceProbe& inner_;
    mutable int remaining_;
};

} // namespace

class ChaosCampaignTest : public ::testing::Test {
protected:
    void SetUp() override {
        ServiceSettings settings;
        settings.request_timeout = Millis(300);
        settings.restart_delay = Millis(20);
        settings.connection_limit = 16;
        service = std::make_shared<GuardService>(GuardConfig{}, CaptureLimits{}, settings);
        driver = std::make_unique<InProcessChaosDriver>(service, 8u * 1024u * 1024u);
        probe = std::make_unique<GuardServiceProbe>(service);

        config.mutation.seeds_per_category = 2;
        config.mutation.intensity = 1.0;
        config.injector.sample_interval = Millis(10);
        config.injector.ceiling = Millis(2000);
        config.injector.drain_timeout = Millis(500);
        config.scenarios = default_scenarios("tsguard", Millis(50));
    }

    std::shared_ptr<GuardService> service;
    std::unique_ptr<InProcessChaosDriver> driver;
    std::unique_ptr<GuardServiceProbe> probe;
    CampaignConfig config;
};

// ─── full runs ──────────────────────────────────────────────────────────────

TEST_F(ChaosCampaignTest, HealthyServicePasses) {
    ChaosCampaign campaign(service, *driver, *probe, config);
    auto result = campaign.run(bases());

    // 2 bases x 8 categories x 2 seeds; encoding cases on the referenced base do not apply
    EXPECT_EQ(result.mutations.size() + result.inapplicable, 32u);
    EXPECT_EQ(result.inapplicable, 2u);
    EXPECT_EQ(result.faults.size(), 7u);
    ASSERT_EQ(result.replays.size(), all_replay_modes().size());
    for (const auto& r : result.replays) {
        EXPECT_TRUE(r.clean()) << replay_mode_to_string(r.mode) << ": " << r.note;
    }

    for (const auto& m : result.mutations) {
        EXPECT_TRUE(m.correct()) << m.reproduction << ": " << m.detail;
    }
    for (const auto& f : result.faults) {
        EXPECT_EQ(f.outcome, ScenarioOutcome::RECOVERED) << f.scenario.name << ": " << f.note;
    }

    const auto& report = result.report;
    // 8 mutation categories, 3 replay modes, 7 fault types
    EXPECT_EQ(report.categories.size(), 8u + 3u + 7u);
    EXPECT_EQ(report.replay_modes, 3u);
    EXPECT_EQ(report.status, ReportStatus::PASS) << report.to_text();
    ASSERT_TRUE(report.overall.has_value());
    EXPECT_GE(*report.overall, 0.75);
    EXPECT_TRUE(report.abort_reason.empty());
    EXPECT_TRUE(service->health().healthy);
}

TEST_F(ChaosCampaignTest, UnreachableTargetAbortsBeforeStart) {
    FlakyReachProbe never(*probe, 0);
    ChaosCampaign campaign(service, *driver, never, config);
    auto result = campaign.run(bases());

    EXPECT_EQ(result.report.status, ReportStatus::ABORTED);
    EXPECT_FALSE(result.report.abort_reason.empty());
    EXPECT_TRUE(result.mutations.empty());
    EXPECT_TRUE(result.faults.empty());
    EXPECT_FALSE(result.report.overall.has_value());
}

TEST_F(ChaosCampaignTest, LosingTheTargetKeepsPartialResults) {
    // one check before the mutation batch, then one per scenario
    FlakyReachProbe flaky(*probe, 3);
    ChaosCampaign campaign(service, *driver, flaky, config);
    auto result = campaign.run(bases());

    EXPECT_EQ(result.report.status, ReportStatus::ABORTED);
    EXPECT_NE(result.report.abort_reason.find("became unreachable"), std::string::npos);
    EXPECT_EQ(result.faults.size(), 2u);
    EXPECT_FALSE(result.mutations.empty());
    EXPECT_TRUE(result.report.overall.has_value());
    EXPECT_FALSE(result.report.categories.empty());
}

TEST_F(ChaosCampaignTest, CategoryDisabledInConfig) {
    config.mutation.enabled[MutationCategory::SIZE_CORRUPTION] = false;
    config.scenarios.clear();
    ChaosCampaign campaign(service, *driver, *probe, config);
    auto result = campaign.run(bases());

    std::set<std::string> names;
    for (const auto& c : result.report.categories) names.insert(c.name);
    EXPECT_EQ(names.count("mutation:size_corruption"), 0u);
    EXPECT_EQ(names.count("mutation:bit_flip"), 1u);
    EXPECT_EQ(result.report.fault_scenarios, 0u);
}

TEST_F(ChaosCampaignTest, ReplayStageCanBeDisabled) {
    config.replay.enabled = false;
    config.scenarios.clear();
    ChaosCampaign campaign(service, *driver, *probe, config);
    auto result = campaign.run(bases());

    EXPECT_TRUE(result.replays.empty());
    for (const auto& c : result.report.categories) {
        EXPECT_NE(c.kind, "replay") << c.name;
    }
}

// ─── single cases ───────────────────────────────────────────────────────────

TEST_F(ChaosCampaignTest, JudgeRecordsActualHandling) {
    ChaosCampaign campaign(service, *driver, *probe, config);
    MutationEngine engine;
    auto mc = engine.mutate(bases()[0], MutationCategory::TYPE_CORRUPTION, 0.5, 9);
    auto o = campaign.judge(mc);
    EXPECT_TRUE(o.handled);
    EXPECT_EQ(o.actual, ExpectedHandling::REJECT);
    EXPECT_TRUE(o.correct());
    EXPECT_FALSE(o.detail.empty());
}

TEST_F(ChaosCampaignTest, JudgeOnStoppedServiceIsAHandlingFailure) {
    ChaosCampaign campaign(service, *driver, *probe, config);
    MutationEngine engine;
    auto mc = engine.mutate(bases()[0], MutationCategory::INJECTION_PAYLOAD, 0.1, 1);
    service->shutdown();
    auto o = campaign.judge(mc);
    EXPECT_FALSE(o.handled);
    EXPECT_FALSE(o.correct());
    EXPECT_NE(o.detail.find("service down"), std::string::npos);
}

TEST(CampaignConfigTest, FromDefaults) {
    Config cfg;
    auto c = CampaignConfig::from_config(cfg);
    ASSERT_EQ(c.scenarios.size(), 7u);
    std::set<FaultType> types;
    for (const auto& s : c.scenarios) {
        types.insert(s.type);
        EXPECT_EQ(s.target, "tsguard");
        EXPECT_EQ(s.duration, Millis(300));
        EXPECT_TRUE(s.validate().empty());
    }
    EXPECT_EQ(types.size(), all_fault_types().size());

    EXPECT_TRUE(c.replay.enabled);
    EXPECT_EQ(c.replay.records_per_mode, 64u);

    cfg.setInt("chaos.fault_duration_ms", -5);
    EXPECT_THROW(CampaignConfig::from_config(cfg), ConfigError);
}
