/**
 * @file test_fault_injector.cpp
 * @brief Fault application, recovery observation and leak bands
 */

#include <gtest/gtest.h>
#include "tsg_chaos_driver.hpp"
#include "tsg_errors.hpp"
#include "tsg_fault_injector.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

using namespace tsg;
using namespace tsg::Chaos;

namespace {

class FakeDriver : public IChaosDriver {
public:
    std::string name() const override { return "fake"; }
    bool supports(FaultType type) const override { return unsupported.count(type) == 0; }

    void apply(const FaultScenario& scenario) override {
        ++applied;
        if (fail_apply) throw FaultApplicationError("target refused " + scenario.name);
    }
    void remove(const FaultScenario&) override { ++removed; }

    std::set<FaultType> unsupported;
    bool fail_apply = false;
    int applied = 0;
    int removed = 0;
};

/// Health follows a script; past its end the last value repeats.
class FakeProbe : public IServiceProbe {
public:
    std::string target() const override { return "fake-target"; }
    bool reachable() const override { return true; }

    bool health_check(Millis) override {
        if (checks == 0) restarts += restarts_during_fault;
        const size_t i = checks++;
        if (script.empty()) return healthy;
        return i < script.size() ? script[i] : script.back();
    }
    bool synthetic_request(Millis) override { return health_check_result_for_requests(); }

    ResourceSnapshot snapshot() override {
        return ++snapshots == 1 ? baseline : after;
    }

    bool drain(Millis) override {
        ++drains;
        return drain_ok;
    }
    uint32_t restart_count() const override { return restarts; }

    bool health_check_result_for_requests() {
        const size_t i = checks == 0 ? 0 : checks - 1;
        if (script.empty()) return healthy;
        return i < script.size() ? script[i] : script.back();
    }

    std::vector<bool> script;
    bool healthy = true;
    bool drain_ok = true;
    ResourceSnapshot baseline{1000, 2};
    ResourceSnapshot after{1000, 2};
    uint32_t restarts = 0;
    uint32_t restarts_during_fault = 0;
    size_t checks = 0;
    int snapshots = 0;
    int drains = 0;
};

InjectorSettings fast_settings() {
    InjectorSettings s;
    s.sample_interval = Millis(10);
    s.required_successes = 3;
    s.ceiling = Millis(400);
    s.drain_timeout = Millis(100);
    return s;
}

FaultScenario scenario(FaultType type, const std::string& name = "scenario") {
    FaultScenario s;
    s.name = name;
    s.type = type;
    s.duration = Millis(20);
    s.intensity = 0.5;
    return s;
}

} // namespace

class FaultInjectorTest : public ::testing::Test {
protected:
    FakeDriver driver;
    FakeProbe probe;
};

// ─── outcomes ───────────────────────────────────────────────────────────────

TEST_F(FaultInjectorTest, HealthyTargetRecovers) {
    FaultInjector injector(driver, probe, fast_settings());
    auto m = injector.run(scenario(FaultType::NETWORK_PARTITION));

    EXPECT_EQ(m.outcome, ScenarioOutcome::RECOVERED);
    EXPECT_EQ(driver.applied, 1);
    EXPECT_EQ(driver.removed, 1);
    EXPECT_EQ(m.health_checks, 3u);
    EXPECT_EQ(m.health_passed, 3u);
    EXPECT_EQ(m.requests_sent, 3u);
    EXPECT_LT(m.recovery_duration.count(), 50);
    EXPECT_TRUE(m.graceful_shutdown);
    EXPECT_EQ(probe.drains, 1);
    EXPECT_FALSE(m.memory_leaked);
    EXPECT_FALSE(m.connections_leaked);
    EXPECT_GT(m.efficiency_score, 0.95);
    EXPECT_LE(m.efficiency_score, 1.0);
}

TEST_F(FaultInjectorTest, StabilizationNeedsConsecutiveSuccesses) {
    probe.script = {false, false, true, false, true, true, true};
    FaultInjector injector(driver, probe, fast_settings());
    auto m = injector.run(scenario(FaultType::PROCESS_PAUSE));

    EXPECT_EQ(m.outcome, ScenarioOutcome::RECOVERED);
    EXPECT_EQ(m.health_checks, 7u);
    EXPECT_EQ(m.health_passed, 4u);
    // streak starts at the fifth sample, four intervals after removal
    EXPECT_GE(m.recovery_duration.count(), 35);
    EXPECT_LT(m.health_rate(), 1.0);
}

TEST_F(FaultInjectorTest, NoRecoveryIsFatalAtTheCeiling) {
    probe.healthy = false;
    FaultInjector injector(driver, probe, fast_settings());

    auto start = std::chrono::steady_clock::now();
    auto m = injector.run(scenario(FaultType::PROCESS_KILL));
    auto took = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);

    EXPECT_EQ(m.outcome, ScenarioOutcome::FATAL);
    EXPECT_EQ(m.recovery_duration, Millis(400));
    EXPECT_DOUBLE_EQ(m.efficiency_score, 0.0);
    EXPECT_FALSE(m.graceful_shutdown);
    EXPECT_EQ(probe.drains, 0);
    EXPECT_FALSE(m.note.empty());
    // duration + ceiling plus scheduling slack
    EXPECT_LT(took.count(), 20 + 400 + 300);
    EXPECT_GE(m.observed.count(), 390);
}

TEST_F(FaultInjectorTest, FailedApplyIsNotApplied) {
    driver.fail_apply = true;
    FaultInjector injector(driver, probe, fast_settings());
    auto m = injector.run(scenario(FaultType::CPU_PRESSURE));

    EXPECT_EQ(m.outcome, ScenarioOutcome::NOT_APPLIED);
    EXPECT_FALSE(m.scored());
    EXPECT_EQ(driver.removed, 1);
    EXPECT_EQ(probe.checks, 0u);
    EXPECT_NE(m.note.find("refused"), std::string::npos);
}

TEST_F(FaultInjectorTest, UnsupportedAndInvalidScenariosAreNotApplied) {
    driver.unsupported.insert(FaultType::MEMORY_PRESSURE);
    FaultInjector injector(driver, probe, fast_settings());

    auto unsupported = injector.run(scenario(FaultType::MEMORY_PRESSURE));
    EXPECT_EQ(unsupported.outcome, ScenarioOutcome::NOT_APPLIED);

    auto bad = scenario(FaultType::NETWORK_DELAY);
    bad.intensity = 2.0;
    EXPECT_EQ(injector.run(bad).outcome, ScenarioOutcome::NOT_APPLIED);

    auto unnamed = scenario(FaultType::NETWORK_DELAY, "");
    EXPECT_EQ(injector.run(unnamed).outcome, ScenarioOutcome::NOT_APPLIED);
    EXPECT_EQ(driver.applied, 0);
}

TEST_F(FaultInjectorTest, RestartBudgetExceededIsFatal) {
    probe.restarts_during_fault = 5;
    FaultInjector injector(driver, probe, fast_settings());
    auto m = injector.run(scenario(FaultType::PROCESS_KILL));
    EXPECT_EQ(m.restart_count, 5u);
    EXPECT_TRUE(m.restart_budget_exceeded);
    EXPECT_EQ(m.outcome, ScenarioOutcome::FATAL);
    EXPECT_DOUBLE_EQ(m.efficiency_score, 0.0);
}

// ─── leak bands and efficiency ──────────────────────────────────────────────

TEST_F(FaultInjectorTest, GrowthBeyondBandIsALeak) {
    probe.after = ResourceSnapshot{10u * 1024u * 1024u, 20};
    FaultInjector injector(driver, probe, fast_settings());
    auto m = injector.run(scenario(FaultType::MEMORY_PRESSURE));

    EXPECT_EQ(m.outcome, ScenarioOutcome::RECOVERED);
    EXPECT_TRUE(m.memory_leaked);
    EXPECT_TRUE(m.connections_leaked);

    RecoveryMetrics clean = m;
    clean.memory_leaked = false;
    clean.connections_leaked = false;
    EXPECT_NEAR(m.efficiency_score, recovery_efficiency(clean, Millis(2000)) * 0.64, 1e-9);
}

TEST_F(FaultInjectorTest, GrowthWithinSlackIsNotALeak) {
    probe.after = ResourceSnapshot{1000 + 512 * 1024, 7};
    FaultInjector injector(driver, probe, fast_settings());
    auto m = injector.run(scenario(FaultType::CONNECTION_EXHAUSTION));
    EXPECT_FALSE(m.memory_leaked);
    EXPECT_FALSE(m.connections_leaked);
}

TEST_F(FaultInjectorTest, FailedDrainLowersEfficiency) {
    probe.drain_ok = false;
    FaultInjector injector(driver, probe, fast_settings());
    auto m = injector.run(scenario(FaultType::NETWORK_DELAY));
    EXPECT_EQ(m.outcome, ScenarioOutcome::RECOVERED);
    EXPECT_FALSE(m.graceful_shutdown);
    EXPECT_LT(m.efficiency_score, 0.71);
}

TEST(TimeScoreTest, MonotonicAndAnchored) {
    const Millis sla(2000);
    EXPECT_DOUBLE_EQ(time_score(Millis(0), sla), 1.0);
    EXPECT_DOUBLE_EQ(time_score(sla, sla), 0.5);
    EXPECT_DOUBLE_EQ(time_score(Millis(4000), sla), 0.25);
    double prev = 1.0;
    for (int64_t d = 0; d <= 20000; d += 50) {
        double s = time_score(Millis(d), sla);
        EXPECT_LE(s, prev) << d;
        EXPECT_GE(s, 0.0);
        prev = s;
    }
}

TEST(TimeScoreTest, FatalHasZeroEfficiency) {
    RecoveryMetrics m;
    m.outcome = ScenarioOutcome::FATAL;
    m.health_checks = m.health_passed = 10;
    m.requests_sent = m.requests_passed = 10;
    EXPECT_DOUBLE_EQ(recovery_efficiency(m, Millis(2000)), 0.0);
}

TEST(InjectorSettingsTest, InvalidSettingsThrow) {
    FakeDriver driver;
    FakeProbe probe;
    InjectorSettings s;
    s.required_successes = 0;
    EXPECT_THROW({ FaultInjector injector(driver, probe, s); }, ConfigError);
    s = InjectorSettings{};
    s.memory_tolerance = 0.5;
    EXPECT_FALSE(s.validate().empty());
}

TEST_F(FaultInjectorTest, RunAllKeepsOrder) {
    FaultInjector injector(driver, probe, fast_settings());
    auto results = injector.run_all({scenario(FaultType::NETWORK_PARTITION, "a"),
                                     scenario(FaultType::NETWORK_DELAY, "b")});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].scenario.name, "a");
    EXPECT_EQ(results[1].scenario.name, "b");
}

// ─── in-process target ──────────────────────────────────────────────────────

class InProcessFaultTest : public ::testing::Test {
protected:
    void SetUp() override {
        ServiceSettings settings;
        settings.request_timeout = Millis(200);
        settings.restart_delay = Millis(30);
        settings.connection_limit = 16;
        service = std::make_shared<GuardService>(GuardConfig{}, CaptureLimits{}, settings);
        driver = std::make_unique<InProcessChaosDriver>(service, 8u * 1024u * 1024u);
        probe = std::make_unique<GuardServiceProbe>(service);
    }

    FaultScenario make(FaultType type, double intensity = 1.0) {
        FaultScenario s;
        s.name = fault_type_to_string(type);
        s.type = type;
        s.target = "tsguard";
        s.duration = Millis(50);
        s.intensity = intensity;
        return s;
    }

    std::shared_ptr<GuardService> service;
    std::unique_ptr<InProcessChaosDriver> driver;
    std::unique_ptr<GuardServiceProbe> probe;
};

TEST_F(InProcessFaultTest, KillRecoversWithinSla) {
    FaultInjector injector(*driver, *probe, fast_settings());
    auto m = injector.run(make(FaultType::PROCESS_KILL));
    EXPECT_EQ(m.outcome, ScenarioOutcome::RECOVERED) << m.note;
    EXPECT_LT(m.recovery_duration.count(), 2000);
    EXPECT_GE(m.restart_count, 1u);
    EXPECT_LE(m.restart_count, 3u);
    EXPECT_FALSE(m.memory_leaked);
}

TEST_F(InProcessFaultTest, EveryFaultTypeRecovers) {
    InjectorSettings settings = fast_settings();
    settings.ceiling = Millis(2000);
    FaultInjector injector(*driver, *probe, settings);
    for (FaultType t : all_fault_types()) {
        auto m = injector.run(make(t, 0.5));
        EXPECT_EQ(m.outcome, ScenarioOutcome::RECOVERED) << fault_type_to_string(t) << ": " << m.note;
        EXPECT_FALSE(m.memory_leaked) << fault_type_to_string(t);
        EXPECT_FALSE(m.connections_leaked) << fault_type_to_string(t);
    }
    EXPECT_TRUE(service->health().healthy);
    EXPECT_EQ(service->health().open_connections, 0u);
}

TEST_F(InProcessFaultTest, UnknownTargetIsNotApplied) {
    FaultInjector injector(*driver, *probe, fast_settings());
    auto s = make(FaultType::NETWORK_PARTITION);
    s.target = "some-other-service";
    EXPECT_EQ(injector.run(s).outcome, ScenarioOutcome::NOT_APPLIED);
    EXPECT_TRUE(service->health().healthy);
}

TEST_F(InProcessFaultTest, KillingAStoppedTargetIsNotApplied) {
    service->shutdown();
    FaultInjector injector(*driver, *probe, fast_settings());
    auto m = injector.run(make(FaultType::PROCESS_KILL));
    EXPECT_EQ(m.outcome, ScenarioOutcome::NOT_APPLIED);
}

TEST(ChaosDriverFactoryTest, BuildsBundles) {
    auto service = std::make_shared<GuardService>(GuardConfig{});
    auto bundle = ChaosDriverFactory::create(ChaosDriverType::IN_PROCESS, service);
    ASSERT_TRUE(bundle.driver);
    ASSERT_TRUE(bundle.probe);
    EXPECT_EQ(bundle.driver->name(), "in_process");
    EXPECT_EQ(bundle.probe->target(), "tsguard");

    EXPECT_THROW(ChaosDriverFactory::create(ChaosDriverType::IN_PROCESS, nullptr), FaultApplicationError);
    EXPECT_THROW(ChaosDriverFactory::create(ChaosDriverType::PROCESS_SIGNAL, nullptr, ProcessTarget{}),
                 FaultApplicationError);

    ProcessTarget self;
    self.name = "self";
    self.pid = ::getpid();
    auto external = ChaosDriverFactory::create(ChaosDriverType::PROCESS_SIGNAL, nullptr, self);
    EXPECT_TRUE(external.driver->supports(FaultType::PROCESS_KILL));
    EXPECT_FALSE(external.driver->supports(FaultType::MEMORY_PRESSURE));
    EXPECT_TRUE(external.probe->reachable());
    EXPECT_TRUE(external.probe->health_check(Millis(1000)));
    EXPECT_GT(external.probe->snapshot().memory_bytes, 0u);
}

// ─── external health command ────────────────────────────────────────────────

TEST(HealthCommandTest, HealthCommandExitStatusDecides) {
    ProcessTarget self;
    self.name = "self";
    self.pid = ::getpid();
    self.health_command = "true";
    EXPECT_TRUE(ProcessProbe(self).health_check(Millis(2000)));

    self.health_command = "exit 3";
    EXPECT_FALSE(ProcessProbe(self).health_check(Millis(2000)));
}

TEST(HealthCommandTest, HangingHealthCommandIsKilled) {
    ProcessTarget self;
    self.name = "self";
    self.pid = ::getpid();
    self.health_command = "sleep 10";
    self.health_timeout = Millis(5000);
    ProcessProbe checker(self);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(checker.health_check(Millis(200)));
    auto took = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);
    EXPECT_LT(took.count(), 2000);

    self.health_timeout = Millis(100);
    ProcessProbe capped(self);
    start = std::chrono::steady_clock::now();
    EXPECT_FALSE(capped.health_check(Millis(10000)));
    took = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);
    EXPECT_LT(took.count(), 2000);
}

TEST(HealthCommandTest, HangingHealthCommandCannotOutliveTheCeiling) {
    ProcessTarget self;
    self.name = "self";
    self.pid = ::getpid();
    self.health_command = "sleep 10";
    self.health_timeout = Millis(10000);
    ProcessProbe checker(self);
    FakeDriver driver;

    InjectorSettings settings = fast_settings();
    settings.ceiling = Millis(300);
    FaultInjector injector(driver, checker, settings);

    auto start = std::chrono::steady_clock::now();
    auto m = injector.run(scenario(FaultType::PROCESS_KILL));
    auto took = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);

    EXPECT_EQ(m.outcome, ScenarioOutcome::FATAL);
    EXPECT_EQ(m.health_passed, 0u);
    EXPECT_LT(took.count(), 3000);
}

TEST(FaultTypeTest, NamesRoundTrip) {
    for (FaultType t : all_fault_types()) {
        auto parsed = fault_type_from_string(fault_type_to_string(t));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, t);
    }
    EXPECT_FALSE(fault_type_from_string("meteor_strike").has_value());
    auto driver_type = driver_type_from_string("process_signal");
    ASSERT_TRUE(driver_type.has_value());
    EXPECT_EQ(*driver_type, ChaosDriverType::PROCESS_SIGNAL);
    EXPECT_FALSE(driver_type_from_string("kubernetes").has_value());
}
