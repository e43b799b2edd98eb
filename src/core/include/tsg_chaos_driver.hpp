#pragma once

/**
 * @file tsg_chaos_driver.hpp
 * @brief Environment-specific chaos mechanics behind one interface
 *
 * The Fault Injector only talks to IChaosDriver (apply/remove a fault) and
 * IServiceProbe (observe the target). Two environments are provided: an
 * in-process GuardService and an external process addressed by PID.
 */

#include "tsg_guard_service.hpp"
#include "tsg_types.hpp"

#include <sys/types.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tsg {
namespace Chaos {

enum class FaultType {
    PROCESS_KILL,
    PROCESS_PAUSE,
    NETWORK_PARTITION,
    NETWORK_DELAY,
    CPU_PRESSURE,
    MEMORY_PRESSURE,
    CONNECTION_EXHAUSTION
};

const char* fault_type_to_string(FaultType t) noexcept;
std::optional<FaultType> fault_type_from_string(const std::string& s) noexcept;
const std::vector<FaultType>& all_fault_types();

/// Scenario descriptor {type, target, duration, intensity}.
struct FaultScenario {
    std::string name;
    FaultType type = FaultType::PROCESS_KILL;
    std::string target;
    Millis duration{300};
    double intensity = 1.0;     // [0, 1]; meaning depends on the fault type

    /// Empty string if the scenario is well formed, otherwise the reason.
    std::string validate() const;

    std::string describe() const;
};

class IChaosDriver {
public:
    virtual ~IChaosDriver() = default;

    virtual std::string name() const = 0;
    virtual bool supports(FaultType type) const = 0;

    /// Start the fault. Throws FaultApplicationError if it cannot be applied.
    virtual void apply(const FaultScenario& scenario) = 0;

    /// Undo whatever apply() started. Must be safe to call after a failed apply.
    virtual void remove(const FaultScenario& scenario) = 0;
};

class IServiceProbe {
public:
    virtual ~IServiceProbe() = default;

    virtual std::string target() const = 0;

    /// False when the target cannot be addressed at all.
    virtual bool reachable() const = 0;

    /// Both checks return within roughly @p budget; a check that cannot
    /// finish in time counts as failed.
    virtual bool health_check(Millis budget) = 0;
    virtual bool synthetic_request(Millis budget) = 0;
    virtual ResourceSnapshot snapshot() = 0;

    /// Graceful drain of in-flight work within @p timeout.
    virtual bool drain(Millis timeout) = 0;

    virtual uint32_t restart_count() const = 0;
};

// ==================== in-process ====================

class InProcessChaosDriver : public IChaosDriver {
public:
    explicit InProcessChaosDriver(std::shared_ptr<GuardService> service,
                                  size_t memory_pressure_bytes = 64u * 1024u * 1024u);

    std::string name() const override { return "in_process"; }
    bool supports(FaultType type) const override;
    void apply(const FaultScenario& scenario) override;
    void remove(const FaultScenario& scenario) override;

private:
    std::shared_ptr<GuardService> service_;
    size_t memory_pressure_bytes_;
    size_t held_connections_ = 0;
};

class GuardServiceProbe : public IServiceProbe {
public:
    explicit GuardServiceProbe(std::shared_ptr<GuardService> service);

    std::string target() const override;
    bool reachable() const override { return service_ != nullptr; }
    bool health_check(Millis budget) override;
    bool synthetic_request(Millis budget) override;
    ResourceSnapshot snapshot() override;
    bool drain(Millis timeout) override;
    uint32_t restart_count() const override;

private:
    std::shared_ptr<GuardService> service_;
};

// ==================== external process ====================

/// How to find an external process: a fixed PID or a PID file rewritten on restart.
struct ProcessTarget {
    std::string name;
    pid_t pid = 0;
    std::string pid_file;
    std::string health_command;     // optional; exit status 0 means healthy
    Millis health_timeout{1000};    // a health command running longer is killed and counts as unhealthy

    /// Current PID, or 0 if it cannot be resolved.
    pid_t resolve() const;
};

class ProcessSignalChaosDriver : public IChaosDriver {
public:
    explicit ProcessSignalChaosDriver(ProcessTarget target);

    std::string name() const override { return "process_signal"; }
    bool supports(FaultType type) const override;
    void apply(const FaultScenario& scenario) override;
    void remove(const FaultScenario& scenario) override;

private:
    void signal(int signo, const char* what) const;

    ProcessTarget target_;
    pid_t paused_pid_ = 0;
};

class ProcessProbe : public IServiceProbe {
public:
    explicit ProcessProbe(ProcessTarget target);

    std::string target() const override { return target_.name; }
    bool reachable() const override;
    bool health_check(Millis budget) override;
    bool synthetic_request(Millis budget) override;
    ResourceSnapshot snapshot() override;
    bool drain(Millis timeout) override;
    uint32_t restart_count() const override { return restarts_; }

private:
    pid_t observe();

    ProcessTarget target_;
    pid_t last_pid_ = 0;
    uint32_t restarts_ = 0;
};

/// Linux /proc helpers; all return 0/false when the process is gone.
bool process_alive(pid_t pid);

/// Run @p command through /bin/sh. True on exit status 0; a command still
/// running after @p timeout is killed with its process group and fails.
bool run_command(const std::string& command, Millis timeout);
bool process_stopped(pid_t pid);
size_t process_resident_bytes(pid_t pid);
size_t process_open_fds(pid_t pid);

// ==================== factory ====================

enum class ChaosDriverType {
    IN_PROCESS,
    PROCESS_SIGNAL
};

std::optional<ChaosDriverType> driver_type_from_string(const std::string& s) noexcept;
const char* driver_type_to_string(ChaosDriverType t) noexcept;

struct DriverBundle {
    std::unique_ptr<IChaosDriver> driver;
    std::unique_ptr<IServiceProbe> probe;
};

class ChaosDriverFactory {
public:
    /// IN_PROCESS needs @p service; PROCESS_SIGNAL needs @p process.
    /// Throws FaultApplicationError if the needed target is missing.
    static DriverBundle create(ChaosDriverType type,
                               std::shared_ptr<GuardService> service,
                               const ProcessTarget& process = {});

    static std::vector<ChaosDriverType> available_drivers();
};

} // namespace Chaos
} // namespace tsg
