#include "tsg_chaos_driver.hpp"
#include "tsg_errors.hpp"
#include "tsg_logger.hpp"

#include <dirent.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

namespace tsg {
namespace Chaos {

namespace {

struct FaultName {
    FaultType type;
    const char* name;
};

const FaultName kFaultNames[] = {
    {FaultType::PROCESS_KILL, "process_kill"},
    {FaultType::PROCESS_PAUSE, "process_pause"},
    {FaultType::NETWORK_PARTITION, "network_partition"},
    {FaultType::NETWORK_DELAY, "network_delay"},
    {FaultType::CPU_PRESSURE, "cpu_pressure"},
    {FaultType::MEMORY_PRESSURE, "memory_pressure"},
    {FaultType::CONNECTION_EXHAUSTION, "connection_exhaustion"},
};

std::string proc_path(pid_t pid, const char* leaf) {
    return "/proc/" + std::to_string(static_cast<long>(pid)) + "/" + leaf;
}

} // anonymous namespace

const char* fault_type_to_string(FaultType t) noexcept {
    for (const auto& fn : kFaultNames) {
        if (fn.type == t) return fn.name;
    }
    return "unknown";
}

std::optional<FaultType> fault_type_from_string(const std::string& s) noexcept {
    for (const auto& fn : kFaultNames) {
        if (s == fn.name) return fn.type;
    }
    return std::nullopt;
}

const std::vector<FaultType>& all_fault_types() {
    static const std::vector<FaultType> types = {
        FaultType::PROCESS_KILL, FaultType::PROCESS_PAUSE, FaultType::NETWORK_PARTITION,
        FaultType::NETWORK_DELAY, FaultType::CPU_PRESSURE, FaultType::MEMORY_PRESSURE,
        FaultType::CONNECTION_EXHAUSTION,
    };
    return types;
}

// ==================== FaultScenario ====================

std::string FaultScenario::validate() const {
    if (name.empty()) return "scenario name is empty";
    if (duration.count() < 0) return "duration must not be negative";
    if (!std::isfinite(intensity) || intensity < 0.0 || intensity > 1.0) {
        return "intensity must be in [0, 1]";
    }
    return {};
}

std::string FaultScenario::describe() const {
    std::ostringstream oss;
    oss << name << " type=" << fault_type_to_string(type)
        << " target=" << (target.empty() ? "*" : target)
        << " duration=" << duration.count() << "ms intensity=" << intensity;
    return oss.str();
}

// ==================== InProcessChaosDriver ====================

InProcessChaosDriver::InProcessChaosDriver(std::shared_ptr<GuardService> service,
                                           size_t memory_pressure_bytes)
    : service_(std::move(service))
    , memory_pressure_bytes_(memory_pressure_bytes) {}

bool InProcessChaosDriver::supports(FaultType) const {
    return true;
}

void InProcessChaosDriver::apply(const FaultScenario& scenario) {
    if (!service_) throw FaultApplicationError("no in-process service attached");
    if (!scenario.target.empty() && scenario.target != service_->name()) {
        throw FaultApplicationError("unknown target '" + scenario.target + "'");
    }

    const ServiceSettings& s = service_->settings();
    switch (scenario.type) {
        case FaultType::PROCESS_KILL:
            if (!service_->is_running()) {
                throw FaultApplicationError("target '" + service_->name() + "' is not running");
            }
            service_->kill();
            break;
        case FaultType::PROCESS_PAUSE:
            service_->set_paused(true);
            break;
        case FaultType::NETWORK_PARTITION:
            service_->set_partitioned(true);
            break;
        case FaultType::NETWORK_DELAY: {
            const auto ms = static_cast<int64_t>(
                std::llround(scenario.intensity * 2.0 * static_cast<double>(s.request_timeout.count())));
            service_->set_injected_delay(Millis(std::max<int64_t>(1, ms)));
            break;
        }
        case FaultType::CPU_PRESSURE: {
            const unsigned hw = std::max(1u, std::thread::hardware_concurrency());
            const auto threads = static_cast<size_t>(std::llround(scenario.intensity * hw));
            service_->set_cpu_pressure(std::max<size_t>(1, threads));
            break;
        }
        case FaultType::MEMORY_PRESSURE:
            service_->set_memory_ballast(static_cast<size_t>(
                scenario.intensity * static_cast<double>(memory_pressure_bytes_)));
            break;
        case FaultType::CONNECTION_EXHAUSTION: {
            const auto want = static_cast<size_t>(
                std::ceil(scenario.intensity * static_cast<double>(s.connection_limit)));
            held_connections_ += service_->acquire_connections(want);
            break;
        }
    }
    TSG_LOG_DEBUG("in-process fault applied: " + scenario.describe());
}

void InProcessChaosDriver::remove(const FaultScenario& scenario) {
    if (!service_) return;
    switch (scenario.type) {
        case FaultType::PROCESS_KILL:
            break;      // recovery is the supervisor's job
        case FaultType::PROCESS_PAUSE:
            service_->set_paused(false);
            break;
        case FaultType::NETWORK_PARTITION:
            service_->set_partitioned(false);
            break;
        case FaultType::NETWORK_DELAY:
            service_->set_injected_delay(Millis(0));
            break;
        case FaultType::CPU_PRESSURE:
            service_->set_cpu_pressure(0);
            break;
        case FaultType::MEMORY_PRESSURE:
            service_->set_memory_ballast(0);
            break;
        case FaultType::CONNECTION_EXHAUSTION:
            service_->release_connections(held_connections_);
            held_connections_ = 0;
            break;
    }
}

// ==================== GuardServiceProbe ====================

GuardServiceProbe::GuardServiceProbe(std::shared_ptr<GuardService> service)
    : service_(std::move(service)) {}

std::string GuardServiceProbe::target() const {
    return service_ ? service_->name() : std::string();
}

// The service bounds both calls by its own request timeout.
bool GuardServiceProbe::health_check(Millis) {
    return service_ && service_->health().healthy;
}

bool GuardServiceProbe::synthetic_request(Millis) {
    return service_ && service_->synthetic_request();
}

ResourceSnapshot GuardServiceProbe::snapshot() {
    return service_ ? service_->resources() : ResourceSnapshot{};
}

bool GuardServiceProbe::drain(Millis timeout) {
    return service_ && service_->drain(timeout);
}

uint32_t GuardServiceProbe::restart_count() const {
    return service_ ? service_->restart_count() : 0;
}

// ==================== /proc helpers ====================

bool process_alive(pid_t pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

bool process_stopped(pid_t pid) {
    std::ifstream stat(proc_path(pid, "stat"));
    if (!stat) return false;
    std::string line;
    std::getline(stat, line);
    // Field 3, after the parenthesised command name.
    const auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size()) return false;
    const char state = line[close + 2];
    return state == 'T' || state == 't';
}

size_t process_resident_bytes(pid_t pid) {
    std::ifstream statm(proc_path(pid, "statm"));
    size_t total_pages = 0;
    size_t resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) return 0;
    const long page = ::sysconf(_SC_PAGESIZE);
    return resident_pages * static_cast<size_t>(page > 0 ? page : 4096);
}

size_t process_open_fds(pid_t pid) {
    DIR* dir = ::opendir(proc_path(pid, "fd").c_str());
    if (!dir) return 0;
    size_t count = 0;
    while (struct dirent* ent = ::readdir(dir)) {
        if (ent->d_name[0] != '.') ++count;
    }
    ::closedir(dir);
    return count;
}

bool run_command(const std::string& command, Millis timeout) {
    const char* cmd = command.c_str();
    const pid_t child = ::fork();
    if (child < 0) {
        TSG_LOG_ERROR(std::string("fork for health command failed: ") + std::strerror(errno));
        return false;
    }
    if (child == 0) {
        ::setpgid(0, 0);
        ::execl("/bin/sh", "sh", "-c", cmd, static_cast<char*>(nullptr));
        ::_exit(127);
    }
    ::setpgid(child, child);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    while (true) {
        const pid_t done = ::waitpid(child, &status, WNOHANG);
        if (done == child) return WIFEXITED(status) && WEXITSTATUS(status) == 0;
        if (done < 0 && errno != EINTR) {
            TSG_LOG_ERROR(std::string("waiting for health command failed: ") + std::strerror(errno));
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(Millis(5));
    }

    ::kill(-child, SIGKILL);
    while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {}
    TSG_LOG_WARN("health command killed after " + std::to_string(timeout.count()) + "ms: " + command);
    return false;
}

// ==================== ProcessTarget ====================

pid_t ProcessTarget::resolve() const {
    if (!pid_file.empty()) {
        std::ifstream in(pid_file);
        long value = 0;
        if (in >> value && value > 0) return static_cast<pid_t>(value);
        return 0;
    }
    return pid;
}

// ==================== ProcessSignalChaosDriver ====================

ProcessSignalChaosDriver::ProcessSignalChaosDriver(ProcessTarget target)
    : target_(std::move(target)) {}

bool ProcessSignalChaosDriver::supports(FaultType type) const {
    return type == FaultType::PROCESS_KILL || type == FaultType::PROCESS_PAUSE;
}

void ProcessSignalChaosDriver::signal(int signo, const char* what) const {
    const pid_t pid = target_.resolve();
    if (pid <= 0) {
        throw FaultApplicationError("cannot resolve pid for '" + target_.name + "'");
    }
    if (::kill(pid, signo) != 0) {
        throw FaultApplicationError(std::string(what) + " pid " + std::to_string(pid) +
                                    " failed: " + std::strerror(errno));
    }
}

void ProcessSignalChaosDriver::apply(const FaultScenario& scenario) {
    if (!supports(scenario.type)) {
        throw FaultApplicationError(std::string("process_signal driver cannot apply ") +
                                    fault_type_to_string(scenario.type));
    }
    if (!scenario.target.empty() && scenario.target != target_.name) {
        throw FaultApplicationError("unknown target '" + scenario.target + "'");
    }
    if (scenario.type == FaultType::PROCESS_KILL) {
        signal(SIGKILL, "SIGKILL");
    } else {
        signal(SIGSTOP, "SIGSTOP");
        paused_pid_ = target_.resolve();
    }
    TSG_LOG_DEBUG("signal fault applied: " + scenario.describe());
}

void ProcessSignalChaosDriver::remove(const FaultScenario& scenario) {
    if (scenario.type != FaultType::PROCESS_PAUSE || paused_pid_ <= 0) return;
    if (::kill(paused_pid_, SIGCONT) != 0 && errno != ESRCH) {
        TSG_LOG_ERROR("SIGCONT to pid " + std::to_string(paused_pid_) +
                      " failed: " + std::strerror(errno));
    }
    paused_pid_ = 0;
}

// ==================== ProcessProbe ====================

ProcessProbe::ProcessProbe(ProcessTarget target)
    : target_(std::move(target)) {
    last_pid_ = target_.resolve();
}

pid_t ProcessProbe::observe() {
    const pid_t pid = target_.resolve();
    if (pid > 0 && process_alive(pid)) {
        if (last_pid_ > 0 && pid != last_pid_) ++restarts_;
        last_pid_ = pid;
        return pid;
    }
    return 0;
}

bool ProcessProbe::reachable() const {
    return target_.resolve() > 0;
}

bool ProcessProbe::health_check(Millis budget) {
    const pid_t pid = observe();
    if (pid <= 0 || process_stopped(pid)) return false;
    if (target_.health_command.empty()) return true;
    const Millis timeout = std::max(Millis(1), std::min(budget, target_.health_timeout));
    return run_command(target_.health_command, timeout);
}

bool ProcessProbe::synthetic_request(Millis budget) {
    return health_check(budget);
}

ResourceSnapshot ProcessProbe::snapshot() {
    ResourceSnapshot snap;
    const pid_t pid = observe();
    if (pid <= 0) return snap;
    snap.memory_bytes = process_resident_bytes(pid);
    snap.open_connections = process_open_fds(pid);
    return snap;
}

bool ProcessProbe::drain(Millis timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        const pid_t pid = observe();
        if (pid > 0 && !process_stopped(pid)) return true;
        std::this_thread::sleep_for(Millis(10));
    }
    return false;
}

// ==================== ChaosDriverFactory ====================

std::optional<ChaosDriverType> driver_type_from_string(const std::string& s) noexcept {
    if (s == "in_process") return ChaosDriverType::IN_PROCESS;
    if (s == "process_signal") return ChaosDriverType::PROCESS_SIGNAL;
    return std::nullopt;
}

const char* driver_type_to_string(ChaosDriverType t) noexcept {
    switch (t) {
        case ChaosDriverType::IN_PROCESS:     return "in_process";
        case ChaosDriverType::PROCESS_SIGNAL: return "process_signal";
    }
    return "unknown";
}

DriverBundle ChaosDriverFactory::create(ChaosDriverType type,
                                        std::shared_ptr<GuardService> service,
                                        const ProcessTarget& process) {
    DriverBundle bundle;
    switch (type) {
        case ChaosDriverType::IN_PROCESS:
            if (!service) throw FaultApplicationError("in_process driver needs a service");
            bundle.driver = std::make_unique<InProcessChaosDriver>(service);
            bundle.probe = std::make_unique<GuardServiceProbe>(service);
            break;
        case ChaosDriverType::PROCESS_SIGNAL:
            if (process.pid <= 0 && process.pid_file.empty()) {
                throw FaultApplicationError("process_signal driver needs chaos.pid or a pid file");
            }
            bundle.driver = std::make_unique<ProcessSignalChaosDriver>(process);
            bundle.probe = std::make_unique<ProcessProbe>(process);
            break;
    }
    TSG_LOG_INFO(std::string("chaos driver: ") + driver_type_to_string(type));
    return bundle;
}

std::vector<ChaosDriverType> ChaosDriverFactory::available_drivers() {
    return {ChaosDriverType::IN_PROCESS, ChaosDriverType::PROCESS_SIGNAL};
}

} // namespace Chaos
} // namespace tsg
