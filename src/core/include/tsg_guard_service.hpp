#pragma once

/**
 * @file tsg_guard_service.hpp
 * @brief Long-lived Capture + Detector service with supervision and fault hooks
 *
 * Detection for one identity always runs on the same executor lane, so each
 * identity's window has a single writer and sees records in arrival order.
 * A supervisor thread restarts the instance after kill(), up to a restart
 * budget. The set_* hooks are what the in-process chaos driver pulls on.
 */

#include "tsg_capture.hpp"
#include "tsg_guard_config.hpp"
#include "tsg_guard_detector.hpp"
#include "tsg_lane_executor.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tsg {

class Config;

struct ServiceSettings {
    std::string name = "tsguard";
    size_t lanes = 4;
    Millis request_timeout{500};
    Millis restart_delay{100};
    uint32_t max_restarts = 5;
    size_t connection_limit = 256;

    static ServiceSettings from_config(const Config& cfg);
};

struct SubmitResult {
    CaptureResult capture;
    std::optional<Verdict> verdict;
    std::string error;           // service-side failure (down, timeout, ...)

    bool ok() const noexcept { return error.empty(); }
};

struct ServiceHealth {
    bool healthy = false;
    bool running = false;
    bool partitioned = false;
    bool paused = false;
    size_t open_connections = 0;
    std::string detail;
};

struct ResourceSnapshot {
    size_t memory_bytes = 0;
    size_t open_connections = 0;
};

class GuardService {
public:
    /// Throws ConfigError if @p config is invalid.
    GuardService(GuardConfig config, CaptureLimits limits = {}, ServiceSettings settings = {},
                 std::shared_ptr<ISpanExporter> exporter = nullptr);
    ~GuardService();

    GuardService(const GuardService&) = delete;
    GuardService& operator=(const GuardService&) = delete;

    const std::string& name() const noexcept { return settings_.name; }
    const ServiceSettings& settings() const noexcept { return settings_; }
    const CaptureLimits& capture_limits() const noexcept { return limits_; }

    /// Production path: capture then detect. Waits at most request_timeout for the verdict.
    SubmitResult handle(std::string_view raw);

    ServiceHealth health() const;
    bool synthetic_request();
    ResourceSnapshot resources() const;

    /// True if queued detection work finishes within @p timeout.
    bool drain(Millis timeout);

    void reconfigure(GuardConfig config);
    std::shared_ptr<const GuardConfig> config() const;

    void set_alert_sink(GuardDetector::AlertSink sink);

    std::optional<DetectorStats> detector_stats() const;
    std::optional<CaptureStats> capture_stats() const;

    // ---- lifecycle ----
    bool is_running() const;
    uint32_t restart_count() const noexcept { return restart_count_.load(); }

    /// Crash: drop queued work and all in-memory state; the supervisor restarts.
    void kill();

    /// Start a stopped instance now. Returns false if already running.
    bool restart();

    /// Graceful stop: finish queued work, then stop the supervisor.
    void shutdown();

    // ---- fault hooks ----
    void set_partitioned(bool partitioned);
    void set_paused(bool paused);
    void set_injected_delay(Millis delay);
    void set_memory_ballast(size_t bytes);
    void set_cpu_pressure(size_t threads);
    size_t acquire_connections(size_t n);
    void release_connections(size_t n);

private:
    struct Instance {
        std::unique_ptr<TelemetryCapture> capture;
        std::unique_ptr<GuardDetector> detector;
        std::unique_ptr<LaneExecutor> lanes;
    };

    std::shared_ptr<Instance> make_instance(const GuardConfig& cfg,
                                            const GuardDetector::AlertSink& sink) const;
    std::shared_ptr<Instance> current() const;
    void supervise();
    void apply_lane_faults() const;
    bool wait_if_paused(Millis timeout) const;
    bool lane_ping(const std::shared_ptr<Instance>& inst) const;
    void stop_burners();
    std::string synthetic_envelope();

    CaptureLimits limits_;
    ServiceSettings settings_;
    std::shared_ptr<ISpanExporter> exporter_;

    mutable std::mutex mtx_;
    std::condition_variable supervisor_cv_;
    std::shared_ptr<Instance> instance_;
    std::shared_ptr<const GuardConfig> active_config_;
    GuardDetector::AlertSink alert_sink_;
    bool crashed_ = false;
    bool stopping_ = false;
    std::thread supervisor_;
    std::atomic<uint32_t> restart_count_{0};

    std::atomic<bool> partitioned_{false};
    std::atomic<int64_t> injected_delay_ms_{0};
    std::atomic<size_t> open_connections_{0};

    mutable std::mutex pause_mtx_;
    mutable std::condition_variable pause_cv_;
    bool paused_ = false;

    mutable std::mutex pressure_mtx_;
    std::vector<char> ballast_;
    std::vector<std::thread> burners_;
    std::atomic<bool> burn_{false};

    std::atomic<int64_t> synthetic_clock_{0};
    std::atomic<uint64_t> synthetic_counter_{0};
};

} // namespace tsg
