#include "tsg_guard_service.hpp"
#include "tsg_config.hpp"
#include "tsg_envelope.hpp"
#include "tsg_errors.hpp"
#include "tsg_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace tsg {

namespace {

const char* const kSyntheticIdentity = "synthetic-probe";
const char* const kSyntheticConnection = "synthetic-probe-conn";
const char* const kPingKey = "__health__";

int64_t wall_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

ServiceSettings ServiceSettings::from_config(const Config& cfg) {
    ServiceSettings s;
    s.lanes = static_cast<size_t>(cfg.getUInt("service.lanes", s.lanes));
    s.request_timeout = Millis(cfg.getInt("service.request_timeout_ms", s.request_timeout.count()));
    s.restart_delay = Millis(cfg.getInt("service.restart_delay_ms", s.restart_delay.count()));
    s.max_restarts = static_cast<uint32_t>(cfg.getUInt("service.max_restarts", s.max_restarts));
    s.connection_limit = static_cast<size_t>(cfg.getUInt("service.connection_limit", s.connection_limit));

    if (s.lanes == 0) throw ConfigError("service.lanes must be at least 1");
    if (s.request_timeout.count() <= 0) throw ConfigError("service.request_timeout_ms must be positive");
    if (s.restart_delay.count() < 0) throw ConfigError("service.restart_delay_ms must not be negative");
    if (s.connection_limit == 0) throw ConfigError("service.connection_limit must be at least 1");
    return s;
}

// ==================== GuardService ====================

GuardService::GuardService(GuardConfig config, CaptureLimits limits, ServiceSettings settings,
                           std::shared_ptr<ISpanExporter> exporter)
    : limits_(limits)
    , settings_(std::move(settings))
    , exporter_(std::move(exporter)) {
    GuardConfigError err = config.validate();
    if (err != GuardConfigError::NONE) {
        throw ConfigError(std::string("invalid guard configuration: ") +
                          guard_config_error_to_string(err));
    }
    if (settings_.lanes == 0) settings_.lanes = 1;

    active_config_ = std::make_shared<const GuardConfig>(config);
    instance_ = make_instance(config, alert_sink_);
    supervisor_ = std::thread(&GuardService::supervise, this);
    TSG_LOG_INFO("service '" + settings_.name + "' started (" + config.to_string() + ")");
}

GuardService::~GuardService() {
    set_paused(false);
    stop_burners();
    shutdown();
}

std::shared_ptr<GuardService::Instance> GuardService::make_instance(
        const GuardConfig& cfg, const GuardDetector::AlertSink& sink) const {
    auto inst = std::make_shared<Instance>();
    inst->capture = std::make_unique<TelemetryCapture>(limits_, exporter_);
    inst->detector = std::make_unique<GuardDetector>(cfg);
    if (sink) inst->detector->set_alert_sink(sink);
    inst->lanes = std::make_unique<LaneExecutor>(settings_.lanes);
    return inst;
}

std::shared_ptr<GuardService::Instance> GuardService::current() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return instance_;
}

void GuardService::supervise() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (true) {
        supervisor_cv_.wait(lock, [this] { return stopping_ || crashed_; });
        if (stopping_) return;

        if (supervisor_cv_.wait_for(lock, settings_.restart_delay, [this] { return stopping_; })) {
            return;
        }
        if (!crashed_ || instance_) {
            crashed_ = false;
            continue;
        }
        if (restart_count_.load() >= settings_.max_restarts) {
            crashed_ = false;
            TSG_LOG_ERROR("service '" + settings_.name + "' exhausted its restart budget (" +
                          std::to_string(settings_.max_restarts) + "), staying down");
            continue;
        }

        GuardConfig cfg = *active_config_;
        GuardDetector::AlertSink sink = alert_sink_;
        lock.unlock();
        auto fresh = make_instance(cfg, sink);
        lock.lock();

        if (stopping_) {
            lock.unlock();
            fresh->lanes->shutdown();
            return;
        }
        crashed_ = false;
        if (!instance_) {
            instance_ = std::move(fresh);
            const uint32_t n = ++restart_count_;
            TSG_LOG_WARN("service '" + settings_.name + "' restarted (restart #" +
                         std::to_string(n) + ")");
        }
    }
}

// ---- fault plumbing on the lane side ----

bool GuardService::wait_if_paused(Millis timeout) const {
    std::unique_lock<std::mutex> lock(pause_mtx_);
    return pause_cv_.wait_for(lock, timeout, [this] { return !paused_; });
}

void GuardService::apply_lane_faults() const {
    // A paused process makes no progress; bounded so kill() can still join lanes.
    wait_if_paused(settings_.request_timeout * 4);
    const int64_t delay = injected_delay_ms_.load();
    if (delay > 0) std::this_thread::sleep_for(Millis(delay));
}

bool GuardService::lane_ping(const std::shared_ptr<Instance>& inst) const {
    try {
        auto fut = inst->lanes->submit(kPingKey, [this] {
            apply_lane_faults();
            return true;
        });
        if (fut.wait_for(settings_.request_timeout) != std::future_status::ready) return false;
        return fut.get();
    } catch (const std::exception& e) {
        TSG_LOG_DEBUG(std::string("health ping failed: ") + e.what());
        return false;
    }
}

// ---- production path ----

SubmitResult GuardService::handle(std::string_view raw) {
    SubmitResult out;
    auto inst = current();
    if (!inst) {
        out.error = "service down";
        return out;
    }
    if (partitioned_.load()) {
        out.error = "service unreachable";
        return out;
    }
    if (open_connections_.load() >= settings_.connection_limit) {
        out.error = "connection limit reached";
        return out;
    }
    if (!wait_if_paused(settings_.request_timeout)) {
        out.error = "service not responding";
        return out;
    }

    // Enqueue while the capture still holds the connection lock, so records
    // of one connection reach the identity's lane in sequence order.
    GuardDetector* detector = inst->detector.get();
    std::future<Verdict> fut;
    std::string submit_error;
    out.capture = inst->capture->ingest(raw, [&](const TrafficRecord& record) {
        try {
            fut = inst->lanes->submit(record.identity, [this, detector, record] {
                apply_lane_faults();
                return detector->process(record);
            });
        } catch (const std::exception& e) {
            submit_error = e.what();
        }
    });
    if (!out.capture.accepted()) return out;
    if (!submit_error.empty() || !fut.valid()) {
        out.error = "detection failed: " + (submit_error.empty() ? std::string("not scheduled") : submit_error);
        return out;
    }

    try {
        if (fut.wait_for(settings_.request_timeout) != std::future_status::ready) {
            out.error = "detection timed out";
            return out;
        }
        out.verdict = fut.get();
    } catch (const std::exception& e) {
        out.error = std::string("detection failed: ") + e.what();
    }
    return out;
}

std::string GuardService::synthetic_envelope() {
    int64_t now = wall_clock_ms();
    int64_t prev = synthetic_clock_.load();
    int64_t next = std::max(now, prev + 1);
    while (!synthetic_clock_.compare_exchange_weak(prev, next)) {
        next = std::max(now, prev + 1);
    }

    TrafficRecord rec;
    rec.id = "synthetic-" + std::to_string(++synthetic_counter_);
    rec.identity = kSyntheticIdentity;
    rec.connection_id = kSyntheticConnection;
    rec.timestamp = Millis(next);
    rec.prompt = "ping";
    rec.response = "pong";
    rec.input_tokens = 1;
    rec.output_tokens = 1;
    rec.latency = Millis(1);
    return serialize_envelope(rec);
}

bool GuardService::synthetic_request() {
    SubmitResult r = handle(synthetic_envelope());
    return r.ok() && r.capture.accepted() && r.verdict.has_value();
}

ServiceHealth GuardService::health() const {
    ServiceHealth h;
    auto inst = current();
    h.running = inst != nullptr;
    h.partitioned = partitioned_.load();
    {
        std::lock_guard<std::mutex> lock(pause_mtx_);
        h.paused = paused_;
    }
    h.open_connections = open_connections_.load();

    if (!h.running) {
        h.detail = "down";
    } else if (h.partitioned) {
        h.detail = "unreachable";
    } else if (h.paused) {
        h.detail = "paused";
    } else if (h.open_connections >= settings_.connection_limit) {
        h.detail = "connection limit reached";
    } else if (!lane_ping(inst)) {
        h.detail = "lanes unresponsive";
    } else {
        h.healthy = true;
        h.detail = "ok";
    }
    return h;
}

ResourceSnapshot GuardService::resources() const {
    ResourceSnapshot snap;
    auto inst = current();
    if (inst) {
        snap.memory_bytes += inst->detector->memory_estimate();
        snap.open_connections += inst->capture->connection_count();
    }
    {
        std::lock_guard<std::mutex> lock(pressure_mtx_);
        snap.memory_bytes += ballast_.size();
    }
    snap.open_connections += open_connections_.load();
    return snap;
}

bool GuardService::drain(Millis timeout) {
    auto inst = current();
    if (!inst) return false;
    return inst->lanes->drain(timeout);
}

void GuardService::reconfigure(GuardConfig config) {
    GuardConfigError err = config.validate();
    if (err != GuardConfigError::NONE) {
        throw ConfigError(std::string("invalid guard configuration: ") +
                          guard_config_error_to_string(err));
    }
    std::shared_ptr<Instance> inst;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        active_config_ = std::make_shared<const GuardConfig>(config);
        inst = instance_;
    }
    if (inst) inst->detector->reconfigure(config);
    TSG_LOG_INFO("service '" + settings_.name + "' reconfigured: " + config.to_string());
}

std::shared_ptr<const GuardConfig> GuardService::config() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return active_config_;
}

void GuardService::set_alert_sink(GuardDetector::AlertSink sink) {
    std::shared_ptr<Instance> inst;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        alert_sink_ = sink;
        inst = instance_;
    }
    if (inst) inst->detector->set_alert_sink(std::move(sink));
}

std::optional<DetectorStats> GuardService::detector_stats() const {
    auto inst = current();
    if (!inst) return std::nullopt;
    return inst->detector->get_stats();
}

std::optional<CaptureStats> GuardService::capture_stats() const {
    auto inst = current();
    if (!inst) return std::nullopt;
    return inst->capture->get_stats();
}

// ---- lifecycle ----

bool GuardService::is_running() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return instance_ != nullptr && !stopping_;
}

void GuardService::kill() {
    std::shared_ptr<Instance> victim;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!instance_ || stopping_) return;
        victim = std::move(instance_);
        instance_.reset();
        crashed_ = true;
    }
    TSG_LOG_WARN("service '" + settings_.name + "' killed");
    supervisor_cv_.notify_all();
    victim->lanes->abort();
}

bool GuardService::restart() {
    GuardConfig cfg;
    GuardDetector::AlertSink sink;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (instance_ || stopping_) return false;
        cfg = *active_config_;
        sink = alert_sink_;
    }
    auto fresh = make_instance(cfg, sink);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (instance_ || stopping_) {
            fresh->lanes->shutdown();
            return false;
        }
        instance_ = std::move(fresh);
        crashed_ = false;
    }
    ++restart_count_;
    TSG_LOG_INFO("service '" + settings_.name + "' restarted manually");
    return true;
}

void GuardService::shutdown() {
    std::shared_ptr<Instance> inst;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_ && !supervisor_.joinable()) return;
        stopping_ = true;
        inst = std::move(instance_);
        instance_.reset();
    }
    supervisor_cv_.notify_all();
    if (supervisor_.joinable()) supervisor_.join();
    if (inst) {
        inst->lanes->shutdown();
        TSG_LOG_INFO("service '" + settings_.name + "' shut down");
    }
}

// ---- fault hooks ----

void GuardService::set_partitioned(bool partitioned) {
    partitioned_.store(partitioned);
}

void GuardService::set_paused(bool paused) {
    {
        std::lock_guard<std::mutex> lock(pause_mtx_);
        paused_ = paused;
    }
    pause_cv_.notify_all();
}

void GuardService::set_injected_delay(Millis delay) {
    injected_delay_ms_.store(std::max<int64_t>(0, delay.count()));
}

void GuardService::set_memory_ballast(size_t bytes) {
    std::lock_guard<std::mutex> lock(pressure_mtx_);
    if (bytes == 0) {
        std::vector<char>().swap(ballast_);
        return;
    }
    ballast_.assign(bytes, '\x5a');
}

void GuardService::stop_burners() {
    burn_.store(false);
    std::vector<std::thread> burners;
    {
        std::lock_guard<std::mutex> lock(pressure_mtx_);
        burners.swap(burners_);
    }
    for (auto& t : burners) {
        if (t.joinable()) t.join();
    }
}

void GuardService::set_cpu_pressure(size_t threads) {
    stop_burners();
    if (threads == 0) return;

    std::lock_guard<std::mutex> lock(pressure_mtx_);
    burn_.store(true);
    for (size_t i = 0; i < threads; ++i) {
        burners_.emplace_back([this, i] {
            volatile double sink = static_cast<double>(i) + 1.0;
            while (burn_.load(std::memory_order_relaxed)) {
                for (int k = 0; k < 4096; ++k) sink = std::sqrt(sink * 1.0000001 + 1.0);
            }
        });
    }
}

size_t GuardService::acquire_connections(size_t n) {
    size_t cur = open_connections_.load();
    size_t granted = 0;
    do {
        const size_t room = cur >= settings_.connection_limit ? 0 : settings_.connection_limit - cur;
        granted = std::min(n, room);
    } while (!open_connections_.compare_exchange_weak(cur, cur + granted));
    return granted;
}

void GuardService::release_connections(size_t n) {
    size_t cur = open_connections_.load();
    while (!open_connections_.compare_exchange_weak(cur, cur - std::min(n, cur))) {
    }
}

} // namespace tsg
