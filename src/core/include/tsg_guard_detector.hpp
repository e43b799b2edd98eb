#pragma once

/**
 * @file tsg_guard_detector.hpp
 * @brief Per-identity sliding windows, token-rate and pattern signals, verdicts
 */

#include "tsg_guard_config.hpp"
#include "tsg_pattern_scorer.hpp"
#include "tsg_types.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tsg {

struct WindowEntry {
    std::string record_id;
    Millis timestamp{0};
    uint64_t tokens = 0;
};

/**
 * @brief Sliding token window for one identity
 *
 * Not thread-safe; the detector guards each window with its slot mutex.
 */
class Window {
public:
    explicit Window(size_t max_records) : max_records_(max_records) {}

    /// Drop every entry older than @p window_size relative to @p newest.
    void evict(Millis newest, Millis window_size);

    /// Append; throws WindowStateError on a timestamp that goes backwards
    /// or a token total that would overflow. At max_records the oldest
    /// entry is merged into the next one, so total_tokens() is unchanged.
    void append(const std::string& identity, WindowEntry entry);

    double token_rate(Millis window_size) const noexcept;

    uint64_t total_tokens() const noexcept { return total_tokens_; }
    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    Millis start() const noexcept { return entries_.empty() ? Millis(0) : entries_.front().timestamp; }
    Millis end() const noexcept { return entries_.empty() ? Millis(0) : entries_.back().timestamp; }
    Millis last_timestamp() const noexcept { return last_timestamp_; }
    uint64_t coalesced() const noexcept { return coalesced_; }
    const std::deque<WindowEntry>& entries() const noexcept { return entries_; }

    void clear() noexcept;

private:
    size_t max_records_;
    std::deque<WindowEntry> entries_;
    uint64_t total_tokens_ = 0;
    uint64_t coalesced_ = 0;
    Millis last_timestamp_ = Millis::min();
};

struct WindowSnapshot {
    std::string identity;
    Millis start{0};
    Millis end{0};
    size_t records = 0;
    uint64_t total_tokens = 0;
    double token_rate = 0.0;
};

struct DetectorStats {
    std::atomic<uint64_t> total_records{0};
    std::atomic<uint64_t> benign{0};
    std::atomic<uint64_t> suspected{0};
    std::atomic<uint64_t> token_storms{0};
    std::atomic<uint64_t> degraded{0};
    std::atomic<uint64_t> window_resets{0};
    std::atomic<uint64_t> blocked{0};
    std::atomic<uint64_t> warned{0};

    DetectorStats() = default;
    DetectorStats(const DetectorStats& other)
        : total_records(other.total_records.load())
        , benign(other.benign.load())
        , suspected(other.suspected.load())
        , token_storms(other.token_storms.load())
        , degraded(other.degraded.load())
        , window_resets(other.window_resets.load())
        , blocked(other.blocked.load())
        , warned(other.warned.load()) {}
};

/**
 * @brief Token-storm detector
 *
 * One window per identity in an explicit map; each entry has its own mutex
 * so identities never contend. The GuardConfig is an immutable snapshot
 * read once per record and replaced atomically by reconfigure().
 */
class GuardDetector {
public:
    using AlertSink = std::function<void(const Verdict&)>;

    /// Throws ConfigError if @p config is invalid.
    explicit GuardDetector(GuardConfig config,
                           std::shared_ptr<const IPatternScorer> scorer = nullptr);

    GuardDetector(const GuardDetector&) = delete;
    GuardDetector& operator=(const GuardDetector&) = delete;

    /// Classify one record. Records of an identity must arrive in order.
    Verdict process(const TrafficRecord& record);

    /// Replace the configuration. Throws ConfigError if invalid.
    void reconfigure(GuardConfig config);
    std::shared_ptr<const GuardConfig> config() const;

    /// Verdict feed for alerting, invoked outside every detector lock.
    /// By default only non-benign verdicts are delivered.
    void set_alert_sink(AlertSink sink, bool include_benign = false);

    DetectorStats get_stats() const { return stats_; }
    std::map<std::string, uint64_t> pattern_hits() const;

    std::optional<WindowSnapshot> window_snapshot(const std::string& identity) const;
    size_t identity_count() const;

    /// Drop every identity with no record for longer than @p idle_for of
    /// wall-clock time. Runs on its own every kSweepInterval records with
    /// the configured identity_idle_ttl. Returns the number dropped.
    size_t evict_idle(Millis idle_for);

    void reset_identity(const std::string& identity);
    void clear();

    /// Rough heap footprint of window state, for leak checks.
    size_t memory_estimate() const;

    static Classification classify(bool rate_signal, bool pattern_signal) noexcept;
    static double confidence_for(Classification c, double token_rate, double threshold,
                                 double pattern_score, double sensitivity, bool degraded) noexcept;

    static constexpr uint64_t kSweepInterval = 4096;

private:
    struct IdentitySlot {
        explicit IdentitySlot(size_t max_records)
            : window(max_records), last_seen(std::chrono::steady_clock::now()) {}
        std::mutex mtx;
        Window window;
        std::chrono::steady_clock::time_point last_seen;
        bool retired = false;   // erased from slots_; holders must look the identity up again
    };

    std::shared_ptr<IdentitySlot> slot_for(const std::string& identity, size_t max_records);
    std::string text_for_scoring(const TrafficRecord& record) const;

    std::shared_ptr<const GuardConfig> config_;   // std::atomic_load / std::atomic_store
    std::shared_ptr<const IPatternScorer> scorer_;

    mutable std::shared_mutex slots_mutex_;
    std::unordered_map<std::string, std::shared_ptr<IdentitySlot>> slots_;

    mutable std::mutex sink_mutex_;
    AlertSink sink_;
    bool sink_includes_benign_ = false;

    mutable std::mutex hits_mutex_;
    std::map<std::string, uint64_t> pattern_hits_;

    DetectorStats stats_;
    std::atomic<uint64_t> since_sweep_{0};
};

} // namespace tsg
