#pragma once

/**
 * @file tsg_replay.hpp
 * @brief Replay base traffic through the live service under timing chaos
 *
 * Every mode replays a prepared stream built from the base records and
 * compares each verdict with a fresh detector fed the same stream one
 * record at a time. A clean run agrees on every verdict, resets no window
 * and leaves the service able to drain and serve.
 *
 *   CONCURRENT  identities spread over several sender threads
 *   CLOCK_SKEW  each identity's clock shifted by a fixed offset, several
 *               identities multiplexed on one connection
 *   TIMEOUT     the first records sent while detection is slower than the
 *               request timeout, the rest concurrently once it recovers
 */

#include "tsg_guard_service.hpp"
#include "tsg_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tsg {

class Config;

namespace Chaos {

enum class ReplayMode {
    CONCURRENT,
    CLOCK_SKEW,
    TIMEOUT
};

const char* replay_mode_to_string(ReplayMode m) noexcept;
std::optional<ReplayMode> replay_mode_from_string(const std::string& s) noexcept;
const std::vector<ReplayMode>& all_replay_modes();

struct ReplaySettings {
    bool enabled = true;
    size_t threads = 4;
    size_t identities = 8;
    size_t records_per_mode = 64;
    Millis step{50};                 // record-time spacing within one identity
    Millis max_skew{3600000};        // CLOCK_SKEW offsets fall in [-max_skew, +max_skew]
    size_t timeout_records = 2;      // TIMEOUT: records sent while detection is too slow
    Millis settle_timeout{2000};
    uint64_t seed = 1;

    /// Empty string if usable, otherwise the reason.
    std::string validate() const;

    /// "replay.*" keys. Throws ConfigError on invalid values.
    static ReplaySettings from_config(const Config& cfg);
};

struct ReplayOutcome {
    ReplayMode mode = ReplayMode::CONCURRENT;
    size_t records = 0;
    size_t expected_unserved = 0;    // sent while detection was deliberately too slow
    size_t served = 0;
    size_t agreed = 0;
    uint64_t window_resets = 0;
    bool settled = false;
    Millis elapsed{0};
    std::vector<std::string> disagreements;   // first few, for the report
    std::string note;

    /// Records whose verdict is compared with the sequential run.
    size_t compared() const noexcept { return records - expected_unserved; }
    double agreement() const noexcept;
    bool clean() const noexcept;
};

class TrafficReplayer {
public:
    /// Throws ConfigError if @p settings are invalid.
    TrafficReplayer(std::shared_ptr<GuardService> service, ReplaySettings settings);

    /// Throws std::invalid_argument if @p bases is empty.
    ReplayOutcome run(ReplayMode mode, const std::vector<TrafficRecord>& bases);

    /// One outcome per mode, in all_replay_modes() order.
    std::vector<ReplayOutcome> run_all(const std::vector<TrafficRecord>& bases);

    /// The stream run() sends for @p mode; identities and connections are
    /// unique to this replayer and mode.
    std::vector<TrafficRecord> prepare(ReplayMode mode, const std::vector<TrafficRecord>& bases) const;

    const ReplaySettings& settings() const noexcept { return settings_; }

    static constexpr size_t kMaxDisagreements = 8;

private:
    struct Sent {
        bool accepted = false;
        std::optional<Verdict> verdict;
        std::string error;
    };

    size_t sender_count() const noexcept;
    std::vector<std::optional<Verdict>> sequential(const std::vector<TrafficRecord>& records) const;
    Sent send(const TrafficRecord& record) const;
    uint64_t window_resets() const;

    std::shared_ptr<GuardService> service_;
    ReplaySettings settings_;
    std::string tag_;
    int64_t epoch_ms_ = 0;
};

} // namespace Chaos
} // namespace tsg
