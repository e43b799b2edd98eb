#include "tsg_replay.hpp"
#include "tsg_capture.hpp"
#include "tsg_config.hpp"
#include "tsg_entropy.hpp"
#include "tsg_envelope.hpp"
#include "tsg_errors.hpp"
#include "tsg_guard_detector.hpp"
#include "tsg_logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace tsg {
namespace Chaos {

namespace {

std::atomic<uint64_t> g_replayers{0};

bool same_verdict(const Verdict& a, const Verdict& b) noexcept {
    return a.classification == b.classification && a.action == b.action &&
           a.window_records == b.window_records;
}

std::string describe(const Verdict& v) {
    return std::string(classification_to_string(v.classification)) + "/" +
           action_to_string(v.action) + " over " + std::to_string(v.window_records) + " records";
}

} // anonymous namespace

const char* replay_mode_to_string(ReplayMode m) noexcept {
    switch (m) {
        case ReplayMode::CONCURRENT: return "concurrent";
        case ReplayMode::CLOCK_SKEW: return "clock_skew";
        case ReplayMode::TIMEOUT:    return "timeout";
    }
    return "unknown";
}

std::optional<ReplayMode> replay_mode_from_string(const std::string& s) noexcept {
    for (ReplayMode m : all_replay_modes()) {
        if (s == replay_mode_to_string(m)) return m;
    }
    return std::nullopt;
}

const std::vector<ReplayMode>& all_replay_modes() {
    static const std::vector<ReplayMode> modes = {
        ReplayMode::CONCURRENT,
        ReplayMode::CLOCK_SKEW,
        ReplayMode::TIMEOUT,
    };
    return modes;
}

// ==================== ReplaySettings ====================

std::string ReplaySettings::validate() const {
    if (threads == 0) return "threads must be at least 1";
    if (identities == 0) return "identities must be at least 1";
    if (records_per_mode == 0) return "records_per_mode must be at least 1";
    if (step.count() <= 0) return "step must be positive";
    if (max_skew.count() < 0) return "max_skew must not be negative";
    if (timeout_records >= records_per_mode) return "timeout_records must leave records to compare";
    if (settle_timeout.count() <= 0) return "settle_timeout must be positive";
    return {};
}

ReplaySettings ReplaySettings::from_config(const Config& cfg) {
    ReplaySettings s;
    s.enabled = cfg.getBool("replay.enabled", s.enabled);
    s.threads = static_cast<size_t>(cfg.getUInt("replay.threads", s.threads));
    s.identities = static_cast<size_t>(cfg.getUInt("replay.identities", s.identities));
    s.records_per_mode = static_cast<size_t>(cfg.getUInt("replay.records_per_mode", s.records_per_mode));
    s.step = Millis(cfg.getInt("replay.step_ms", s.step.count()));
    s.max_skew = Millis(cfg.getInt("replay.max_skew_ms", s.max_skew.count()));
    s.timeout_records = static_cast<size_t>(cfg.getUInt("replay.timeout_records", s.timeout_records));
    s.settle_timeout = Millis(cfg.getInt("replay.settle_timeout_ms", s.settle_timeout.count()));
    s.seed = cfg.getUInt("replay.seed", s.seed);

    const std::string err = s.validate();
    if (!err.empty()) throw ConfigError("invalid replay configuration: " + err);
    return s;
}

// ==================== ReplayOutcome ====================

double ReplayOutcome::agreement() const noexcept {
    const size_t n = compared();
    return n == 0 ? 0.0 : static_cast<double>(agreed) / static_cast<double>(n);
}

bool ReplayOutcome::clean() const noexcept {
    return compared() > 0 && agreed == compared() && window_resets == 0 && settled;
}

// ==================== TrafficReplayer ====================

TrafficReplayer::TrafficReplayer(std::shared_ptr<GuardService> service, ReplaySettings settings)
    : service_(std::move(service))
    , settings_(settings)
{
    const std::string err = settings_.validate();
    if (!err.empty()) throw ConfigError("invalid replay configuration: " + err);
    init_sodium();

    const int64_t now = std::chrono::duration_cast<Millis>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    epoch_ms_ = std::max(now, settings_.max_skew.count() + 1);
    tag_ = "replay-" + std::to_string(++g_replayers) + "-" + std::to_string(now);
}

size_t TrafficReplayer::sender_count() const noexcept {
    return std::max<size_t>(1, std::min(settings_.threads, settings_.identities));
}

std::vector<TrafficRecord> TrafficReplayer::prepare(ReplayMode mode,
                                                    const std::vector<TrafficRecord>& bases) const {
    if (bases.empty()) throw std::invalid_argument("replay needs at least one base record");

    const std::string prefix = tag_ + "-" + replay_mode_to_string(mode);
    const size_t senders = sender_count();

    std::vector<int64_t> skew(settings_.identities, 0);
    if (mode == ReplayMode::CLOCK_SKEW && settings_.max_skew.count() > 0) {
        DeterministicStream stream("replay-skew:" + std::to_string(settings_.seed));
        const uint64_t span = static_cast<uint64_t>(settings_.max_skew.count());
        for (auto& s : skew) {
            s = static_cast<int64_t>(stream.range(0, 2 * span)) - settings_.max_skew.count();
        }
    }

    std::vector<TrafficRecord> out;
    out.reserve(settings_.records_per_mode);
    for (size_t i = 0; i < settings_.records_per_mode; ++i) {
        const size_t k = i % settings_.identities;
        const int64_t nth = static_cast<int64_t>(i / settings_.identities);

        TrafficRecord r = bases[i % bases.size()];
        r.id = prefix + "-" + std::to_string(i);
        r.identity = prefix + "-id-" + std::to_string(k);
        // Several identities share one connection when clocks disagree.
        r.connection_id = prefix + "-conn-" +
            std::to_string(mode == ReplayMode::CLOCK_SKEW ? k % senders : k);
        r.timestamp = Millis(epoch_ms_ + nth * settings_.step.count() + skew[k]);
        r.sequence = 0;
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<std::optional<Verdict>>
TrafficReplayer::sequential(const std::vector<TrafficRecord>& records) const {
    auto cfg = service_->config();
    TelemetryCapture capture(service_->capture_limits());
    GuardDetector detector(cfg ? *cfg : GuardConfig{});

    std::vector<std::optional<Verdict>> out;
    out.reserve(records.size());
    for (const auto& r : records) {
        CaptureResult c = capture.ingest(serialize_envelope(r));
        if (c.accepted()) {
            out.emplace_back(detector.process(*c.record));
        } else {
            out.emplace_back(std::nullopt);
        }
    }
    return out;
}

TrafficReplayer::Sent TrafficReplayer::send(const TrafficRecord& record) const {
    Sent s;
    try {
        SubmitResult r = service_->handle(serialize_envelope(record));
        s.accepted = r.capture.accepted();
        s.verdict = std::move(r.verdict);
        s.error = std::move(r.error);
    } catch (const std::exception& e) {
        s.error = std::string("unhandled exception: ") + e.what();
    }
    return s;
}

uint64_t TrafficReplayer::window_resets() const {
    auto stats = service_->detector_stats();
    return stats ? stats->window_resets.load() : 0;
}

ReplayOutcome TrafficReplayer::run(ReplayMode mode, const std::vector<TrafficRecord>& bases) {
    const std::vector<TrafficRecord> records = prepare(mode, bases);
    const std::vector<std::optional<Verdict>> expected = sequential(records);

    ReplayOutcome out;
    out.mode = mode;
    out.records = records.size();

    const auto start = std::chrono::steady_clock::now();
    const uint64_t resets_before = window_resets();
    std::vector<Sent> results(records.size());

    size_t first = 0;
    if (mode == ReplayMode::TIMEOUT) {
        first = std::min(settings_.timeout_records, records.size());
        const Millis delay = service_->settings().request_timeout + Millis(50);
        service_->set_injected_delay(delay);
        for (size_t i = 0; i < first; ++i) results[i] = send(records[i]);
        service_->set_injected_delay(Millis(0));
        out.expected_unserved = first;
        // Delayed work must land before the same identities send again.
        if (!service_->drain(settings_.settle_timeout + delay * static_cast<Millis::rep>(first))) {
            out.note = "delayed detection did not drain";
        }
    }

    const size_t senders = sender_count();
    std::vector<std::thread> threads;
    threads.reserve(senders);
    for (size_t t = 0; t < senders; ++t) {
        threads.emplace_back([this, t, senders, first, &records, &results]() {
            for (size_t i = first; i < records.size(); ++i) {
                if ((i % settings_.identities) % senders != t) continue;
                results[i] = send(records[i]);
            }
        });
    }
    for (auto& th : threads) th.join();

    for (size_t i = 0; i < records.size(); ++i) {
        const Sent& s = results[i];
        if (s.error.empty() && (!s.accepted || s.verdict)) ++out.served;
        if (i < first) continue;

        std::string why;
        if (!s.error.empty()) {
            why = s.error;
        } else if (!s.accepted) {
            if (expected[i]) why = "rejected by the service, accepted sequentially";
        } else if (!expected[i]) {
            why = "accepted by the service, rejected sequentially";
        } else if (!s.verdict) {
            why = "accepted record produced no verdict";
        } else if (!same_verdict(*expected[i], *s.verdict)) {
            why = "expected " + describe(*expected[i]) + ", got " + describe(*s.verdict);
        }

        if (why.empty()) {
            ++out.agreed;
        } else if (out.disagreements.size() < kMaxDisagreements) {
            out.disagreements.push_back(records[i].id + ": " + why);
        }
    }

    const uint64_t resets_after = window_resets();
    // A restart mid-run starts the counter over.
    out.window_resets = resets_after >= resets_before ? resets_after - resets_before : resets_after;
    out.settled = service_->drain(settings_.settle_timeout) && service_->synthetic_request();
    if (!out.settled && out.note.empty()) out.note = "service did not settle after replay";
    out.elapsed = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);

    TSG_LOG_INFO(std::string("replay ") + replay_mode_to_string(mode) + ": " +
                 std::to_string(out.agreed) + "/" + std::to_string(out.compared()) + " verdicts agree, " +
                 std::to_string(out.window_resets) + " window resets" +
                 (out.settled ? "" : ", not settled"));
    return out;
}

std::vector<ReplayOutcome> TrafficReplayer::run_all(const std::vector<TrafficRecord>& bases) {
    std::vector<ReplayOutcome> out;
    for (ReplayMode m : all_replay_modes()) out.push_back(run(m, bases));
    return out;
}

} // namespace Chaos
} // namespace tsg
