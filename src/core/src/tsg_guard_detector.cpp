#include "tsg_guard_detector.hpp"
#include "tsg_errors.hpp"
#include "tsg_logger.hpp"

#include <algorithm>
#include <limits>

namespace tsg {

// ==================== Window ====================

void Window::evict(Millis newest, Millis window_size) {
    // Unsigned age so distant timestamps cannot overflow the subtraction.
    const int64_t now = newest.count();
    const uint64_t span = static_cast<uint64_t>(std::max<int64_t>(0, window_size.count()));
    while (!entries_.empty()) {
        const int64_t ts = entries_.front().timestamp.count();
        if (ts >= now) break;
        const uint64_t age = static_cast<uint64_t>(now) - static_cast<uint64_t>(ts);
        if (age <= span) break;
        total_tokens_ -= entries_.front().tokens;
        entries_.pop_front();
    }
}

void Window::append(const std::string& identity, WindowEntry entry) {
    if (entry.timestamp < last_timestamp_) {
        throw WindowStateError(identity, "timestamp " + std::to_string(entry.timestamp.count()) +
                               " precedes " + std::to_string(last_timestamp_.count()));
    }
    if (entry.tokens > std::numeric_limits<uint64_t>::max() - total_tokens_) {
        throw WindowStateError(identity, "window token total overflow");
    }
    // At capacity the oldest entry is folded into its successor instead of
    // dropped, so in-window tokens keep counting until the successor ages out.
    while (!entries_.empty() && entries_.size() >= max_records_) {
        const uint64_t oldest = entries_.front().tokens;
        entries_.pop_front();
        if (entries_.empty()) {
            entry.tokens += oldest;
            total_tokens_ -= oldest;
        } else {
            entries_.front().tokens += oldest;
        }
        ++coalesced_;
    }
    last_timestamp_ = entry.timestamp;
    total_tokens_ += entry.tokens;
    entries_.push_back(std::move(entry));
}

double Window::token_rate(Millis window_size) const noexcept {
    if (window_size.count() <= 0) return 0.0;
    return static_cast<double>(total_tokens_) * 1000.0 / static_cast<double>(window_size.count());
}

void Window::clear() noexcept {
    entries_.clear();
    total_tokens_ = 0;
    coalesced_ = 0;
    last_timestamp_ = Millis::min();
}

// ==================== GuardDetector ====================

GuardDetector::GuardDetector(GuardConfig config, std::shared_ptr<const IPatternScorer> scorer)
    : scorer_(std::move(scorer))
{
    GuardConfigError err = config.validate();
    if (err != GuardConfigError::NONE) {
        throw ConfigError(std::string("invalid guard configuration: ") + guard_config_error_to_string(err));
    }
    if (!scorer_) {
        scorer_ = std::make_shared<RegexPatternScorer>(config.max_scan_bytes);
    }
    config_ = std::make_shared<const GuardConfig>(std::move(config));
}

void GuardDetector::reconfigure(GuardConfig config) {
    GuardConfigError err = config.validate();
    if (err != GuardConfigError::NONE) {
        throw ConfigError(std::string("invalid guard configuration: ") + guard_config_error_to_string(err));
    }
    auto next = std::make_shared<const GuardConfig>(std::move(config));
    TSG_LOG_INFO("guard reconfigured: " + next->to_string());
    std::atomic_store(&config_, std::move(next));
}

std::shared_ptr<const GuardConfig> GuardDetector::config() const {
    return std::atomic_load(&config_);
}

void GuardDetector::set_alert_sink(AlertSink sink, bool include_benign) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
    sink_includes_benign_ = include_benign;
}

std::shared_ptr<GuardDetector::IdentitySlot>
GuardDetector::slot_for(const std::string& identity, size_t max_records) {
    {
        std::shared_lock<std::shared_mutex> lock(slots_mutex_);
        auto it = slots_.find(identity);
        if (it != slots_.end()) return it->second;
    }
    std::unique_lock<std::shared_mutex> lock(slots_mutex_);
    auto& slot = slots_[identity];
    if (!slot) slot = std::make_shared<IdentitySlot>(max_records);
    return slot;
}

std::string GuardDetector::text_for_scoring(const TrafficRecord& record) const {
    // Response text is scored; a referenced (out-of-band) response falls back to the prompt.
    if (!record.response.empty() || record.response_ref.empty()) return record.response;
    return record.prompt;
}

Classification GuardDetector::classify(bool rate_signal, bool pattern_signal) noexcept {
    if (rate_signal && pattern_signal) return Classification::TOKEN_STORM;
    if (rate_signal || pattern_signal) return Classification::SUSPECTED;
    return Classification::BENIGN;
}

double GuardDetector::confidence_for(Classification c, double token_rate, double threshold,
                                     double pattern_score, double sensitivity, bool degraded) noexcept {
    const double ratio = threshold > 0.0 ? token_rate / threshold : 0.0;
    const double excess = std::clamp(ratio - 1.0, 0.0, 1.0);
    const double pattern_strength = sensitivity > 0.0
        ? std::min(1.0, pattern_score / sensitivity)
        : (pattern_score > 0.0 ? 1.0 : 0.0);

    double confidence;
    switch (c) {
        case Classification::TOKEN_STORM:
            confidence = 0.5 + 0.25 * excess + 0.25 * pattern_score;
            break;
        case Classification::SUSPECTED:
            confidence = 0.25 + 0.25 * std::max(excess, pattern_score);
            break;
        default:
            confidence = 1.0 - 0.5 * std::max(std::min(1.0, ratio), pattern_strength);
            break;
    }
    if (degraded) confidence *= 0.8;
    return std::clamp(confidence, 0.0, 1.0);
}

Verdict GuardDetector::process(const TrafficRecord& record) {
    const std::shared_ptr<const GuardConfig> cfg = std::atomic_load(&config_);

    Verdict v;
    v.record_id = record.id;
    v.identity = record.identity;
    v.timestamp = record.timestamp;

    // Pattern scoring needs no window state; do it before taking the slot lock.
    PatternReport report;
    std::string text = text_for_scoring(record);
    if (text.size() > cfg->max_scan_bytes) text.resize(cfg->max_scan_bytes);
    try {
        report = scorer_->score(text);
    } catch (const PatternEngineError& e) {
        v.degraded = true;
        TSG_LOG_EVENT(WARN, "detector", "pattern scoring failed for " + record.id +
                      ", rate-only verdict: " + e.what());
    } catch (const std::exception& e) {
        v.degraded = true;
        TSG_LOG_EVENT(WARN, "detector", "pattern scorer '" + scorer_->name() + "' raised for " +
                      record.id + ", rate-only verdict: " + e.what());
    }

    const uint64_t in = record.input_tokens;
    const uint64_t out = record.output_tokens;
    const uint64_t tokens = (in > std::numeric_limits<uint64_t>::max() - out)
        ? std::numeric_limits<uint64_t>::max() : in + out;

    auto slot = slot_for(record.identity, cfg->max_window_records);
    {
        std::unique_lock<std::mutex> lock(slot->mtx);
        while (slot->retired) {
            lock.unlock();
            slot = slot_for(record.identity, cfg->max_window_records);
            lock = std::unique_lock<std::mutex>(slot->mtx);
        }
        slot->last_seen = std::chrono::steady_clock::now();
        Window& window = slot->window;
        try {
            window.evict(record.timestamp, cfg->window_size);
            window.append(record.identity, {record.id, record.timestamp, tokens});
        } catch (const WindowStateError& e) {
            TSG_LOG_EVENT(ERROR, "detector", "window for '" + e.identity() + "' reset: " + e.what());
            v.window_reset = true;
        }
        if (v.window_reset) {
            ++stats_.window_resets;
            // A cleared window has no history and a zero total, so this append cannot throw.
            window.clear();
            window.append(record.identity, {record.id, record.timestamp, tokens});
        }
        v.token_rate = window.token_rate(cfg->window_size);
        v.window_records = window.size();
    }

    v.rate_signal = v.token_rate > cfg->token_rate_threshold;
    if (!v.degraded) {
        v.pattern_score = report.score;
        v.pattern_signal = report.score >= cfg->pattern_sensitivity;
        v.matched_patterns = report.matched_families();
        v.primary_pattern = report.primary_pattern;
    }
    if (v.primary_pattern.empty() && v.rate_signal) v.primary_pattern = "rate_limit_exceeded";

    v.classification = classify(v.rate_signal, v.pattern_signal);
    v.confidence = confidence_for(v.classification, v.token_rate, cfg->token_rate_threshold,
                                  v.pattern_score, cfg->pattern_sensitivity, v.degraded);
    v.action = cfg->policy.decide(v, cfg->token_rate_threshold);

    ++stats_.total_records;
    if (v.degraded) ++stats_.degraded;
    switch (v.classification) {
        case Classification::BENIGN:      ++stats_.benign; break;
        case Classification::SUSPECTED:   ++stats_.suspected; break;
        case Classification::TOKEN_STORM: ++stats_.token_storms; break;
    }
    if (v.action == ResponseAction::BLOCK) ++stats_.blocked;
    if (v.action == ResponseAction::WARN) ++stats_.warned;

    if (!v.matched_patterns.empty()) {
        std::lock_guard<std::mutex> lock(hits_mutex_);
        for (const auto& name : v.matched_patterns) ++pattern_hits_[name];
    }

    if (v.classification == Classification::TOKEN_STORM) {
        TSG_LOG_EVENT(WARN, "detector", "token storm from '" + v.identity + "' (rate " +
                      std::to_string(static_cast<int64_t>(v.token_rate)) + " tok/s, pattern " +
                      v.primary_pattern + ")");
    }

    AlertSink sink;
    bool include_benign = false;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
        include_benign = sink_includes_benign_;
    }
    if (sink && (include_benign || v.flagged())) sink(v);

    if (++since_sweep_ % kSweepInterval == 0) {
        const size_t dropped = evict_idle(cfg->identity_idle_ttl);
        if (dropped > 0) {
            TSG_LOG_EVENT(DEBUG, "detector", "dropped " + std::to_string(dropped) + " idle identities");
        }
    }

    return v;
}

std::map<std::string, uint64_t> GuardDetector::pattern_hits() const {
    std::lock_guard<std::mutex> lock(hits_mutex_);
    return pattern_hits_;
}

std::optional<WindowSnapshot> GuardDetector::window_snapshot(const std::string& identity) const {
    std::shared_ptr<IdentitySlot> slot;
    {
        std::shared_lock<std::shared_mutex> lock(slots_mutex_);
        auto it = slots_.find(identity);
        if (it == slots_.end()) return std::nullopt;
        slot = it->second;
    }
    const auto cfg = config();
    std::lock_guard<std::mutex> lock(slot->mtx);
    WindowSnapshot snap;
    snap.identity = identity;
    snap.start = slot->window.start();
    snap.end = slot->window.end();
    snap.records = slot->window.size();
    snap.total_tokens = slot->window.total_tokens();
    snap.token_rate = slot->window.token_rate(cfg->window_size);
    return snap;
}

size_t GuardDetector::identity_count() const {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    return slots_.size();
}

size_t GuardDetector::evict_idle(Millis idle_for) {
    const auto cutoff = std::chrono::steady_clock::now() - idle_for;
    size_t dropped = 0;
    std::unique_lock<std::shared_mutex> lock(slots_mutex_);
    for (auto it = slots_.begin(); it != slots_.end();) {
        IdentitySlot& slot = *it->second;
        // A slot busy in process() is in use, not idle.
        std::unique_lock<std::mutex> slot_lock(slot.mtx, std::try_to_lock);
        if (slot_lock.owns_lock() && slot.last_seen <= cutoff) {
            slot.retired = true;
            it = slots_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

void GuardDetector::reset_identity(const std::string& identity) {
    std::unique_lock<std::shared_mutex> lock(slots_mutex_);
    auto it = slots_.find(identity);
    if (it == slots_.end()) return;
    {
        std::lock_guard<std::mutex> slot_lock(it->second->mtx);
        it->second->retired = true;
    }
    slots_.erase(it);
}

void GuardDetector::clear() {
    std::unique_lock<std::shared_mutex> lock(slots_mutex_);
    for (auto& kv : slots_) {
        std::lock_guard<std::mutex> slot_lock(kv.second->mtx);
        kv.second->retired = true;
    }
    slots_.clear();
}

size_t GuardDetector::memory_estimate() const {
    std::vector<std::shared_ptr<IdentitySlot>> slots;
    size_t bytes = 0;
    {
        std::shared_lock<std::shared_mutex> lock(slots_mutex_);
        slots.reserve(slots_.size());
        for (const auto& kv : slots_) {
            bytes += sizeof(IdentitySlot) + kv.first.capacity();
            slots.push_back(kv.second);
        }
    }
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mtx);
        for (const auto& e : slot->window.entries()) {
            bytes += sizeof(WindowEntry) + e.record_id.capacity();
        }
    }
    return bytes;
}

} // namespace tsg
