#pragma once

/**
 * @file tsg_capture.hpp
 * @brief Telemetry Capture: raw span envelopes -> TrafficRecords
 *
 * ingest() never throws for bad input. Every failure becomes a
 * CaptureRejection that is counted, kept in a bounded history and logged
 * on the "capture" channel as a data-quality event.
 */

#include "tsg_errors.hpp"
#include "tsg_types.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tsg {

class Config;

struct CaptureLimits {
    size_t max_raw_bytes = 1024 * 1024;
    size_t max_text_bytes = 64 * 1024;
    size_t max_nesting_depth = 64;
    size_t max_ref_hops = 16;
    uint64_t max_tokens_per_record = 1000000;
    size_t max_identifier_length = 128;
    Millis connection_idle_ttl{300000};   // wall-clock silence before a connection's sequence state is dropped

    /// Build from "capture.*" keys. Throws ConfigError on invalid values.
    static CaptureLimits from_config(const Config& cfg);
};

struct CaptureRejection {
    std::string record_id;       // best effort, may be empty
    std::string connection_id;   // best effort, may be empty
    MalformedInputError::Reason reason = MalformedInputError::Reason::UNDECODABLE;
    std::string field;
    std::string message;
};

struct CaptureResult {
    std::optional<TrafficRecord> record;
    std::optional<CaptureRejection> rejection;

    bool accepted() const noexcept { return record.has_value(); }
};

// ==================== Span export ====================

struct SpanData {
    std::string trace_id;        // 32 hex chars
    std::string span_id;         // 16 hex chars
    std::string name;
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::map<std::string, std::string> attributes;
};

/**
 * @brief Distributed-tracing exporter seam
 *
 * Export failures are counted by the capture and never affect ingestion.
 */
class ISpanExporter {
public:
    virtual ~ISpanExporter() = default;
    virtual void export_span(const SpanData& span) = 0;
};

class InMemorySpanExporter : public ISpanExporter {
public:
    explicit InMemorySpanExporter(size_t capacity = 10000) : capacity_(capacity) {}

    void export_span(const SpanData& span) override;
    std::vector<SpanData> spans() const;
    size_t size() const;
    void clear();

private:
    size_t capacity_;
    mutable std::mutex mtx_;
    std::deque<SpanData> spans_;
};

// ==================== Capture ====================

struct CaptureStats {
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> sanitized{0};
    std::atomic<uint64_t> truncated{0};
    std::atomic<uint64_t> spans_exported{0};
    std::atomic<uint64_t> export_failures{0};

    CaptureStats() = default;
    CaptureStats(const CaptureStats& other)
        : accepted(other.accepted.load())
        , rejected(other.rejected.load())
        , sanitized(other.sanitized.load())
        , truncated(other.truncated.load())
        , spans_exported(other.spans_exported.load())
        , export_failures(other.export_failures.load()) {}
};

class TelemetryCapture {
public:
    using RecordSink = std::function<void(const TrafficRecord&)>;

    explicit TelemetryCapture(CaptureLimits limits = {},
                              std::shared_ptr<ISpanExporter> exporter = nullptr);

    TelemetryCapture(const TelemetryCapture&) = delete;
    TelemetryCapture& operator=(const TelemetryCapture&) = delete;

    /// Normalize one raw envelope. Records of one connection reach the sink
    /// in ingest order with strictly increasing sequence numbers.
    /// @p on_accept, if set, runs after the configured sink and still under
    /// the connection lock; it must not throw.
    CaptureResult ingest(std::string_view raw, const RecordSink& on_accept = nullptr);

    void set_record_sink(RecordSink sink);

    const CaptureLimits& limits() const noexcept { return limits_; }
    CaptureStats get_stats() const { return stats_; }
    std::map<std::string, uint64_t> rejection_counts() const;

    /// Most recent rejections, oldest first (bounded history).
    std::vector<CaptureRejection> recent_rejections() const;

    size_t connection_count() const;
    void reset_connections();

    /// Forget connections idle for longer than @p idle_for of wall-clock
    /// time. A forgotten connection starts its sequence check over. Runs on
    /// its own every kSweepInterval ingests with connection_idle_ttl.
    size_t evict_idle_connections(Millis idle_for);

    static constexpr size_t kRejectionHistory = 1000;
    static constexpr uint64_t kSweepInterval = 4096;

private:
    struct ConnectionState {
        std::mutex mtx;
        uint64_t last_sequence = 0;
        std::chrono::steady_clock::time_point last_used = std::chrono::steady_clock::now();
        bool retired = false;   // erased from connections_
    };

    TrafficRecord parse(std::string_view raw, CaptureRejection& hint) const;
    std::shared_ptr<ConnectionState> connection(const std::string& id);
    void reject(CaptureRejection rejection);
    void export_span(const TrafficRecord& rec);

    CaptureLimits limits_;
    std::shared_ptr<ISpanExporter> exporter_;

    mutable std::mutex sink_mtx_;
    RecordSink sink_;

    mutable std::mutex conn_mtx_;
    std::unordered_map<std::string, std::shared_ptr<ConnectionState>> connections_;

    mutable std::mutex reject_mtx_;
    std::deque<CaptureRejection> rejections_;
    std::map<std::string, uint64_t> rejection_counts_;

    CaptureStats stats_;
    std::atomic<uint64_t> since_sweep_{0};
};

} // namespace tsg
