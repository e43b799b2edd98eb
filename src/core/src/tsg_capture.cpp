#include "tsg_capture.hpp"
#include "tsg_config.hpp"
#include "tsg_entropy.hpp"
#include "tsg_envelope.hpp"
#include "tsg_logger.hpp"

#include <nlohmann/json.hpp>

#include <limits>

namespace tsg {

using json = nlohmann::json;
using Reason = MalformedInputError::Reason;

namespace {

[[noreturn]] void fail(Reason reason, const std::string& field, const std::string& msg) {
    throw MalformedInputError(reason, field, msg);
}

const json& require(const json& obj, const char* key, const std::string& path) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        fail(Reason::MISSING_FIELD, path + key, std::string("missing required field '") + key + "'");
    }
    return *it;
}

const json& require_object(const json& obj, const char* key) {
    const json& v = require(obj, key, "");
    if (!v.is_object()) fail(Reason::WRONG_TYPE, key, std::string("'") + key + "' must be an object");
    return v;
}

std::string require_identifier(const json& obj, const char* key, size_t max_len) {
    const json& v = require(obj, key, "");
    if (!v.is_string()) fail(Reason::WRONG_TYPE, key, std::string("'") + key + "' must be a string");
    const auto& s = v.get_ref<const std::string&>();
    if (!is_valid_identifier(s, max_len)) {
        fail(Reason::INVALID_VALUE, key, std::string("'") + key + "' is not a valid identifier");
    }
    return s;
}

// Non-negative integer; floats and negatives are rejected.
uint64_t read_count(const json& v, const std::string& field) {
    if (!v.is_number() || v.is_number_float()) {
        fail(Reason::WRONG_TYPE, field, "'" + field + "' must be an integer");
    }
    if (!v.is_number_unsigned() && v.get<int64_t>() < 0) {
        fail(Reason::INVALID_VALUE, field, "'" + field + "' must not be negative");
    }
    return v.get<uint64_t>();
}

// Millisecond quantity that must fit the signed clock representation.
Millis read_millis(const json& v, const std::string& field) {
    const uint64_t ms = read_count(v, field);
    if (ms > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        fail(Reason::INVALID_VALUE, field, "'" + field + "' is outside the millisecond range");
    }
    return Millis(static_cast<int64_t>(ms));
}

struct TextField {
    std::string text;
    std::string ref;
    bool sanitized = false;
    bool truncated = false;
};

TextField read_text(const json& part, const std::string& path, const CaptureLimits& limits) {
    TextField out;
    auto text_it = part.find("text");
    if (text_it != part.end() && !text_it->is_null()) {
        if (!text_it->is_string()) fail(Reason::WRONG_TYPE, path + ".text", "text must be a string");
        out.text = text_it->get<std::string>();

        std::string encoding = "identity";
        auto enc_it = part.find("content_encoding");
        if (enc_it != part.end()) {
            if (!enc_it->is_string()) {
                fail(Reason::WRONG_TYPE, path + ".content_encoding", "content_encoding must be a string");
            }
            encoding = enc_it->get<std::string>();
        }
        if (encoding == "base64") {
            std::string decoded;
            if (!base64_decode(out.text, decoded)) {
                fail(Reason::UNDECODABLE, path + ".text", "body is not valid base64");
            }
            if (!is_valid_utf8(decoded)) {
                fail(Reason::UNDECODABLE, path + ".text", "decoded body is not valid UTF-8");
            }
            out.text.swap(decoded);
        } else if (encoding != "identity") {
            fail(Reason::PROTOCOL, path + ".content_encoding", "unsupported content_encoding '" + encoding + "'");
        }

        auto len_it = part.find("content_length");
        if (len_it != part.end()) {
            uint64_t declared = read_count(*len_it, path + ".content_length");
            if (declared != out.text.size()) {
                fail(Reason::PROTOCOL, path + ".content_length",
                     "content_length " + std::to_string(declared) + " does not match body length " +
                     std::to_string(out.text.size()));
            }
        }

        out.sanitized = sanitize_text(out.text);
        out.truncated = truncate_utf8(out.text, limits.max_text_bytes);
        return out;
    }

    auto ref_it = part.find("text_ref");
    if (ref_it != part.end() && !ref_it->is_null()) {
        if (!ref_it->is_string()) fail(Reason::WRONG_TYPE, path + ".text_ref", "text_ref must be a string");
        out.ref = ref_it->get<std::string>();
        if (out.ref.empty() || out.ref.size() > 1024 || sanitize_text(out.ref)) {
            fail(Reason::INVALID_VALUE, path + ".text_ref", "text_ref is not a usable reference");
        }
        return out;
    }
    fail(Reason::MISSING_FIELD, path + ".text", path + " carries neither text nor text_ref");
}

uint64_t read_tokens(const json& part, const std::string& path, const CaptureLimits& limits) {
    uint64_t tokens = read_count(require(part, "tokens", path + "."), path + ".tokens");
    if (tokens > limits.max_tokens_per_record) {
        fail(Reason::LIMIT_EXCEEDED, path + ".tokens",
             path + ".tokens exceeds " + std::to_string(limits.max_tokens_per_record));
    }
    return tokens;
}

} // anonymous namespace

// ==================== CaptureLimits ====================

CaptureLimits CaptureLimits::from_config(const Config& cfg) {
    CaptureLimits l;
    l.max_raw_bytes = static_cast<size_t>(cfg.getUInt("capture.max_raw_bytes", l.max_raw_bytes));
    l.max_text_bytes = static_cast<size_t>(cfg.getUInt("capture.max_text_bytes", l.max_text_bytes));
    l.max_nesting_depth = static_cast<size_t>(cfg.getUInt("capture.max_nesting_depth", l.max_nesting_depth));
    l.max_ref_hops = static_cast<size_t>(cfg.getUInt("capture.max_ref_hops", l.max_ref_hops));
    l.max_tokens_per_record = cfg.getUInt("capture.max_tokens_per_record", l.max_tokens_per_record);
    l.max_identifier_length = static_cast<size_t>(
        cfg.getUInt("capture.max_identifier_length", l.max_identifier_length));
    l.connection_idle_ttl = Millis(cfg.getInt("capture.connection_idle_ttl_ms", l.connection_idle_ttl.count()));

    if (l.max_raw_bytes < 256) throw ConfigError("capture.max_raw_bytes must be at least 256");
    if (l.max_text_bytes < 1 || l.max_text_bytes >= l.max_raw_bytes) {
        throw ConfigError("capture.max_text_bytes must be in [1, capture.max_raw_bytes)");
    }
    if (l.max_nesting_depth < 4) throw ConfigError("capture.max_nesting_depth must be at least 4");
    if (l.max_identifier_length < 1) throw ConfigError("capture.max_identifier_length must be at least 1");
    if (l.connection_idle_ttl.count() <= 0) throw ConfigError("capture.connection_idle_ttl_ms must be positive");
    return l;
}

// ==================== InMemorySpanExporter ====================

void InMemorySpanExporter::export_span(const SpanData& span) {
    std::lock_guard<std::mutex> lock(mtx_);
    spans_.push_back(span);
    while (spans_.size() > capacity_) spans_.pop_front();
}

std::vector<SpanData> InMemorySpanExporter::spans() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<SpanData>(spans_.begin(), spans_.end());
}

size_t InMemorySpanExporter::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return spans_.size();
}

void InMemorySpanExporter::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    spans_.clear();
}

// ==================== TelemetryCapture ====================

TelemetryCapture::TelemetryCapture(CaptureLimits limits, std::shared_ptr<ISpanExporter> exporter)
    : limits_(limits)
    , exporter_(std::move(exporter))
{
    init_sodium();
}

void TelemetryCapture::set_record_sink(RecordSink sink) {
    std::lock_guard<std::mutex> lock(sink_mtx_);
    sink_ = std::move(sink);
}

TrafficRecord TelemetryCapture::parse(std::string_view raw, CaptureRejection& hint) const {
    if (raw.size() > limits_.max_raw_bytes) {
        fail(Reason::LIMIT_EXCEEDED, "", "envelope of " + std::to_string(raw.size()) +
             " bytes exceeds " + std::to_string(limits_.max_raw_bytes));
    }
    if (scan_nesting_depth(raw, limits_.max_nesting_depth) > limits_.max_nesting_depth) {
        fail(Reason::STRUCTURE, "", "nesting deeper than " + std::to_string(limits_.max_nesting_depth));
    }

    json doc;
    try {
        doc = json::parse(raw.begin(), raw.end());
    } catch (const json::parse_error& e) {
        fail(Reason::UNDECODABLE, "", std::string("undecodable envelope: ") + e.what());
    }
    if (!doc.is_object()) fail(Reason::WRONG_TYPE, "", "envelope must be a JSON object");

    auto id_it = doc.find("record_id");
    if (id_it != doc.end() && id_it->is_string()) hint.record_id = id_it->get<std::string>();
    auto conn_it = doc.find("connection_id");
    if (conn_it != doc.end() && conn_it->is_string()) hint.connection_id = conn_it->get<std::string>();

    const json& protocol = require(doc, "protocol", "");
    if (!protocol.is_string() || protocol.get_ref<const std::string&>() != kEnvelopeProtocol) {
        fail(Reason::PROTOCOL, "protocol", std::string("expected protocol ") + kEnvelopeProtocol);
    }

    check_references(doc, limits_.max_ref_hops);

    TrafficRecord rec;
    rec.id = require_identifier(doc, "record_id", limits_.max_identifier_length);
    rec.identity = require_identifier(doc, "identity", limits_.max_identifier_length);
    rec.connection_id = require_identifier(doc, "connection_id", limits_.max_identifier_length);
    rec.timestamp = read_millis(require(doc, "timestamp_ms", ""), "timestamp_ms");

    auto seq_it = doc.find("sequence");
    if (seq_it != doc.end() && !seq_it->is_null()) {
        rec.sequence = read_count(*seq_it, "sequence");
        if (rec.sequence == 0) fail(Reason::INVALID_VALUE, "sequence", "sequence starts at 1");
    }

    const json& request = require_object(doc, "request");
    const json& response = require_object(doc, "response");

    TextField prompt = read_text(request, "request", limits_);
    TextField answer = read_text(response, "response", limits_);
    rec.input_tokens = read_tokens(request, "request", limits_);
    rec.output_tokens = read_tokens(response, "response", limits_);

    auto lat_it = doc.find("latency_ms");
    if (lat_it != doc.end() && !lat_it->is_null()) {
        rec.latency = read_millis(*lat_it, "latency_ms");
    }

    auto meta_it = doc.find("metadata");
    if (meta_it != doc.end() && !meta_it->is_null() && !meta_it->is_object()) {
        fail(Reason::WRONG_TYPE, "metadata", "metadata must be an object");
    }

    rec.prompt = std::move(prompt.text);
    rec.prompt_ref = std::move(prompt.ref);
    rec.response = std::move(answer.text);
    rec.response_ref = std::move(answer.ref);
    rec.truncated = prompt.truncated || answer.truncated;
    rec.sanitized = rec.truncated || prompt.sanitized || answer.sanitized;
    return rec;
}

std::shared_ptr<TelemetryCapture::ConnectionState> TelemetryCapture::connection(const std::string& id) {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    auto& slot = connections_[id];
    if (!slot) slot = std::make_shared<ConnectionState>();
    return slot;
}

CaptureResult TelemetryCapture::ingest(std::string_view raw, const RecordSink& on_accept) {
    if (++since_sweep_ % kSweepInterval == 0) {
        const size_t dropped = evict_idle_connections(limits_.connection_idle_ttl);
        if (dropped > 0) {
            TSG_LOG_EVENT(DEBUG, "capture", "dropped " + std::to_string(dropped) + " idle connections");
        }
    }

    CaptureRejection hint;
    try {
        TrafficRecord rec = parse(raw, hint);

        auto conn = connection(rec.connection_id);
        std::unique_lock<std::mutex> lock(conn->mtx);
        while (conn->retired) {
            lock.unlock();
            conn = connection(rec.connection_id);
            lock = std::unique_lock<std::mutex>(conn->mtx);
        }
        conn->last_used = std::chrono::steady_clock::now();
        if (rec.sequence != 0) {
            if (rec.sequence <= conn->last_sequence) {
                fail(Reason::ORDERING, "sequence",
                     "sequence " + std::to_string(rec.sequence) + " does not advance past " +
                     std::to_string(conn->last_sequence) + " on connection " + rec.connection_id);
            }
        } else {
            rec.sequence = conn->last_sequence + 1;
        }
        conn->last_sequence = rec.sequence;

        ++stats_.accepted;
        if (rec.sanitized) ++stats_.sanitized;
        if (rec.truncated) ++stats_.truncated;
        if (rec.sanitized) {
            TSG_LOG_EVENT(DEBUG, "capture", "record " + rec.id + " sanitized" +
                          (rec.truncated ? " (truncated)" : ""));
        }

        export_span(rec);

        RecordSink sink;
        {
            std::lock_guard<std::mutex> sink_lock(sink_mtx_);
            sink = sink_;
        }
        // Still under the connection lock: one connection's records reach the sink in order.
        if (sink) sink(rec);
        if (on_accept) on_accept(rec);

        CaptureResult result;
        result.record = std::move(rec);
        return result;
    } catch (const MalformedInputError& e) {
        hint.reason = e.reason();
        hint.field = e.field();
        hint.message = e.what();
    } catch (const json::exception& e) {
        hint.reason = Reason::UNDECODABLE;
        hint.message = std::string("envelope decoding failed: ") + e.what();
    }

    reject(hint);
    CaptureResult result;
    result.rejection = std::move(hint);
    return result;
}

void TelemetryCapture::reject(CaptureRejection rejection) {
    ++stats_.rejected;
    TSG_LOG_EVENT(WARN, "capture", std::string("rejected record '") + rejection.record_id + "' (" +
                  reason_to_string(rejection.reason) +
                  (rejection.field.empty() ? "" : ", field " + rejection.field) + "): " +
                  rejection.message);

    std::lock_guard<std::mutex> lock(reject_mtx_);
    ++rejection_counts_[reason_to_string(rejection.reason)];
    rejections_.push_back(std::move(rejection));
    while (rejections_.size() > kRejectionHistory) rejections_.pop_front();
}

void TelemetryCapture::export_span(const TrafficRecord& rec) {
    if (!exporter_) return;

    SpanData span;
    span.trace_id = blake2b_hex(rec.connection_id + "|" + rec.identity, 16);
    span.span_id = blake2b_hex(rec.connection_id + "|" + rec.id + "|" + std::to_string(rec.sequence), 16)
                       .substr(0, 16);
    span.name = "llm.proxy.exchange";
    span.start_ms = rec.timestamp.count();
    const int64_t headroom = std::numeric_limits<int64_t>::max() - rec.timestamp.count();
    span.end_ms = rec.latency.count() > headroom ? std::numeric_limits<int64_t>::max()
                                                 : rec.timestamp.count() + rec.latency.count();
    span.attributes["tsg.record_id"] = rec.id;
    span.attributes["tsg.identity"] = rec.identity;
    span.attributes["tsg.sequence"] = std::to_string(rec.sequence);
    span.attributes["llm.usage.input_tokens"] = std::to_string(rec.input_tokens);
    span.attributes["llm.usage.output_tokens"] = std::to_string(rec.output_tokens);
    if (rec.sanitized) span.attributes["tsg.sanitized"] = "true";

    try {
        exporter_->export_span(span);
        ++stats_.spans_exported;
    } catch (const std::exception& e) {
        ++stats_.export_failures;
        TSG_LOG_EVENT(WARN, "capture", std::string("span export failed: ") + e.what());
    }
}

std::map<std::string, uint64_t> TelemetryCapture::rejection_counts() const {
    std::lock_guard<std::mutex> lock(reject_mtx_);
    return rejection_counts_;
}

std::vector<CaptureRejection> TelemetryCapture::recent_rejections() const {
    std::lock_guard<std::mutex> lock(reject_mtx_);
    return std::vector<CaptureRejection>(rejections_.begin(), rejections_.end());
}

size_t TelemetryCapture::connection_count() const {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    return connections_.size();
}

void TelemetryCapture::reset_connections() {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    for (auto& kv : connections_) {
        std::lock_guard<std::mutex> conn_lock(kv.second->mtx);
        kv.second->retired = true;
    }
    connections_.clear();
}

size_t TelemetryCapture::evict_idle_connections(Millis idle_for) {
    const auto cutoff = std::chrono::steady_clock::now() - idle_for;
    size_t dropped = 0;
    std::lock_guard<std::mutex> lock(conn_mtx_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        ConnectionState& conn = *it->second;
        std::unique_lock<std::mutex> conn_lock(conn.mtx, std::try_to_lock);
        if (conn_lock.owns_lock() && conn.last_used <= cutoff) {
            conn.retired = true;
            it = connections_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

} // namespace tsg
