/**
 * @file test_capture.cpp
 * @brief Envelope normalization, rejections, sanitization and per-connection order
 */

#include <gtest/gtest.h>
#include "tsg_capture.hpp"
#include "tsg_entropy.hpp"
#include "tsg_envelope.hpp"
#include "tsg_errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using namespace tsg;
using json = nlohmann::json;
using Reason = MalformedInputError::Reason;

class CaptureTest : public ::testing::Test {
protected:
    json base() const {
        return json{
            {"protocol", "tsg-span/1"},
            {"record_id", "rec-1"},
            {"identity", "user-1"},
            {"connection_id", "conn-1"},
            {"timestamp_ms", 1700000000000LL},
            {"request", {{"text", "hello"}, {"tokens", 12}}},
            {"response", {{"text", "hi there"}, {"tokens", 480}}},
            {"latency_ms", 950},
            {"metadata", json::object()},
        };
    }

    CaptureResult ingest(const json& j) { return capture.ingest(j.dump()); }

    Reason reason_of(const CaptureResult& r) const {
        EXPECT_FALSE(r.accepted());
        return r.rejection ? r.rejection->reason : Reason::UNDECODABLE;
    }

    TelemetryCapture capture;
};

// ─── acceptance ─────────────────────────────────────────────────────────────

TEST_F(CaptureTest, AcceptsWellFormedEnvelope) {
    auto r = ingest(base());
    ASSERT_TRUE(r.accepted());
    const TrafficRecord& rec = *r.record;
    EXPECT_EQ(rec.id, "rec-1");
    EXPECT_EQ(rec.identity, "user-1");
    EXPECT_EQ(rec.connection_id, "conn-1");
    EXPECT_EQ(rec.timestamp.count(), 1700000000000LL);
    EXPECT_EQ(rec.prompt, "hello");
    EXPECT_EQ(rec.response, "hi there");
    EXPECT_EQ(rec.input_tokens, 12u);
    EXPECT_EQ(rec.output_tokens, 480u);
    EXPECT_EQ(rec.total_tokens(), 492u);
    EXPECT_EQ(rec.latency.count(), 950);
    EXPECT_EQ(rec.sequence, 1u);
    EXPECT_FALSE(rec.sanitized);
    EXPECT_EQ(capture.get_stats().accepted.load(), 1u);
}

TEST_F(CaptureTest, RecordSerializationIsAccepted) {
    TrafficRecord rec;
    rec.id = "r-9";
    rec.identity = "svc@tenant:eu";
    rec.connection_id = "c.9";
    rec.timestamp = Millis(1700000000123);
    rec.prompt = "p";
    rec.response = "q";
    rec.input_tokens = 1;
    rec.output_tokens = 2;
    auto r = capture.ingest(serialize_envelope(rec));
    ASSERT_TRUE(r.accepted());
    EXPECT_EQ(r.record->identity, "svc@tenant:eu");
}

TEST_F(CaptureTest, TextByReference) {
    json j = base();
    j["response"] = {{"text_ref", "blob://responses/1"}, {"tokens", 3}};
    auto r = ingest(j);
    ASSERT_TRUE(r.accepted());
    EXPECT_TRUE(r.record->response.empty());
    EXPECT_EQ(r.record->response_ref, "blob://responses/1");
    EXPECT_FALSE(r.record->has_inline_response());
}

TEST_F(CaptureTest, Base64Body) {
    json j = base();
    j["response"]["text"] = base64_encode("decoded body");
    j["response"]["content_encoding"] = "base64";
    j["response"]["content_length"] = 12;
    auto r = ingest(j);
    ASSERT_TRUE(r.accepted());
    EXPECT_EQ(r.record->response, "decoded body");
}

// ─── rejections ─────────────────────────────────────────────────────────────

TEST_F(CaptureTest, RejectsUndecodable) {
    EXPECT_EQ(reason_of(capture.ingest("{\"protocol\": ")), Reason::UNDECODABLE);
    EXPECT_EQ(reason_of(capture.ingest("")), Reason::UNDECODABLE);
}

TEST_F(CaptureTest, RejectsNonObject) {
    EXPECT_EQ(reason_of(capture.ingest("[1,2,3]")), Reason::WRONG_TYPE);
}

TEST_F(CaptureTest, RejectsWrongProtocol) {
    json j = base();
    j["protocol"] = "tsg-span/2";
    EXPECT_EQ(reason_of(ingest(j)), Reason::PROTOCOL);
    j.erase("protocol");
    EXPECT_EQ(reason_of(ingest(j)), Reason::MISSING_FIELD);
}

TEST_F(CaptureTest, RejectsMissingFields) {
    for (const char* field : {"record_id", "identity", "connection_id", "timestamp_ms", "request", "response"}) {
        json j = base();
        j.erase(field);
        auto r = ingest(j);
        EXPECT_EQ(reason_of(r), Reason::MISSING_FIELD) << field;
    }
    json j = base();
    j["response"].erase("tokens");
    EXPECT_EQ(reason_of(ingest(j)), Reason::MISSING_FIELD);
}

TEST_F(CaptureTest, RejectsTypeSwaps) {
    json j = base();
    j["identity"] = 42;
    EXPECT_EQ(reason_of(ingest(j)), Reason::WRONG_TYPE);

    j = base();
    j["response"]["tokens"] = "480";
    EXPECT_EQ(reason_of(ingest(j)), Reason::WRONG_TYPE);

    j = base();
    j["response"]["tokens"] = 4.5;
    EXPECT_EQ(reason_of(ingest(j)), Reason::WRONG_TYPE);

    j = base();
    j["request"] = "hello";
    EXPECT_EQ(reason_of(ingest(j)), Reason::WRONG_TYPE);

    j = base();
    j["metadata"] = json::array();
    EXPECT_EQ(reason_of(ingest(j)), Reason::WRONG_TYPE);
}

TEST_F(CaptureTest, RejectsBadValues) {
    json j = base();
    j["response"]["tokens"] = -1;
    EXPECT_EQ(reason_of(ingest(j)), Reason::INVALID_VALUE);

    j = base();
    j["identity"] = "user 1";
    EXPECT_EQ(reason_of(ingest(j)), Reason::INVALID_VALUE);

    j = base();
    j["identity"] = "";
    EXPECT_EQ(reason_of(ingest(j)), Reason::INVALID_VALUE);

    j = base();
    j["sequence"] = 0;
    EXPECT_EQ(reason_of(ingest(j)), Reason::INVALID_VALUE);
}

TEST_F(CaptureTest, RejectsMillisecondsBeyondSignedRange) {
    json j = base();
    j["timestamp_ms"] = 9223372036854775808ULL;
    auto r = ingest(j);
    EXPECT_EQ(reason_of(r), Reason::INVALID_VALUE);
    EXPECT_EQ(r.rejection->field, "timestamp_ms");

    j = base();
    j["latency_ms"] = 18446744073709551615ULL;
    r = ingest(j);
    EXPECT_EQ(reason_of(r), Reason::INVALID_VALUE);
    EXPECT_EQ(r.rejection->field, "latency_ms");

    j = base();
    j["timestamp_ms"] = std::numeric_limits<int64_t>::max();
    j["latency_ms"] = std::numeric_limits<int64_t>::max();
    r = ingest(j);
    ASSERT_TRUE(r.accepted());
    EXPECT_EQ(r.record->timestamp.count(), std::numeric_limits<int64_t>::max());
}

TEST_F(CaptureTest, RejectsLimitBreaches) {
    json j = base();
    j["response"]["tokens"] = 1000001;
    EXPECT_EQ(reason_of(ingest(j)), Reason::LIMIT_EXCEEDED);

    CaptureLimits limits;
    limits.max_raw_bytes = 512;
    limits.max_text_bytes = 128;
    TelemetryCapture small(limits);
    json big = base();
    big["metadata"]["padding"] = std::string(1024, 'x');
    auto r = small.ingest(big.dump());
    EXPECT_EQ(reason_of(r), Reason::LIMIT_EXCEEDED);
}

TEST_F(CaptureTest, RejectsNonNumericFloats) {
    // NaN and Infinity are not JSON
    EXPECT_EQ(reason_of(capture.ingest(
        R"({"protocol":"tsg-span/1","record_id":"a","identity":"b","connection_id":"c",)"
        R"("timestamp_ms":NaN,"request":{"text":"x","tokens":1},"response":{"text":"y","tokens":1}})")),
        Reason::UNDECODABLE);
}

TEST_F(CaptureTest, RejectsProtocolFramingViolations) {
    json j = base();
    j["response"]["content_encoding"] = "gzip";
    EXPECT_EQ(reason_of(ingest(j)), Reason::PROTOCOL);

    j = base();
    j["response"]["content_length"] = 3;
    EXPECT_EQ(reason_of(ingest(j)), Reason::PROTOCOL);

    j = base();
    j["response"]["content_encoding"] = "base64";
    j["response"]["text"] = "***";
    EXPECT_EQ(reason_of(ingest(j)), Reason::UNDECODABLE);
}

TEST_F(CaptureTest, RejectsInvalidUtf8) {
    std::string raw = base().dump();
    const auto pos = raw.find("hi there");
    ASSERT_NE(pos, std::string::npos);
    raw[pos] = '\xC3';
    raw[pos + 1] = '\x28';
    EXPECT_EQ(reason_of(capture.ingest(raw)), Reason::UNDECODABLE);
}

// ─── structure ──────────────────────────────────────────────────────────────

TEST_F(CaptureTest, RejectsDeepNestingWithoutRecursion) {
    std::string deep = "{\"protocol\":\"tsg-span/1\",\"metadata\":";
    for (int i = 0; i < 100000; ++i) deep += "[";
    for (int i = 0; i < 100000; ++i) deep += "]";
    deep += "}";
    CaptureLimits limits;
    limits.max_raw_bytes = 4 * 1024 * 1024;
    TelemetryCapture c(limits);
    EXPECT_EQ(reason_of(c.ingest(deep)), Reason::STRUCTURE);
}

TEST_F(CaptureTest, ResolvesAcyclicReferences) {
    json j = base();
    j["metadata"] = {{"a", {{"x", 1}}}, {"b", {{"$ref", "#/metadata/a"}}}};
    EXPECT_TRUE(ingest(j).accepted());
}

TEST_F(CaptureTest, RejectsCircularReferences) {
    json j = base();
    j["metadata"] = {{"a", {{"$ref", "#/metadata/b"}}}, {"b", {{"$ref", "#/metadata/a"}}}};
    EXPECT_EQ(reason_of(ingest(j)), Reason::STRUCTURE);

    j = base();
    j["metadata"] = {{"loop", {{"child", {{"$ref", "#/metadata/loop"}}}}}};
    EXPECT_EQ(reason_of(ingest(j)), Reason::STRUCTURE);

    j = base();
    j["metadata"] = {{"self", {{"$ref", "#/metadata/self"}}}};
    EXPECT_EQ(reason_of(ingest(j)), Reason::STRUCTURE);
}

TEST_F(CaptureTest, RejectsDanglingAndLongChains) {
    json j = base();
    j["metadata"] = {{"a", {{"$ref", "#/metadata/missing"}}}};
    EXPECT_EQ(reason_of(ingest(j)), Reason::STRUCTURE);

    j = base();
    json meta = json::object();
    for (int i = 0; i < 40; ++i) {
        meta["n" + std::to_string(i)] = {{"$ref", "#/metadata/n" + std::to_string(i + 1)}};
    }
    meta["n40"] = {{"end", true}};
    j["metadata"] = meta;
    EXPECT_EQ(reason_of(ingest(j)), Reason::STRUCTURE);
}

TEST_F(CaptureTest, LargeCycleRejectedQuickly) {
    json j = base();
    json meta = json::object();
    for (int i = 0; i < 500; ++i) {
        meta["n" + std::to_string(i)] = {{"$ref", "#/metadata/n" + std::to_string((i + 1) % 500)}};
    }
    j["metadata"] = meta;
    auto start = std::chrono::steady_clock::now();
    auto r = ingest(j);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(reason_of(r), Reason::STRUCTURE);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
}

// ─── sanitization ───────────────────────────────────────────────────────────

TEST_F(CaptureTest, StripsControlAndBidiCharacters) {
    json j = base();
    j["response"]["text"] = std::string("safe") + "\xE2\x80\xAE" + "txt.exe" + "\x07" +
                          "\xEF\xBB\xBF" + " done\n";
    auto r = ingest(j);
    ASSERT_TRUE(r.accepted());
    EXPECT_TRUE(r.record->sanitized);
    EXPECT_EQ(r.record->response, "safetxt.exe done\n");
    EXPECT_EQ(capture.get_stats().sanitized.load(), 1u);
}

TEST_F(CaptureTest, TruncatesLongTextOnCodePointBoundary) {
    CaptureLimits limits;
    limits.max_text_bytes = 5;
    TelemetryCapture c(limits);
    json j = base();
    j["response"]["text"] = "abcd\xC3\xA9\xC3\xA9";
    auto r = c.ingest(j.dump());
    ASSERT_TRUE(r.accepted());
    EXPECT_TRUE(r.record->truncated);
    EXPECT_TRUE(r.record->sanitized);
    EXPECT_EQ(r.record->response, "abcd");
}

TEST(EnvelopeHelpersTest, Utf8AndIdentifiers) {
    EXPECT_TRUE(is_valid_utf8("plain \xC3\xA9"));
    EXPECT_FALSE(is_valid_utf8("\xC3\x28"));
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));       // surrogate
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));           // overlong
    EXPECT_TRUE(is_valid_identifier("a-b_c.d:e@f", 128));
    EXPECT_FALSE(is_valid_identifier("a b", 128));
    EXPECT_FALSE(is_valid_identifier(std::string(129, 'a'), 128));
}

TEST(EnvelopeHelpersTest, NestingScanIgnoresStrings) {
    EXPECT_EQ(scan_nesting_depth(R"({"a":"[[[[[[","b":[1,[2]]})"), 3u);
    EXPECT_EQ(scan_nesting_depth(R"({"a":"\"[[["})"), 1u);
}

// ─── ordering, rejections, spans ────────────────────────────────────────────

TEST_F(CaptureTest, SequenceMustAdvancePerConnection) {
    json j = base();
    j["sequence"] = 5;
    ASSERT_TRUE(ingest(j).accepted());

    j["record_id"] = "rec-2";
    j["sequence"] = 5;
    EXPECT_EQ(reason_of(ingest(j)), Reason::ORDERING);

    j["sequence"] = 6;
    EXPECT_TRUE(ingest(j).accepted());

    // Another connection has its own counter
    j["connection_id"] = "conn-2";
    j["sequence"] = 1;
    EXPECT_TRUE(ingest(j).accepted());
    EXPECT_EQ(capture.connection_count(), 2u);
}

TEST_F(CaptureTest, MissingSequenceIsAssigned) {
    auto a = ingest(base());
    auto b = ingest(base());
    ASSERT_TRUE(a.accepted());
    ASSERT_TRUE(b.accepted());
    EXPECT_EQ(a.record->sequence, 1u);
    EXPECT_EQ(b.record->sequence, 2u);
}

TEST_F(CaptureTest, SinkSeesRecordsInOrder) {
    std::vector<uint64_t> seen;
    capture.set_record_sink([&seen](const TrafficRecord& r) { seen.push_back(r.sequence); });
    for (int i = 1; i <= 5; ++i) {
        json j = base();
        j["sequence"] = i;
        ASSERT_TRUE(ingest(j).accepted());
    }
    EXPECT_EQ(seen, (std::vector<uint64_t>{1, 2, 3, 4, 5}));
}

TEST_F(CaptureTest, RejectionsAreCountedAndKept) {
    capture.ingest("nope");
    json j = base();
    j["identity"] = 7;
    ingest(j);

    auto counts = capture.rejection_counts();
    EXPECT_EQ(counts["undecodable"], 1u);
    EXPECT_EQ(counts["wrong_type"], 1u);
    auto recent = capture.recent_rejections();
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[1].record_id, "rec-1");
    EXPECT_EQ(recent[1].field, "identity");
    EXPECT_EQ(capture.get_stats().rejected.load(), 2u);
}

TEST_F(CaptureTest, PerCallCallbackRunsAfterSinkOnAcceptOnly) {
    std::vector<std::string> order;
    capture.set_record_sink([&order](const TrafficRecord& r) { order.push_back("sink:" + r.id); });
    auto r = capture.ingest(base().dump(), [&order](const TrafficRecord& r) {
        order.push_back("call:" + r.id);
    });
    ASSERT_TRUE(r.accepted());
    EXPECT_EQ(order, (std::vector<std::string>{"sink:rec-1", "call:rec-1"}));

    bool called = false;
    capture.ingest("nope", [&called](const TrafficRecord&) { called = true; });
    EXPECT_FALSE(called);
}

TEST_F(CaptureTest, IdleConnectionsAreForgotten) {
    for (int i = 0; i < 20; ++i) {
        json j = base();
        j["connection_id"] = "conn-" + std::to_string(i);
        j["sequence"] = 3;
        ASSERT_TRUE(ingest(j).accepted());
    }
    EXPECT_EQ(capture.connection_count(), 20u);
    EXPECT_EQ(capture.evict_idle_connections(Millis(60000)), 0u);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_EQ(capture.evict_idle_connections(Millis(1)), 20u);
    EXPECT_EQ(capture.connection_count(), 0u);

    // A forgotten connection starts its sequence over
    json j = base();
    j["connection_id"] = "conn-0";
    j["sequence"] = 1;
    EXPECT_TRUE(ingest(j).accepted());
    EXPECT_EQ(capture.connection_count(), 1u);
}

TEST(CaptureSweepTest, PeriodicSweepBoundsConnectionCount) {
    CaptureLimits limits;
    limits.connection_idle_ttl = Millis(1);
    TelemetryCapture capture(limits);
    TrafficRecord r;
    r.identity = "user-1";
    r.timestamp = Millis(1000);
    r.prompt = "hello";
    r.response = "hi";
    r.input_tokens = 1;
    r.output_tokens = 1;

    const uint64_t n = TelemetryCapture::kSweepInterval;
    for (uint64_t i = 0; i + 1 < n; ++i) {
        r.id = "rec-" + std::to_string(i);
        r.connection_id = "conn-" + std::to_string(i);
        ASSERT_TRUE(capture.ingest(serialize_envelope(r)).accepted());
    }
    EXPECT_EQ(capture.connection_count(), n - 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    r.id = "rec-last";
    r.connection_id = "conn-last";
    ASSERT_TRUE(capture.ingest(serialize_envelope(r)).accepted());
    EXPECT_EQ(capture.connection_count(), 1u);
}

TEST(CaptureSpanTest, ExportsOneSpanPerRecord) {
    auto exporter = std::make_shared<InMemorySpanExporter>();
    TelemetryCapture capture(CaptureLimits{}, exporter);
    TrafficRecord rec;
    rec.id = "r1";
    rec.identity = "u1";
    rec.connection_id = "c1";
    rec.timestamp = Millis(1000);
    rec.latency = Millis(250);
    rec.prompt = "a";
    rec.response = "b";
    rec.output_tokens = 9;
    ASSERT_TRUE(capture.ingest(serialize_envelope(rec)).accepted());

    auto spans = exporter->spans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].name, "llm.proxy.exchange");
    EXPECT_EQ(spans[0].trace_id.size(), 32u);
    EXPECT_EQ(spans[0].span_id.size(), 16u);
    EXPECT_EQ(spans[0].end_ms - spans[0].start_ms, 250);
    EXPECT_EQ(spans[0].attributes.at("llm.usage.output_tokens"), "9");
}
