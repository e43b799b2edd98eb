/**
 * @file test_mutation_engine.cpp
 * @brief Reproducible corruption recipes checked against the real capture path
 */

#include <gtest/gtest.h>
#include "tsg_capture.hpp"
#include "tsg_mutation_engine.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

using namespace tsg;
using namespace tsg::Chaos;

namespace {

TrafficRecord inline_base() {
    TrafficRecord r;
    r.id = "base-1";
    r.identity = "user-7";
    r.connection_id = "conn-7";
    r.timestamp = Millis(1700000000000);
    r.prompt = "Summarize this article about renewable energy.";
    r.response = "Solar and wind capacity grew again last year, led by new offshore projects.";
    r.input_tokens = 40;
    r.output_tokens = 120;
    r.latency = Millis(800);
    return r;
}

TrafficRecord ref_only_base() {
    TrafficRecord r = inline_base();
    r.id = "base-ref";
    r.prompt.clear();
    r.response.clear();
    r.prompt_ref = "blob://prompts/1";
    r.response_ref = "blob://responses/1";
    return r;
}

ExpectedHandling observed(const CaptureResult& r) {
    if (!r.accepted()) return ExpectedHandling::REJECT;
    return r.record->sanitized ? ExpectedHandling::SANITIZE : ExpectedHandling::PASS;
}

} // namespace

class MutationEngineTest : public ::testing::Test {
protected:
    MutationEngine engine;
};

// ─── reproducibility ────────────────────────────────────────────────────────

TEST_F(MutationEngineTest, SameInputsSameBytes) {
    for (MutationCategory c : all_categories()) {
        auto a = engine.mutate(inline_base(), c, 0.6, 42);
        auto b = engine.mutate(inline_base(), c, 0.6, 42);
        EXPECT_EQ(a.payload, b.payload) << category_to_string(c);
        EXPECT_EQ(a.digest(), b.digest());
        EXPECT_EQ(a.variant, b.variant);
        EXPECT_EQ(a.expected, b.expected);
        EXPECT_EQ(a.mutation_points, b.mutation_points);
    }
}

TEST_F(MutationEngineTest, SeedChangesTheCase) {
    std::set<std::string> digests;
    for (uint64_t seed = 1; seed <= 8; ++seed) {
        digests.insert(engine.mutate(inline_base(), MutationCategory::INJECTION_PAYLOAD, 1.0, seed).digest());
    }
    EXPECT_GT(digests.size(), 1u);
}

TEST_F(MutationEngineTest, ReproductionString) {
    auto mc = engine.mutate(inline_base(), MutationCategory::BIT_FLIP, 0.5, 42);
    EXPECT_EQ(mc.reproduction(), "base=base-1 category=bit_flip intensity=0.500000 seed=42");
    EXPECT_EQ(mc.base_record_id, "base-1");
    EXPECT_EQ(mc.base_digest.size(), 64u);
}

TEST_F(MutationEngineTest, ReproducedFromReportedParameters) {
    MutationSettings settings;
    settings.seeds_per_category = 3;
    settings.intensity = 0.7;
    auto cases = engine.generate({inline_base()}, settings);
    for (const auto& mc : cases) {
        auto again = engine.mutate(inline_base(), mc.category, mc.intensity, mc.seed);
        EXPECT_EQ(again.payload, mc.payload) << mc.reproduction();
    }
}

// ─── parameters ─────────────────────────────────────────────────────────────

TEST_F(MutationEngineTest, RejectsInvalidIntensity) {
    EXPECT_THROW(engine.mutate(inline_base(), MutationCategory::BIT_FLIP, -0.1, 1), std::invalid_argument);
    EXPECT_THROW(engine.mutate(inline_base(), MutationCategory::BIT_FLIP, 1.5, 1), std::invalid_argument);
    EXPECT_THROW(engine.mutate(inline_base(), MutationCategory::BIT_FLIP,
                               std::numeric_limits<double>::quiet_NaN(), 1), std::invalid_argument);
    EXPECT_NO_THROW(engine.mutate(inline_base(), MutationCategory::BIT_FLIP, 0.0, 1));
    EXPECT_NO_THROW(engine.mutate(inline_base(), MutationCategory::BIT_FLIP, 1.0, 1));
}

TEST_F(MutationEngineTest, EncodingNeedsInlineText) {
    auto mc = engine.mutate(ref_only_base(), MutationCategory::ENCODING_CORRUPTION, 0.5, 3);
    EXPECT_FALSE(mc.applied());
    EXPECT_EQ(mc.status, MutationStatus::INAPPLICABLE);
    EXPECT_FALSE(mc.inapplicable_reason.empty());
    EXPECT_TRUE(mc.payload.empty());
}

TEST_F(MutationEngineTest, CategoryNamesRoundTrip) {
    EXPECT_EQ(all_categories().size(), 8u);
    for (MutationCategory c : all_categories()) {
        auto parsed = category_from_string(category_to_string(c));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, c);
    }
    EXPECT_FALSE(category_from_string("gamma_ray").has_value());
}

TEST_F(MutationEngineTest, GenerateHonoursSettings) {
    MutationSettings settings;
    settings.seeds_per_category = 4;
    settings.intensity = 0.8;
    settings.enabled[MutationCategory::SIZE_CORRUPTION] = false;

    auto cases = engine.generate({inline_base(), ref_only_base()}, settings);
    EXPECT_EQ(cases.size(), 2u * 7u * 4u);
    for (const auto& mc : cases) {
        EXPECT_NE(mc.category, MutationCategory::SIZE_CORRUPTION);
        EXPECT_GT(mc.intensity, 0.0);
        EXPECT_LE(mc.intensity, 0.8);
    }
}

// ─── expected handling matches the capture path ─────────────────────────────

TEST_F(MutationEngineTest, ExpectedHandlingMatchesCapture) {
    TelemetryCapture capture;
    size_t checked = 0;
    for (const TrafficRecord& base : {inline_base(), ref_only_base()}) {
        for (MutationCategory c : all_categories()) {
            for (double intensity : {0.0, 0.25, 0.5, 0.75, 1.0}) {
                for (uint64_t seed = 1; seed <= 6; ++seed) {
                    auto mc = engine.mutate(base, c, intensity, seed);
                    if (!mc.applied()) continue;
                    auto result = capture.ingest(mc.payload);
                    EXPECT_EQ(observed(result), mc.expected)
                        << mc.reproduction() << " variant=" << mc.variant
                        << " got=" << handling_to_string(observed(result))
                        << (result.rejection ? " (" + result.rejection->message + ")" : std::string());
                    ++checked;
                }
            }
        }
    }
    EXPECT_GT(checked, 400u);
}

TEST_F(MutationEngineTest, StructuralCasesAreRejectedQuickly) {
    TelemetryCapture capture;
    for (uint64_t seed = 1; seed <= 16; ++seed) {
        auto mc = engine.mutate(inline_base(), MutationCategory::STRUCTURAL_CORRUPTION, 1.0, seed);
        ASSERT_TRUE(mc.applied());
        EXPECT_EQ(mc.expected, ExpectedHandling::REJECT);

        auto start = std::chrono::steady_clock::now();
        auto result = capture.ingest(mc.payload);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        ASSERT_FALSE(result.accepted());
        EXPECT_EQ(result.rejection->reason, MalformedInputError::Reason::STRUCTURE) << mc.variant;
        EXPECT_LT(elapsed.count(), 1000);
    }
}

TEST_F(MutationEngineTest, SeveralVariantsPerCategory) {
    for (MutationCategory c : {MutationCategory::BOUNDARY_VALUE, MutationCategory::PROTOCOL_VIOLATION,
                               MutationCategory::STRUCTURAL_CORRUPTION}) {
        std::set<std::string> variants;
        for (uint64_t seed = 1; seed <= 40; ++seed) {
            variants.insert(engine.mutate(inline_base(), c, 1.0, seed).variant);
        }
        EXPECT_GE(variants.size(), 3u) << category_to_string(c);
    }
}

TEST_F(MutationEngineTest, BaseTextShapedLikePlaceholderIsLeftAlone) {
    const std::set<std::string> spliced = {"float_overflow", "nan_literal", "infinity_literal",
                                           "negative_infinity_timestamp"};
    for (const char* marker : {"@@TSG_RAW_0@@", "@@TSG_RAW_0_0@@"}) {
        TrafficRecord base = inline_base();
        base.prompt = marker;
        const std::string kept = std::string("\"text\":\"") + marker + "\"";

        size_t splices = 0;
        for (uint64_t seed = 1; seed <= 200; ++seed) {
            auto mc = engine.mutate(base, MutationCategory::BOUNDARY_VALUE, 1.0, seed);
            ASSERT_TRUE(mc.applied());
            EXPECT_NE(mc.payload.find(kept), std::string::npos) << mc.reproduction() << " " << mc.variant;
            const size_t first = mc.payload.find("@@TSG_RAW_");
            EXPECT_EQ(mc.payload.find("@@TSG_RAW_", first + 1), std::string::npos) << mc.variant;
            if (spliced.count(mc.variant)) ++splices;
        }
        EXPECT_GT(splices, 0u) << marker;
    }
}
