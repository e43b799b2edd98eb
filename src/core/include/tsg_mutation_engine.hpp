#pragma once

/**
 * @file tsg_mutation_engine.hpp
 * @brief Deterministic adversarial-input generation for the capture path
 *
 * (base record, category, intensity, seed) -> MutationCase, byte-identical
 * across runs and machines. The random stream is derived from a BLAKE2b
 * digest of the base envelope and the parameters.
 */

#include "tsg_capture.hpp"
#include "tsg_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tsg {

class Config;

namespace Chaos {

enum class MutationCategory {
    BIT_FLIP,
    ENCODING_CORRUPTION,
    STRUCTURAL_CORRUPTION,
    SIZE_CORRUPTION,
    TYPE_CORRUPTION,
    BOUNDARY_VALUE,
    PROTOCOL_VIOLATION,
    INJECTION_PAYLOAD
};

const char* category_to_string(MutationCategory c) noexcept;
std::optional<MutationCategory> category_from_string(const std::string& s) noexcept;
const std::vector<MutationCategory>& all_categories();

enum class ExpectedHandling {
    REJECT,     // capture must reject with MalformedInputError
    SANITIZE,   // accepted with the sanitized flag set
    PASS        // accepted unchanged
};

const char* handling_to_string(ExpectedHandling h) noexcept;

enum class MutationStatus {
    APPLIED,
    INAPPLICABLE
};

struct MutationCase {
    std::string base_record_id;
    std::string base_digest;           // BLAKE2b of the base envelope
    MutationCategory category = MutationCategory::BIT_FLIP;
    double intensity = 0.0;
    uint64_t seed = 0;

    MutationStatus status = MutationStatus::APPLIED;
    std::string inapplicable_reason;

    std::string payload;               // raw envelope bytes handed to capture
    ExpectedHandling expected = ExpectedHandling::REJECT;
    std::string variant;               // which corruption was chosen
    std::vector<std::string> mutation_points;

    bool applied() const noexcept { return status == MutationStatus::APPLIED; }

    /// BLAKE2b of the payload, for quick identity checks.
    std::string digest() const;

    /// "base=<id> category=<c> intensity=<i> seed=<s>"
    std::string reproduction() const;
};

struct MutationSettings {
    std::map<MutationCategory, bool> enabled;
    double intensity = 0.5;
    size_t seeds_per_category = 8;
    uint64_t base_seed = 1;

    MutationSettings();

    bool is_enabled(MutationCategory c) const;

    /// Build from "mutation.*" keys. Throws ConfigError on invalid values.
    static MutationSettings from_config(const Config& cfg);
};

class MutationEngine {
public:
    explicit MutationEngine(CaptureLimits limits = {});

    /// Throws std::invalid_argument if @p intensity is not a finite value in [0, 1].
    MutationCase mutate(const TrafficRecord& base, MutationCategory category,
                        double intensity, uint64_t seed) const;

    /// Every enabled category x seeds_per_category for every base record.
    std::vector<MutationCase> generate(const std::vector<TrafficRecord>& bases,
                                       const MutationSettings& settings) const;

    const CaptureLimits& limits() const noexcept { return limits_; }

private:
    CaptureLimits limits_;
};

} // namespace Chaos
} // namespace tsg
