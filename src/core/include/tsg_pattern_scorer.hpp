#pragma once

/**
 * @file tsg_pattern_scorer.hpp
 * @brief Token-storm pattern scoring over response text
 */

#include <cstdint>
#include <map>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace tsg {

struct PatternReport {
    double score = 0.0;                         // [0, 1]
    std::map<std::string, size_t> matches;      // family -> match count
    std::string primary_pattern;                // family with most matches, "" if none
    uint64_t max_repetition = 0;                // largest "N times" / "N copies"
    std::vector<uint64_t> numeric_amplifiers;   // standalone numbers with 3+ digits
    size_t suspicious_keywords = 0;
    size_t scanned_bytes = 0;
    bool truncated = false;                     // input longer than the scan limit

    std::vector<std::string> matched_families() const;
};

/**
 * @brief Pluggable text -> score function
 *
 * Implementations must be deterministic and safe to call concurrently.
 * Failures are reported by throwing PatternEngineError.
 */
class IPatternScorer {
public:
    virtual ~IPatternScorer() = default;
    virtual PatternReport score(std::string_view text) const = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Regex catalogue scorer
 *
 * Families: repeat_command, template_injection, amplification_keywords,
 * infinite_loops, massive_repetition, resource_exhaustion,
 * recursive_patterns. Only the first max_scan_bytes of the text are
 * examined, in line-sized segments, so cost stays linear in the limit.
 * A line longer than kSegmentBytes is cut into segments that overlap by
 * kSegmentOverlap bytes; a match lying wholly inside the overlap is only
 * counted by the segment before it.
 */
class RegexPatternScorer : public IPatternScorer {
public:
    explicit RegexPatternScorer(size_t max_scan_bytes = 16384);

    PatternReport score(std::string_view text) const override;
    std::string name() const override { return "regex"; }

    size_t max_scan_bytes() const noexcept { return max_scan_bytes_; }

    static constexpr size_t kSegmentBytes = 1024;
    static constexpr size_t kSegmentOverlap = 256;

private:
    struct Family {
        std::string name;
        std::regex  re;
        int         weight;        // points out of 100
        bool        repetition;    // capture groups carry repetition counts
        bool        keyword;       // counts toward keyword density
    };

    void scan_segment(const std::string& segment, size_t seen_prefix, PatternReport& report) const;

    size_t max_scan_bytes_;
    std::vector<Family> families_;
    std::regex numeric_re_;
};

} // namespace tsg
