#include "tsg_pattern_scorer.hpp"
#include "tsg_errors.hpp"

#include <algorithm>
#include <cctype>

namespace tsg {

namespace {

// Scores are accumulated in integer points so that thresholds such as 0.9
// compare exactly.
constexpr int kFamilyCap          = 55;
constexpr int kRepetitionHigh     = 35;   // max_repetition > 1000
constexpr int kRepetitionMedium   = 20;   // max_repetition > 100
constexpr int kLargeNumber        = 10;   // any standalone number > 1000
constexpr int kKeywordDensity     = 10;   // > 10% of words are suspicious

uint64_t parse_count(const std::string& digits) {
    if (digits.empty()) return 0;
    if (digits.size() > 18) return UINT64_MAX;
    uint64_t v = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return 0;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    return v;
}

size_t count_words(std::string_view text) {
    size_t words = 0;
    bool in_word = false;
    for (char c : text) {
        bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
        if (!space && !in_word) ++words;
        in_word = !space;
    }
    return words;
}

} // anonymous namespace

std::vector<std::string> PatternReport::matched_families() const {
    std::vector<std::string> out;
    for (const auto& kv : matches) out.push_back(kv.first);
    return out;
}

RegexPatternScorer::RegexPatternScorer(size_t max_scan_bytes)
    : max_scan_bytes_(max_scan_bytes)
{
    const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    try {
        families_.push_back({"repeat_command",
            std::regex(R"((?:repeat|generate|print|output|create|execute)\s+.*?(\d+)\s+times?)", flags),
            45, true, false});
        families_.push_back({"template_injection",
            std::regex(R"(\{\{.*?PROMPT.*?\}\}.*?(\d+))", flags),
            45, false, false});
        families_.push_back({"amplification_keywords",
            std::regex(R"((?:storm|flood|overflow|amplification|explosion|bomb)\s+.*?(\d+))", flags),
            25, false, true});
        families_.push_back({"infinite_loops",
            std::regex(R"((?:infinite|endless|continuously|without.*?break|loop.*?forever))", flags),
            40, false, true});
        families_.push_back({"massive_repetition",
            std::regex(R"((?:exactly|precisely)\s+(\d+)\s+times|(\d+)\s+(?:copies|iterations))", flags),
            35, true, false});
        families_.push_back({"resource_exhaustion",
            std::regex(R"((?:exhaustion|consumption|overload|thrashing|starvation))", flags),
            20, false, true});
        families_.push_back({"recursive_patterns",
            std::regex(R"((?:recursive|nested|exponential|cascade))", flags),
            25, false, true});
        numeric_re_ = std::regex(R"(\b(\d{3,})\b)", std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw PatternEngineError(std::string("pattern catalogue failed to compile: ") + e.what());
    }
}

void RegexPatternScorer::scan_segment(const std::string& segment, size_t seen_prefix,
                                      PatternReport& report) const {
    auto is_new = [seen_prefix](const std::smatch& m) {
        return static_cast<size_t>(m.position(0) + m.length(0)) > seen_prefix;
    };
    for (const auto& fam : families_) {
        auto begin = std::sregex_iterator(segment.begin(), segment.end(), fam.re);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            if (!is_new(*it)) continue;
            ++report.matches[fam.name];
            if (fam.keyword) ++report.suspicious_keywords;
            if (fam.repetition) {
                for (size_t g = 1; g < it->size(); ++g) {
                    if ((*it)[g].matched) {
                        report.max_repetition = std::max(report.max_repetition,
                                                         parse_count((*it)[g].str()));
                    }
                }
            }
        }
    }
    auto begin = std::sregex_iterator(segment.begin(), segment.end(), numeric_re_);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        if (!is_new(*it)) continue;
        report.numeric_amplifiers.push_back(parse_count((*it)[1].str()));
    }
}

PatternReport RegexPatternScorer::score(std::string_view text) const {
    PatternReport report;
    report.truncated = text.size() > max_scan_bytes_;
    std::string_view scan = text.substr(0, std::min(text.size(), max_scan_bytes_));
    report.scanned_bytes = scan.size();

    try {
        size_t pos = 0;
        size_t seen = 0;
        while (pos < scan.size()) {
            size_t nl = scan.find('\n', pos);
            size_t line_end = (nl == std::string_view::npos) ? scan.size() : nl;
            size_t end = std::min(line_end, pos + kSegmentBytes);
            if (end > pos) {
                scan_segment(std::string(scan.substr(pos, end - pos)), seen, report);
            }
            if (end < line_end) {
                // Cut inside a line: step back so an instruction across the cut is seen whole.
                seen = std::min(kSegmentOverlap, end - pos);
                pos = end - seen;
            } else {
                seen = 0;
                pos = end + 1;
            }
        }
    } catch (const std::regex_error& e) {
        throw PatternEngineError(std::string("pattern evaluation failed: ") + e.what());
    }

    int family_points = 0;
    size_t best = 0;
    for (const auto& fam : families_) {
        auto it = report.matches.find(fam.name);
        if (it == report.matches.end()) continue;
        family_points += fam.weight;
        if (it->second > best) {
            best = it->second;
            report.primary_pattern = fam.name;
        }
    }

    int points = std::min(family_points, kFamilyCap);
    if (report.max_repetition > 1000) {
        points += kRepetitionHigh;
    } else if (report.max_repetition > 100) {
        points += kRepetitionMedium;
    }
    if (std::any_of(report.numeric_amplifiers.begin(), report.numeric_amplifiers.end(),
                    [](uint64_t n) { return n > 1000; })) {
        points += kLargeNumber;
    }
    size_t words = count_words(scan);
    if (words > 0 && report.suspicious_keywords * 10 > words) {
        points += kKeywordDensity;
    }

    report.score = static_cast<double>(std::min(points, 100)) / 100.0;
    return report;
}

} // namespace tsg
