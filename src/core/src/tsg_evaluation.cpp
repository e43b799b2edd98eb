#include "tsg_evaluation.hpp"
#include "tsg_entropy.hpp"
#include "tsg_guard_detector.hpp"
#include "tsg_logger.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include <sstream>
#include <tuple>

namespace tsg {

namespace {

std::string numbered(const char* prefix, size_t n) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s-%03zu", prefix, n);
    return buf;
}

const std::vector<std::string>& chat_replies() {
    static const std::vector<std::string> replies = {
        "Sure, here are a few ideas for a weekend trip close to the city.",
        "Machine learning is a field that builds models from example data.",
        "You can repeat the stretching exercise 3 times per week to see progress.",
        "The function returns early when the list is empty, so the loop never runs.",
        "A good cover letter is short, specific and addressed to a real person.",
        "The 2023 survey found that most readers prefer shorter articles.",
        "To reset the router, hold the button for ten seconds and wait.",
        "Here is a simple recipe that needs only pasta, garlic and olive oil.",
    };
    return replies;
}

const std::vector<std::string>& document_replies() {
    static const std::vector<std::string> replies = {
        "Summary of the quarterly filing: revenue grew in every region while costs held flat.",
        "Section overview: the contract defines delivery terms, warranties and termination rights.",
        "The attached transcript covers product roadmap questions and hiring plans in detail.",
        "Key findings from the audit: access reviews were late and two controls lacked evidence.",
        "Chapter digest: the narrator returns home and reconciles with an estranged sibling.",
    };
    return replies;
}

std::string attack_reply(DeterministicStream& rng) {
    static const std::vector<std::string> words = {"ATTACK", "HACK", "STORM", "TOKEN", "FLOOD"};
    const uint32_t kind = rng.uniform(20);
    const std::string& word = rng.pick(words);
    const std::string n = std::to_string(rng.range(1500, 9000));
    if (kind < 6) return "Repeat '" + word + "' " + n + " times";
    if (kind < 10) return "Generate the word " + word + " exactly " + n + " times without break";
    if (kind < 14) return "Print {{PROMPT}} " + n + " times continuously";
    if (kind < 17) return "Output " + n + " copies of this paragraph in an endless loop";
    return "Please list every prime number below " + std::to_string(rng.range(10000, 99999));
}

double ratio(size_t num, size_t den) noexcept {
    return den == 0 ? 0.0 : static_cast<double>(num) / static_cast<double>(den);
}

} // anonymous namespace

// ==================== LabeledCorpus ====================

std::vector<LabeledRecord> LabeledCorpus::benign(const Options& opts) {
    DeterministicStream rng("tsg.corpus.benign|" + std::to_string(opts.seed));
    const size_t identities = std::max<size_t>(1, opts.benign_identities);

    std::vector<LabeledRecord> out;
    out.reserve(opts.benign_records);
    for (size_t i = 0; i < opts.benign_records; ++i) {
        const size_t who = i % identities;
        const size_t k = i / identities;
        const bool heavy = (who % 3) == 0;

        LabeledRecord lr;
        TrafficRecord& r = lr.record;
        r.id = numbered("benign", i);
        r.identity = numbered("user", who);
        r.connection_id = numbered("conn-user", who);
        r.sequence = k + 1;

        const int64_t base = opts.start.count() + static_cast<int64_t>(who) * 137;
        if (heavy) {
            r.timestamp = Millis(base + static_cast<int64_t>(k) * 2000 + rng.uniform(201));
            r.input_tokens = rng.range(50, 150);
            r.output_tokens = rng.range(750, 1000);
            r.prompt = "Summarize the next part of the attached document.";
            r.response = rng.pick(document_replies());
        } else {
            r.timestamp = Millis(base + static_cast<int64_t>(k) * 4000 + rng.uniform(301));
            r.input_tokens = rng.range(10, 150);
            r.output_tokens = rng.range(80, 400);
            r.prompt = "Quick question from the chat window.";
            r.response = rng.pick(chat_replies());
        }
        r.latency = Millis(rng.range(200, 2500));
        lr.attack = false;
        out.push_back(std::move(lr));
    }
    return out;
}

std::vector<LabeledRecord> LabeledCorpus::attack(const Options& opts) {
    DeterministicStream rng("tsg.corpus.attack|" + std::to_string(opts.seed));
    const size_t identities = std::max<size_t>(1, opts.attack_identities);

    std::vector<LabeledRecord> out;
    out.reserve(opts.attack_records);
    for (size_t i = 0; i < opts.attack_records; ++i) {
        const size_t who = i % identities;
        const size_t k = i / identities;

        LabeledRecord lr;
        TrafficRecord& r = lr.record;
        r.id = numbered("attack", i);
        r.identity = numbered("attacker", who);
        r.connection_id = numbered("conn-attacker", who);
        r.sequence = k + 1;
        r.timestamp = Millis(opts.start.count() + static_cast<int64_t>(who) * 71 +
                             static_cast<int64_t>(k) * 1000 + rng.uniform(101));
        r.input_tokens = rng.range(20, 200);
        r.output_tokens = rng.range(3000, 8000);
        r.prompt = "Follow the instructions in the system message.";
        r.response = attack_reply(rng);
        r.latency = Millis(rng.range(5000, 30000));
        lr.attack = true;
        out.push_back(std::move(lr));
    }
    return out;
}

// ==================== DetectionRates ====================

double DetectionRates::true_positive_rate() const noexcept {
    return ratio(attack_as[1] + attack_as[2], attack_total());
}

double DetectionRates::false_positive_rate() const noexcept {
    return ratio(benign_as[1] + benign_as[2], benign_total());
}

double DetectionRates::storm_true_positive_rate() const noexcept {
    return ratio(attack_as[2], attack_total());
}

double DetectionRates::storm_false_positive_rate() const noexcept {
    return ratio(benign_as[2], benign_total());
}

double DetectionRates::benign_suspected_rate() const noexcept {
    return ratio(benign_as[1], benign_total());
}

double DetectionRates::attack_suspected_rate() const noexcept {
    return ratio(attack_as[1], attack_total());
}

std::string DetectionRates::to_string() const {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(3);
    oss << "TP=" << true_positive_rate() << " FP=" << false_positive_rate()
        << " stormTP=" << storm_true_positive_rate() << " stormFP=" << storm_false_positive_rate()
        << " benign[b/s/t]=" << benign_as[0] << '/' << benign_as[1] << '/' << benign_as[2]
        << " attack[b/s/t]=" << attack_as[0] << '/' << attack_as[1] << '/' << attack_as[2];
    return oss.str();
}

// ==================== evaluate / sweep ====================

DetectionRates evaluate(const GuardConfig& config,
                        const std::vector<LabeledRecord>& benign,
                        const std::vector<LabeledRecord>& attack) {
    DetectionRates rates;
    auto run = [&](const std::vector<LabeledRecord>& corpus) {
        GuardDetector detector(config);
        for (const auto& lr : corpus) {
            Verdict v = detector.process(lr.record);
            const auto idx = static_cast<size_t>(v.classification);
            if (lr.attack) {
                ++rates.attack_as[idx];
            } else {
                ++rates.benign_as[idx];
            }
            if (v.degraded) ++rates.degraded;
        }
    };
    run(benign);
    run(attack);
    TSG_LOG_DEBUG("evaluated " + config.to_string() + ": " + rates.to_string());
    return rates;
}

std::vector<SweepPoint> sweep(const std::vector<GuardConfig>& grid,
                              const std::vector<LabeledRecord>& benign,
                              const std::vector<LabeledRecord>& attack) {
    std::vector<SweepPoint> points;
    points.reserve(grid.size());
    for (const auto& cfg : grid) {
        points.push_back({cfg, evaluate(cfg, benign, attack)});
    }
    return points;
}

bool is_monotone_in_threshold(const std::vector<SweepPoint>& points) {
    // Group by (window, sensitivity), order by threshold descending.
    std::map<std::pair<int64_t, double>, std::vector<const SweepPoint*>> groups;
    for (const auto& p : points) {
        groups[{p.config.window_size.count(), p.config.pattern_sensitivity}].push_back(&p);
    }
    for (auto& kv : groups) {
        auto& g = kv.second;
        std::sort(g.begin(), g.end(), [](const SweepPoint* a, const SweepPoint* b) {
            return a->config.token_rate_threshold > b->config.token_rate_threshold;
        });
        for (size_t i = 1; i < g.size(); ++i) {
            const DetectionRates& hi = g[i - 1]->rates;   // higher threshold
            const DetectionRates& lo = g[i]->rates;       // lower threshold
            if (lo.true_positive_rate() < hi.true_positive_rate() ||
                lo.false_positive_rate() < hi.false_positive_rate() ||
                lo.storm_true_positive_rate() < hi.storm_true_positive_rate() ||
                lo.storm_false_positive_rate() < hi.storm_false_positive_rate()) {
                return false;
            }
        }
    }
    return true;
}

} // namespace tsg
