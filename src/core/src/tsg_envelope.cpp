#include "tsg_envelope.hpp"
#include "tsg_errors.hpp"

#include <deque>
#include <set>
#include <utility>
#include <vector>

namespace tsg {

using json = nlohmann::json;

namespace {

// Decode one code point starting at s[i]. Returns byte length, 0 if invalid.
size_t decode_utf8(std::string_view s, size_t i, uint32_t& cp) noexcept {
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) {
        cp = b0;
        return 1;
    }
    size_t len;
    uint32_t min;
    if ((b0 & 0xE0) == 0xC0) {
        len = 2; cp = b0 & 0x1F; min = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3; cp = b0 & 0x0F; min = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4; cp = b0 & 0x07; min = 0x10000;
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF) return 0;
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
    return len;
}

bool is_stripped_code_point(uint32_t cp) noexcept {
    if (cp < 0x20) return cp != '\t' && cp != '\n' && cp != '\r';
    if (cp == 0x7F) return true;
    if (cp >= 0x80 && cp <= 0x9F) return true;          // C1 controls
    if (cp == 0xFEFF) return true;                      // BOM / ZWNBSP
    if (cp >= 0x200B && cp <= 0x200F) return true;      // zero-width, LRM, RLM
    if (cp >= 0x202A && cp <= 0x202E) return true;      // bidi embeddings/overrides
    if (cp >= 0x2066 && cp <= 0x2069) return true;      // bidi isolates
    return false;
}

std::string escape_pointer_token(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

// "target" covers "path" if it is the same node or one of its ancestors.
bool covers(const std::string& target, const std::string& path) {
    if (target.empty()) return true;
    if (path.size() < target.size()) return false;
    if (path.compare(0, target.size(), target) != 0) return false;
    return path.size() == target.size() || path[target.size()] == '/';
}

[[noreturn]] void structure_error(const std::string& path, const std::string& msg) {
    throw MalformedInputError(MalformedInputError::Reason::STRUCTURE,
                              path.empty() ? "metadata" : path, msg);
}

const json* ref_target_of(const json& node) {
    if (!node.is_object()) return nullptr;
    auto it = node.find("$ref");
    if (it == node.end()) return nullptr;
    return &*it;
}

} // anonymous namespace

json to_envelope(const TrafficRecord& rec) {
    json j;
    j["protocol"] = kEnvelopeProtocol;
    j["record_id"] = rec.id;
    j["identity"] = rec.identity;
    j["connection_id"] = rec.connection_id;
    if (rec.sequence > 0) j["sequence"] = rec.sequence;
    j["timestamp_ms"] = static_cast<int64_t>(rec.timestamp.count());

    json req;
    if (!rec.prompt_ref.empty() && rec.prompt.empty()) {
        req["text_ref"] = rec.prompt_ref;
    } else {
        req["text"] = rec.prompt;
    }
    req["tokens"] = rec.input_tokens;
    j["request"] = std::move(req);

    json resp;
    if (!rec.response_ref.empty() && rec.response.empty()) {
        resp["text_ref"] = rec.response_ref;
    } else {
        resp["text"] = rec.response;
    }
    resp["tokens"] = rec.output_tokens;
    resp["content_encoding"] = "identity";
    j["response"] = std::move(resp);

    j["latency_ms"] = static_cast<int64_t>(rec.latency.count());
    j["metadata"] = json::object();
    return j;
}

std::string serialize_envelope(const TrafficRecord& rec) {
    return to_envelope(rec).dump();
}

size_t scan_nesting_depth(std::string_view raw, size_t stop_after) {
    size_t depth = 0;
    size_t max_depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (char c : raw) {
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        switch (c) {
            case '"':
                in_string = true;
                break;
            case '{':
            case '[':
                ++depth;
                if (depth > max_depth) {
                    max_depth = depth;
                    if (max_depth > stop_after) return max_depth;
                }
                break;
            case '}':
            case ']':
                if (depth > 0) --depth;
                break;
            default:
                break;
        }
    }
    return max_depth;
}

bool is_valid_utf8(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size()) {
        uint32_t cp = 0;
        size_t len = decode_utf8(s, i, cp);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

bool is_valid_identifier(std::string_view s, size_t max_len) noexcept {
    if (s.empty() || s.size() > max_len) return false;
    for (char c : s) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') ||
                  c == '.' || c == '_' || c == ':' || c == '@' || c == '-';
        if (!ok) return false;
    }
    return true;
}

bool sanitize_text(std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool changed = false;
    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = 0;
        size_t len = decode_utf8(text, i, cp);
        if (len == 0) {
            // callers validate first; drop stray bytes rather than emit them
            changed = true;
            ++i;
            continue;
        }
        if (is_stripped_code_point(cp)) {
            changed = true;
        } else {
            out.append(text, i, len);
        }
        i += len;
    }
    if (changed) text.swap(out);
    return changed;
}

bool truncate_utf8(std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return false;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    text.resize(cut);
    return true;
}

void check_references(const json& root, size_t max_hops, size_t max_refs) {
    struct RefNode {
        std::string path;     // JSON pointer of the {"$ref": ...} object
        std::string target;   // final non-reference target after following chains
    };
    std::vector<RefNode> refs;

    // Breadth-first walk with an explicit queue.
    std::deque<std::pair<const json*, std::string>> queue;
    queue.emplace_back(&root, std::string());
    while (!queue.empty()) {
        auto [node, path] = std::move(queue.front());
        queue.pop_front();

        if (const json* ref = ref_target_of(*node)) {
            if (!ref->is_string()) structure_error(path, "$ref must be a string");
            if (refs.size() >= max_refs) structure_error(path, "too many $ref pointers");
            refs.push_back({path, std::string()});
        }
        if (node->is_object()) {
            for (auto it = node->begin(); it != node->end(); ++it) {
                if (it.value().is_structured()) {
                    queue.emplace_back(&it.value(), path + "/" + escape_pointer_token(it.key()));
                }
            }
        } else if (node->is_array()) {
            for (size_t i = 0; i < node->size(); ++i) {
                if ((*node)[i].is_structured()) {
                    queue.emplace_back(&(*node)[i], path + "/" + std::to_string(i));
                }
            }
        }
    }
    if (refs.empty()) return;

    // Follow each chain of references to its final target.
    for (auto& r : refs) {
        std::set<std::string> visited{r.path};
        const json* at = &root.at(json::json_pointer(r.path));
        size_t hops = 0;
        while (const json* ref = ref_target_of(*at)) {
            const std::string& spec = ref->get_ref<const std::string&>();
            if (spec.empty() || spec[0] != '#') {
                structure_error(r.path, "only document-local $ref pointers are supported");
            }
            std::string pointer = spec.substr(1);
            if (++hops > max_hops) structure_error(r.path, "$ref chain exceeds hop limit");
            if (!visited.insert(pointer).second || covers(pointer, r.path)) {
                structure_error(r.path, "circular $ref to " + spec);
            }
            try {
                at = &root.at(json::json_pointer(pointer));
            } catch (const json::exception&) {
                structure_error(r.path, "dangling $ref to " + spec);
            }
            r.target = pointer;
        }
    }

    // Expansion graph: r -> s when s lies inside the subtree r expands to.
    // Any cycle means expansion never terminates. Kahn's algorithm, no recursion.
    const size_t n = refs.size();
    std::vector<std::vector<size_t>> edges(n);
    std::vector<size_t> indegree(n, 0);
    for (size_t a = 0; a < n; ++a) {
        for (size_t b = 0; b < n; ++b) {
            if (covers(refs[a].target, refs[b].path)) {
                edges[a].push_back(b);
                ++indegree[b];
            }
        }
    }
    std::vector<size_t> ready;
    for (size_t i = 0; i < n; ++i) {
        if (indegree[i] == 0) ready.push_back(i);
    }
    size_t removed = 0;
    while (!ready.empty()) {
        size_t i = ready.back();
        ready.pop_back();
        ++removed;
        for (size_t j : edges[i]) {
            if (--indegree[j] == 0) ready.push_back(j);
        }
    }
    if (removed != n) {
        for (size_t i = 0; i < n; ++i) {
            if (indegree[i] > 0) structure_error(refs[i].path, "circular $ref expansion");
        }
    }
}

} // namespace tsg
