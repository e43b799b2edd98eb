#include "tsg_config.hpp"
#include "tsg_errors.hpp"
#include "tsg_logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tsg {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

[[noreturn]] void badValue(const std::string& key, const std::string& v, const char* kind) {
    throw ConfigError("config key '" + key + "' = '" + v + "' is not a valid " + kind);
}

} // anonymous namespace

Config::Config(const Config& other) {
    std::lock_guard<std::mutex> lock(other.mtx_);
    values_ = other.values_;
}

Config& Config::operator=(const Config& other) {
    if (this == &other) return *this;
    std::map<std::string, std::string> copy;
    {
        std::lock_guard<std::mutex> lock(other.mtx_);
        copy = other.values_;
    }
    std::lock_guard<std::mutex> lock(mtx_);
    values_ = std::move(copy);
    return *this;
}

std::string Config::get(const std::string& key, const std::string& default_val) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = values_.find(key);
    return (it != values_.end()) ? it->second : default_val;
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return values_.count(key) != 0;
}

int64_t Config::getInt(const std::string& key, int64_t default_val) const {
    std::string v = get(key);
    if (v.empty()) return default_val;
    size_t pos = 0;
    int64_t out = 0;
    try {
        out = std::stoll(v, &pos);
    } catch (const std::exception&) {
        badValue(key, v, "integer");
    }
    if (pos != v.size()) badValue(key, v, "integer");
    return out;
}

uint64_t Config::getUInt(const std::string& key, uint64_t default_val) const {
    std::string v = get(key);
    if (v.empty()) return default_val;
    if (v[0] == '-') badValue(key, v, "unsigned integer");
    size_t pos = 0;
    uint64_t out = 0;
    try {
        out = std::stoull(v, &pos);
    } catch (const std::exception&) {
        badValue(key, v, "unsigned integer");
    }
    if (pos != v.size()) badValue(key, v, "unsigned integer");
    return out;
}

double Config::getDouble(const std::string& key, double default_val) const {
    std::string v = get(key);
    if (v.empty()) return default_val;
    size_t pos = 0;
    double out = 0.0;
    try {
        out = std::stod(v, &pos);
    } catch (const std::exception&) {
        badValue(key, v, "number");
    }
    if (pos != v.size() || !std::isfinite(out)) badValue(key, v, "number");
    return out;
}

bool Config::getBool(const std::string& key, bool default_val) const {
    std::string v = get(key);
    if (v.empty()) return default_val;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    badValue(key, v, "boolean");
}

std::vector<std::string> Config::keys() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto& kv : values_) out.push_back(kv.first);
    return out;
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    values_[key] = value;
}

void Config::setDouble(const std::string& key, double value) {
    std::ostringstream oss;
    oss.precision(17);
    oss << value;
    set(key, oss.str());
}

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(mtx_);
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (!key.empty()) values_[key] = val;
    }
    return true;
}

bool Config::saveToFile(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ofstream file(path);
    if (!file.is_open()) return false;

    file << "# tsguard configuration\n\n";
    for (const auto& [k, v] : values_) {
        file << k << " = " << v << "\n";
    }
    return true;
}

std::string Config::envNameFor(const std::string& key, const std::string& prefix) {
    std::string name = prefix;
    for (char c : key) {
        if (c == '.' || c == '-') {
            name += '_';
        } else {
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return name;
}

size_t Config::applyEnvironment(const std::string& prefix) {
    size_t applied = 0;
    for (const auto& key : keys()) {
        const char* env = std::getenv(envNameFor(key, prefix).c_str());
        if (env == nullptr) continue;
        set(key, env);
        ++applied;
        TSG_LOG_DEBUG("config override from environment: " + key);
    }
    return applied;
}

void Config::loadDefaults() {
    std::lock_guard<std::mutex> lock(mtx_);
    values_["log.level"] = "info";
    values_["log.file"] = "";
    values_["log.console"] = "true";

    // Example tuning only; re-validate against your own traffic.
    values_["guard.window_size_ms"] = "8000";
    values_["guard.token_rate_threshold"] = "800";
    values_["guard.pattern_sensitivity"] = "0.85";
    values_["guard.max_scan_bytes"] = "16384";
    values_["guard.max_window_records"] = "4096";
    values_["guard.identity_idle_ttl_ms"] = "300000";
    values_["guard.block_on"] = "token_storm";
    values_["guard.hard_block_rate_multiplier"] = "4.0";

    values_["capture.max_raw_bytes"] = "1048576";
    values_["capture.max_text_bytes"] = "65536";
    values_["capture.max_nesting_depth"] = "64";
    values_["capture.max_ref_hops"] = "16";
    values_["capture.max_tokens_per_record"] = "1000000";
    values_["capture.max_identifier_length"] = "128";
    values_["capture.connection_idle_ttl_ms"] = "300000";

    values_["service.lanes"] = "4";
    values_["service.request_timeout_ms"] = "500";
    values_["service.restart_delay_ms"] = "100";
    values_["service.max_restarts"] = "5";
    values_["service.connection_limit"] = "256";

    values_["mutation.bit_flip.enabled"] = "true";
    values_["mutation.encoding_corruption.enabled"] = "true";
    values_["mutation.structural_corruption.enabled"] = "true";
    values_["mutation.size_corruption.enabled"] = "true";
    values_["mutation.type_corruption.enabled"] = "true";
    values_["mutation.boundary_value.enabled"] = "true";
    values_["mutation.protocol_violation.enabled"] = "true";
    values_["mutation.injection_payload.enabled"] = "true";
    values_["mutation.intensity"] = "0.5";
    values_["mutation.seeds_per_category"] = "8";
    values_["mutation.base_seed"] = "1";

    values_["chaos.driver"] = "in_process";
    values_["chaos.sample_interval_ms"] = "50";
    values_["chaos.required_successes"] = "3";
    values_["chaos.ceiling_ms"] = "5000";
    values_["chaos.drain_timeout_ms"] = "1000";
    values_["chaos.memory_tolerance"] = "1.5";
    values_["chaos.connection_tolerance"] = "2.0";
    values_["chaos.max_restarts"] = "3";
    values_["chaos.memory_slack_bytes"] = "1048576";
    values_["chaos.connection_slack"] = "4";
    values_["chaos.target"] = "tsguard";
    values_["chaos.fault_duration_ms"] = "300";
    values_["chaos.pid"] = "0";
    values_["chaos.command"] = "";
    values_["chaos.command_timeout_ms"] = "1000";

    values_["replay.enabled"] = "true";
    values_["replay.threads"] = "4";
    values_["replay.identities"] = "8";
    values_["replay.records_per_mode"] = "64";
    values_["replay.step_ms"] = "50";
    values_["replay.max_skew_ms"] = "3600000";
    values_["replay.timeout_records"] = "2";
    values_["replay.settle_timeout_ms"] = "2000";
    values_["replay.seed"] = "1";

    values_["scoring.pass_threshold"] = "0.75";
    values_["scoring.max_spread"] = "0.5";
    values_["scoring.sla_ms"] = "2000";
    values_["scoring.mutation_time_bound_ms"] = "250";
    values_["scoring.weight.accuracy"] = "0.7";
    values_["scoring.weight.latency"] = "0.3";
    values_["scoring.weight.recovery"] = "0.4";
    values_["scoring.weight.health"] = "0.2";
    values_["scoring.weight.requests"] = "0.2";
    values_["scoring.weight.integrity"] = "0.2";
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    values_.clear();
}

} // namespace tsg
