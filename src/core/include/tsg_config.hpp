#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <vector>
#include <mutex>

namespace tsg {

/**
 * @brief Runtime configuration store for tsguard
 *
 * Flat "section.key = value" store holding guard thresholds, capture limits,
 * mutation switches, fault-injection timings and scoring weights.
 * Values come from defaults, then an optional file, then TSG_* environment
 * overrides (guard.window_size_ms -> TSG_GUARD_WINDOW_SIZE_MS).
 *
 * Numeric getters throw ConfigError when a present value does not parse;
 * a silently-defaulted threshold would change detection behaviour.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    Config() { loadDefaults(); }

    Config(const Config& other);
    Config& operator=(const Config& other);

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const;
    bool has(const std::string& key) const;

    int64_t getInt(const std::string& key, int64_t default_val = 0) const;
    uint64_t getUInt(const std::string& key, uint64_t default_val = 0) const;
    double getDouble(const std::string& key, double default_val = 0.0) const;
    bool getBool(const std::string& key, bool default_val = false) const;

    std::vector<std::string> keys() const;

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int64_t value) { set(key, std::to_string(value)); }
    void setDouble(const std::string& key, double value);
    void setBool(const std::string& key, bool value) { set(key, value ? "true" : "false"); }

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path);
    bool saveToFile(const std::string& path) const;

    /// Apply TSG_* environment overrides for every known key.
    /// Returns the number of keys overridden.
    size_t applyEnvironment(const std::string& prefix = "TSG_");

    static std::string envNameFor(const std::string& key, const std::string& prefix = "TSG_");

    // ==================== Defaults ====================
    void loadDefaults();
    void clear();

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace tsg
