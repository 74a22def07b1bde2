#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <mutex>

namespace rdx {

/**
 * @brief Runtime configuration store for RDX
 *
 * Flat key = value settings loaded from a file on top of built-in
 * defaults: listeners, logging, authentication, protocol limits and
 * batch delay overrides. Thread-safe singleton; read once at start-up
 * into an immutable ServerOptions.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    // Prevent copying
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    std::optional<std::string> find(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    int getInt(const std::string& key, int default_val = 0) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        try { return std::stoi(v); }
        catch (const std::exception&) { return default_val; }
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(), ::tolower);
        return (v == "true" || v == "1" || v == "yes" || v == "on");
    }

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    void setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    void setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    void erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.erase(key);
    }

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ifstream file(path);
        if (!file.is_open()) return false;

        std::string line;
        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            val.erase(0, val.find_first_not_of(" \t"));
            val.erase(val.find_last_not_of(" \t\r") + 1);

            values_[key] = val;
        }
        return true;
    }

    bool saveToFile(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ofstream file(path);
        if (!file.is_open()) return false;

        file << "# RDX server configuration\n";
        file << "# Auto-generated\n\n";
        for (const auto& [k, v] : values_) {
            file << k << " = " << v << "\n";
        }
        return true;
    }

    // ==================== Defaults ====================
    // Batch delay bounds are deliberately absent: their defaults live with
    // the bound definitions so that an unset key resolves to them.
    void loadDefaults() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_["log.level"] = "info";
        values_["log.file"] = "";
        values_["log.console"] = "true";
        values_["server.bind"] = "tcp://127.0.0.1:14500";
        values_["server.workers"] = "4";
        values_["auth.mode"] = "none";
        values_["auth.max_attempts"] = "3";
        values_["auth.timeout_ms"] = "10000";
        values_["protocol.compressor"] = "zlib";
        values_["protocol.compression_level"] = "1";
        values_["protocol.chunk_threshold"] = "4096";
        values_["protocol.max_packet_size"] = "268435456";
        values_["encryption.enabled"] = "false";
        values_["discovery.static"] = "false";
        values_["discovery.static_peers"] = "";
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.clear();
    }

private:
    Config() { loadDefaults(); }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

// ===== Configuration sources =====

/**
 * @brief Read-only key to string lookup used for named setting overrides.
 *
 * Keys use the dotted file form ("batch.min_delay").
 */
class ConfigSource {
public:
    virtual ~ConfigSource() = default;
    virtual std::optional<std::string> lookup(const std::string& key) const = 0;
    virtual std::string describe() const = 0;
};

/// Process environment: "batch.min_delay" is read from RDX_BATCH_MIN_DELAY.
class EnvConfigSource : public ConfigSource {
public:
    explicit EnvConfigSource(std::string prefix = "RDX_");

    std::optional<std::string> lookup(const std::string& key) const override;
    std::string describe() const override { return "environment"; }

    /// "batch.min_delay" -> "RDX_BATCH_MIN_DELAY"
    std::string variable_name(const std::string& key) const;

private:
    std::string prefix_;
};

/// The Config singleton (file values and defaults).
class StoreConfigSource : public ConfigSource {
public:
    explicit StoreConfigSource(const Config& config) : config_(config) {}

    std::optional<std::string> lookup(const std::string& key) const override {
        return config_.find(key);
    }
    std::string describe() const override { return "config"; }

private:
    const Config& config_;
};

/// Fixed map, mostly for tests and embedding.
class MapConfigSource : public ConfigSource {
public:
    MapConfigSource() = default;
    explicit MapConfigSource(std::map<std::string, std::string> values)
        : values_(std::move(values)) {}

    void set(const std::string& key, const std::string& value) { values_[key] = value; }
    void erase(const std::string& key) { values_.erase(key); }

    std::optional<std::string> lookup(const std::string& key) const override;
    std::string describe() const override { return "map"; }

private:
    std::map<std::string, std::string> values_;
};

/// First source that knows a key wins.
class LayeredConfigSource : public ConfigSource {
public:
    void add(std::shared_ptr<const ConfigSource> source);

    std::optional<std::string> lookup(const std::string& key) const override;
    std::string describe() const override;

private:
    std::vector<std::shared_ptr<const ConfigSource>> layers_;
};

// ===== Named integer settings =====

/// A named, overridable integer with its default and accepted range.
struct IntSetting {
    std::string key;
    int default_value;
    int min_value;
    int max_value;
};

/**
 * @brief Resolve an integer setting against a source.
 *
 * unset -> default; non numeric -> default (logged); numeric below min -> min;
 * numeric above max -> max; otherwise the value as given. Never throws.
 */
int resolve_int_setting(const ConfigSource& source, const IntSetting& setting);

int resolve_int_setting(const ConfigSource& source, const std::string& key,
                        int default_value, int min_value, int max_value);

/// Strict integer parse used by resolve_int_setting. Throws ConfigParseError.
long long parse_setting_integer(const std::string& key, const std::string& text);

} // namespace rdx
