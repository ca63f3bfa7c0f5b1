#pragma once

/**
 * Config.hpp
 *
 * Downloader settings as one JSON document with built-in defaults.
 * Keys are addressed with dots: "downloads.retries".
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>
#include <stdexcept>

namespace modelfetch::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * A user file only needs the keys it changes: load() merge-patches it over
 * the current values. Typed reads never throw; a missing key or a value of
 * the wrong type yields the caller's default.
 */
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Built-in defaults
     */
    static json defaults() {
        return {
            {"version", "1.0.0"},
            {"downloads", {
                {"maxConcurrent", 4},
                {"retries", 3},
                {"retryDelay", 1000},
                {"timeout", 300000},
                {"resumeSupport", false},
                {"progressIntervalMs", 100},
                {"historyLimit", 100},
                {"userAgent", "ModelFetch/1.0"}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""},
                {"maxFileSizeMB", 10},
                {"maxFiles", 5}
            }}
        };
    }

    /**
     * Merge a JSON file over the current values
     * @return false if the file is missing, unreadable, not JSON or not an
     *         object; lastError() tells which
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::ifstream file(path);
        if (!file.is_open()) {
            m_lastError = "cannot open " + path;
            return false;
        }

        json loaded = json::parse(file, nullptr, false);
        if (loaded.is_discarded()) {
            m_lastError = path + " is not valid JSON";
            return false;
        }
        if (!loaded.is_object()) {
            m_lastError = path + " must contain a JSON object";
            return false;
        }

        m_config.merge_patch(loaded);
        m_configPath = path;
        m_lastError.clear();
        return true;
    }

    /**
     * Write the current values
     * @param path Target file; empty means the file last loaded
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            m_lastError = "no configuration file to save to";
            return false;
        }

        std::error_code ec;
        auto parent = std::filesystem::path(savePath).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                m_lastError = "cannot create " + parent.string() + ": " + ec.message();
                return false;
            }
        }

        std::ofstream file(savePath);
        file << m_config.dump(4);
        if (!file) {
            m_lastError = "cannot write " + savePath;
            return false;
        }
        return true;
    }

    /**
     * Forget everything loaded or set and return to defaults()
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
        m_configPath.clear();
        m_lastError.clear();
    }

    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto pointer = toJsonPointer(key);
        if (!m_config.contains(pointer)) {
            return defaultValue;
        }

        try {
            return m_config.at(pointer).get<T>();
        } catch (const json::type_error&) {
            return defaultValue;
        }
    }

    /**
     * Set a value, creating intermediate objects
     * @throws std::invalid_argument on an empty key or empty segment
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config.contains(toJsonPointer(key));
    }

    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    void merge(const json& other) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(other);
    }

    std::string lastError() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastError;
    }

private:
    Config() : m_config(defaults()) {}
    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * "downloads.retries" -> "/downloads/retries"
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        if (key.empty() || key.front() == '.' || key.back() == '.' ||
            key.find("..") != std::string::npos) {
            throw std::invalid_argument("invalid configuration key: '" + key + "'");
        }

        std::string pointer = "/";
        for (char c : key) {
            switch (c) {
                case '.': pointer += '/'; break;
                case '~': pointer += "~0"; break;
                case '/': pointer += "~1"; break;
                default:  pointer += c; break;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
    std::string m_lastError;
};

} // namespace modelfetch::core
