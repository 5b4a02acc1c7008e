#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class ConfigObserver;

/**
 * @brief Server configuration backed by Poco::Util::JSONConfiguration.
 *
 * Nested keys are addressed with dots ("youtube.read_timeout_seconds").
 * Every getter has a built-in default so a partial config file is valid.
 * The watcher thread reloads the file when its modification time changes
 * and notifies subscribed observers with the list of keys that changed.
 */
class PocoConfigManager
{
public:
    PocoConfigManager();
    ~PocoConfigManager();
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    // Core file operations
    bool load(const std::string &path);
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool hasKey(const std::string &key) const;

    // Server configuration getters
    std::string getLogLevel() const;
    std::string getServerHost() const;
    int getServerPort() const;
    int getServerThreads() const;

    // Transcript configuration getters
    std::vector<std::string> getDefaultLanguages() const;

    // YouTube client configuration getters
    int getConnectTimeoutSeconds() const;
    int getReadTimeoutSeconds() const;
    std::string getUserAgent() const;
    std::string getAcceptLanguage() const;
    std::string getProxyHost() const;
    int getProxyPort() const;

    bool validateConfig() const;
    void initializeDefaultConfig();

    // Runtime config file watching
    void startWatching(const std::string &file_path, int interval_seconds = 2);
    void stopWatching();

    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

private:
    static void applyDefaults(Poco::Util::JSONConfiguration &target);
    static void applyPatch(Poco::Util::JSONConfiguration &target, const nlohmann::json &patch);
    void publishChanges(const nlohmann::json &before, const nlohmann::json &after, const std::string &source);
    void watchLoop();

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;

    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;

    std::atomic<bool> watching_{false};
    std::thread watcher_thread_;
    std::string watched_file_path_;
    int watch_interval_seconds_{2};
    std::filesystem::file_time_type last_write_time_{};
};

// Splits on the delimiter and trims surrounding whitespace from each entry.
// Empty entries are kept, so "ko,,en" yields three elements.
std::vector<std::string> splitList(const std::string &str, char delimiter);

// Flattens nested objects into dotted keys ({"a":{"b":1}} -> {"a.b":1})
nlohmann::json flattenConfig(const nlohmann::json &node);
