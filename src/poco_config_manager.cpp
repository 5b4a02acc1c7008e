#include "core/poco_config_manager.hpp"
#include "core/config_observer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

PocoConfigManager::~PocoConfigManager()
{
    stopWatching();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;

    nlohmann::json file_config;
    try
    {
        file_config = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        Logger::error("PocoConfigManager: Failed to parse " + path + ": " + e.what());
        return false;
    }

    if (!file_config.is_object())
    {
        Logger::error("PocoConfigManager: " + path + " does not contain a JSON object");
        return false;
    }

    // Start from defaults so keys missing from the file keep their default value
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    applyDefaults(*tmp);
    applyPatch(*tmp, file_config);

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = tmp;
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(*cfg_, patch);
}

void PocoConfigManager::applyPatch(JSONConfiguration &target, const nlohmann::json &patch)
{
    for (const auto &item : flattenConfig(patch).items())
    {
        const auto &value = item.value();
        const std::string &key = item.key();

        if (value.is_null())
            continue;
        if (value.is_boolean())
            target.setBool(key, value.get<bool>());
        else if (value.is_number_integer())
            target.setInt(key, value.get<int>());
        else if (value.is_number_float())
            target.setDouble(key, value.get<double>());
        else if (value.is_string())
            target.setString(key, value.get<std::string>());
        else if (value.is_array())
        {
            // Lists are stored comma-joined, the form splitList() reads back
            std::string joined;
            for (const auto &entry : value)
            {
                if (!joined.empty())
                    joined += ",";
                joined += entry.is_string() ? entry.get<std::string>() : entry.dump();
            }
            target.setString(key, joined);
        }
        else
            target.setString(key, value.dump());
    }
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

// Server configuration getters
std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getServerHost() const
{
    return getString("server_host", "0.0.0.0");
}

int PocoConfigManager::getServerPort() const
{
    return getInt("server_port", 8000);
}

int PocoConfigManager::getServerThreads() const
{
    return getInt("server_threads", 8);
}

std::vector<std::string> PocoConfigManager::getDefaultLanguages() const
{
    return splitList(getString("transcript.default_languages", "ko,en"), ',');
}

// YouTube client configuration getters
int PocoConfigManager::getConnectTimeoutSeconds() const
{
    return getInt("youtube.connect_timeout_seconds", 10);
}

int PocoConfigManager::getReadTimeoutSeconds() const
{
    return getInt("youtube.read_timeout_seconds", 30);
}

std::string PocoConfigManager::getUserAgent() const
{
    return getString("youtube.user_agent",
                     "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0 Safari/537.36");
}

std::string PocoConfigManager::getAcceptLanguage() const
{
    return getString("youtube.accept_language", "en-US");
}

std::string PocoConfigManager::getProxyHost() const
{
    return getString("youtube.proxy_host", "");
}

int PocoConfigManager::getProxyPort() const
{
    return getInt("youtube.proxy_port", 0);
}

bool PocoConfigManager::validateConfig() const
{
    int port = getServerPort();
    if (port <= 0 || port > 65535)
    {
        Logger::error("Invalid server port: " + std::to_string(port));
        return false;
    }

    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    int threads = getServerThreads();
    if (threads <= 0 || threads > 256)
    {
        Logger::error("Invalid server_threads: " + std::to_string(threads));
        return false;
    }

    if (getConnectTimeoutSeconds() <= 0 || getReadTimeoutSeconds() <= 0)
    {
        Logger::error("YouTube timeouts must be positive");
        return false;
    }

    int proxy_port = getProxyPort();
    if (!getProxyHost().empty() && (proxy_port <= 0 || proxy_port > 65535))
    {
        Logger::error("Invalid proxy port: " + std::to_string(proxy_port));
        return false;
    }

    if (getDefaultLanguages().empty())
    {
        Logger::error("transcript.default_languages must name at least one language");
        return false;
    }

    return true;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyDefaults(*cfg_);
}

void PocoConfigManager::applyDefaults(JSONConfiguration &target)
{
    target.setString("log_level", "INFO");
    target.setString("server_host", "0.0.0.0");
    target.setInt("server_port", 8000);
    target.setInt("server_threads", 8);

    target.setString("transcript.default_languages", "ko,en");

    target.setInt("youtube.connect_timeout_seconds", 10);
    target.setInt("youtube.read_timeout_seconds", 30);
    target.setString("youtube.user_agent",
                    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0 Safari/537.36");
    target.setString("youtube.accept_language", "en-US");
    target.setString("youtube.proxy_host", "");
    target.setInt("youtube.proxy_port", 0);
}

void PocoConfigManager::startWatching(const std::string &file_path, int interval_seconds)
{
    if (watching_.exchange(true))
    {
        Logger::warn("PocoConfigManager: Already watching " + watched_file_path_);
        return;
    }

    watched_file_path_ = file_path;
    watch_interval_seconds_ = std::max(1, interval_seconds);

    std::error_code ec;
    last_write_time_ = std::filesystem::last_write_time(watched_file_path_, ec);

    watcher_thread_ = std::thread(&PocoConfigManager::watchLoop, this);
    Logger::info("PocoConfigManager: Watching " + file_path + " every " + std::to_string(watch_interval_seconds_) + "s");
}

void PocoConfigManager::stopWatching()
{
    if (!watching_.exchange(false))
        return;

    if (watcher_thread_.joinable())
        watcher_thread_.join();

    Logger::info("PocoConfigManager: Stopped watching " + watched_file_path_);
}

void PocoConfigManager::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
        observers_.push_back(observer);
}

void PocoConfigManager::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void PocoConfigManager::watchLoop()
{
    const auto step = std::chrono::milliseconds(100);
    auto waited = std::chrono::milliseconds(0);

    while (watching_.load())
    {
        std::this_thread::sleep_for(step);
        waited += step;
        if (waited < std::chrono::seconds(watch_interval_seconds_))
            continue;
        waited = std::chrono::milliseconds(0);

        std::error_code ec;
        auto write_time = std::filesystem::last_write_time(watched_file_path_, ec);
        if (ec || write_time == last_write_time_)
            continue;
        last_write_time_ = write_time;

        Logger::info("PocoConfigManager: Detected change in " + watched_file_path_ + ", reloading");
        auto before = flattenConfig(getAll());
        if (!load(watched_file_path_))
        {
            Logger::error("PocoConfigManager: Reload failed, keeping previous configuration");
            continue;
        }
        publishChanges(before, flattenConfig(getAll()), "file_watcher");
    }
}

void PocoConfigManager::publishChanges(const nlohmann::json &before, const nlohmann::json &after, const std::string &source)
{
    ConfigUpdateEvent event;
    event.source = source;
    for (const auto &item : after.items())
    {
        if (!before.contains(item.key()) || before[item.key()] != item.value())
            event.changed_keys.push_back(item.key());
    }

    if (event.changed_keys.empty())
    {
        Logger::debug("PocoConfigManager: Reload produced no changes");
        return;
    }

    std::vector<ConfigObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    for (auto *observer : observers)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("PocoConfigManager: Observer failed to apply update: " + std::string(e.what()));
        }
    }
}

std::vector<std::string> splitList(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        auto first = token.find_first_not_of(" \t\r\n");
        auto last = token.find_last_not_of(" \t\r\n");
        tokens.push_back(first == std::string::npos ? "" : token.substr(first, last - first + 1));
    }

    // getline drops a trailing empty field ("ko," -> ["ko"]); keep it
    if (!str.empty() && str.back() == delimiter)
        tokens.emplace_back();

    return tokens;
}

nlohmann::json flattenConfig(const nlohmann::json &node)
{
    nlohmann::json flat = nlohmann::json::object();
    std::function<void(const std::string &, const nlohmann::json &)> walk;
    walk = [&](const std::string &prefix, const nlohmann::json &value)
    {
        if (value.is_object())
        {
            for (auto it = value.begin(); it != value.end(); ++it)
                walk(prefix.empty() ? it.key() : prefix + "." + it.key(), it.value());
        }
        else
        {
            flat[prefix] = value;
        }
    };
    walk("", node);
    return flat;
}
