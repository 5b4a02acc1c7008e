#include "test_base.hpp"
#include "core/config_observer.hpp"
#include "core/logger_observer.hpp"
#include "core/poco_config_manager.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

class PocoConfigManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        test_config_path_ = (std::filesystem::temp_directory_path() /
                             ("transcript_server_test_config_" + std::to_string(::getpid()) + ".json"))
                                .string();
    }

    void TearDown() override
    {
        config_.stopWatching();
        std::error_code ec;
        std::filesystem::remove(test_config_path_, ec);
    }

    void writeConfig(const std::string &content)
    {
        std::ofstream config_file(test_config_path_, std::ios::trunc);
        config_file << content;
    }

    std::string test_config_path_;
    PocoConfigManager config_;
};

class RecordingObserver : public ConfigObserver
{
public:
    void onConfigUpdate(const ConfigUpdateEvent &event) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
        received.store(true);
    }

    std::mutex mutex;
    std::vector<ConfigUpdateEvent> events;
    std::atomic<bool> received{false};
};

TEST_F(PocoConfigManagerTest, DefaultsWithoutFile)
{
    EXPECT_EQ(config_.getLogLevel(), "INFO");
    EXPECT_EQ(config_.getServerHost(), "0.0.0.0");
    EXPECT_EQ(config_.getServerPort(), 8000);
    EXPECT_EQ(config_.getServerThreads(), 8);
    EXPECT_EQ(config_.getDefaultLanguages(), (std::vector<std::string>{"ko", "en"}));
    EXPECT_EQ(config_.getConnectTimeoutSeconds(), 10);
    EXPECT_EQ(config_.getReadTimeoutSeconds(), 30);
    EXPECT_EQ(config_.getAcceptLanguage(), "en-US");
    EXPECT_FALSE(config_.getUserAgent().empty());
    EXPECT_TRUE(config_.getProxyHost().empty());
    EXPECT_TRUE(config_.validateConfig());
}

TEST_F(PocoConfigManagerTest, LoadOverridesDefaultsAndKeepsTheRest)
{
    writeConfig(R"({
        "log_level": "DEBUG",
        "server_port": 9090,
        "transcript": {"default_languages": ["en", "ja"]},
        "youtube": {"read_timeout_seconds": 5}
    })");

    ASSERT_TRUE(config_.load(test_config_path_));
    EXPECT_EQ(config_.getLogLevel(), "DEBUG");
    EXPECT_EQ(config_.getServerPort(), 9090);
    EXPECT_EQ(config_.getDefaultLanguages(), (std::vector<std::string>{"en", "ja"}));
    EXPECT_EQ(config_.getReadTimeoutSeconds(), 5);
    EXPECT_EQ(config_.getConnectTimeoutSeconds(), 10);
    EXPECT_EQ(config_.getServerHost(), "0.0.0.0");
}

TEST_F(PocoConfigManagerTest, LanguagesMayBeCommaJoined)
{
    writeConfig(R"({"transcript": {"default_languages": "de, en"}})");
    ASSERT_TRUE(config_.load(test_config_path_));
    EXPECT_EQ(config_.getDefaultLanguages(), (std::vector<std::string>{"de", "en"}));
}

TEST_F(PocoConfigManagerTest, MissingOrBrokenFileKeepsCurrentConfig)
{
    EXPECT_FALSE(config_.load(test_config_path_ + ".missing"));

    writeConfig(R"({"server_port": 9191})");
    ASSERT_TRUE(config_.load(test_config_path_));

    writeConfig("{ not json");
    EXPECT_FALSE(config_.load(test_config_path_));
    EXPECT_EQ(config_.getServerPort(), 9191);

    writeConfig("[1, 2]");
    EXPECT_FALSE(config_.load(test_config_path_));
    EXPECT_EQ(config_.getServerPort(), 9191);
}

TEST_F(PocoConfigManagerTest, UpdateAppliesPatch)
{
    config_.update({{"server_host", "127.0.0.1"}, {"youtube", {{"proxy_host", "proxy.local"}, {"proxy_port", 3128}}}});
    EXPECT_EQ(config_.getServerHost(), "127.0.0.1");
    EXPECT_EQ(config_.getProxyHost(), "proxy.local");
    EXPECT_EQ(config_.getProxyPort(), 3128);
    EXPECT_TRUE(config_.hasKey("youtube.proxy_port"));
}

TEST_F(PocoConfigManagerTest, ValidationRejectsBadValues)
{
    config_.update({{"server_port", 70000}});
    EXPECT_FALSE(config_.validateConfig());
    config_.update({{"server_port", 8000}});

    config_.update({{"log_level", "VERBOSE"}});
    EXPECT_FALSE(config_.validateConfig());
    config_.update({{"log_level", "WARN"}});

    config_.update({{"server_threads", 0}});
    EXPECT_FALSE(config_.validateConfig());
    config_.update({{"server_threads", 4}});

    config_.update({{"youtube", {{"proxy_host", "proxy.local"}, {"proxy_port", 0}}}});
    EXPECT_FALSE(config_.validateConfig());
    config_.update({{"youtube", {{"proxy_host", ""}}}});

    config_.update({{"transcript", {{"default_languages", ""}}}});
    EXPECT_FALSE(config_.validateConfig());
    config_.update({{"transcript", {{"default_languages", "en"}}}});

    EXPECT_TRUE(config_.validateConfig());
}

TEST_F(PocoConfigManagerTest, WatcherNotifiesObserversOfChangedKeys)
{
    writeConfig(R"({"log_level": "ERROR", "server_port": 8000})");
    ASSERT_TRUE(config_.load(test_config_path_));

    RecordingObserver observer;
    config_.subscribe(&observer);
    config_.startWatching(test_config_path_, 1);

    writeConfig(R"({"log_level": "ERROR", "server_port": 8123})");
    // Guarantee a visible mtime change on coarse-grained filesystems
    std::filesystem::last_write_time(test_config_path_,
                                     std::filesystem::last_write_time(test_config_path_) + std::chrono::seconds(5));

    for (int i = 0; i < 50 && !observer.received.load(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    config_.stopWatching();
    config_.unsubscribe(&observer);

    ASSERT_TRUE(observer.received.load());
    std::lock_guard<std::mutex> lock(observer.mutex);
    const auto &keys = observer.events.front().changed_keys;
    EXPECT_EQ(observer.events.front().source, "file_watcher");
    EXPECT_NE(std::find(keys.begin(), keys.end(), "server_port"), keys.end());
    EXPECT_EQ(std::find(keys.begin(), keys.end(), "log_level"), keys.end());
    EXPECT_EQ(config_.getServerPort(), 8123);
}

TEST_F(PocoConfigManagerTest, LoggerObserverIgnoresUnrelatedKeys)
{
    LoggerObserver observer(config_);
    ConfigUpdateEvent event;
    event.source = "file_watcher";
    event.changed_keys = {"server_port"};
    EXPECT_NO_THROW(observer.onConfigUpdate(event));

    config_.update({{"log_level", "ERROR"}});
    event.changed_keys = {"log_level"};
    EXPECT_NO_THROW(observer.onConfigUpdate(event));
}

TEST(SplitListTest, TrimsAndKeepsEmptyEntries)
{
    EXPECT_EQ(splitList("ko,en", ','), (std::vector<std::string>{"ko", "en"}));
    EXPECT_EQ(splitList(" ko , en ", ','), (std::vector<std::string>{"ko", "en"}));
    EXPECT_EQ(splitList("ko,,en", ','), (std::vector<std::string>{"ko", "", "en"}));
    EXPECT_EQ(splitList("ko,", ','), (std::vector<std::string>{"ko", ""}));
    EXPECT_EQ(splitList("ko", ','), (std::vector<std::string>{"ko"}));
    EXPECT_TRUE(splitList("", ',').empty());
}

TEST(FlattenConfigTest, NestedObjectsBecomeDottedKeys)
{
    nlohmann::json nested = {{"a", {{"b", 1}, {"c", {{"d", "x"}}}}}, {"e", true}};
    nlohmann::json flat = flattenConfig(nested);
    EXPECT_EQ(flat["a.b"], 1);
    EXPECT_EQ(flat["a.c.d"], "x");
    EXPECT_EQ(flat["e"], true);
    EXPECT_EQ(flat.size(), 3u);
}
