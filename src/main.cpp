#include "core/http_server_manager.hpp"
#include "core/logger_observer.hpp"
#include "core/poco_config_manager.hpp"
#include "core/shutdown_manager.hpp"
#include "core/transcript_service.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"
#include "youtube/youtube_transcript_provider.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << ServerConfig::API_MESSAGE << " " << ServerConfig::API_VERSION << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <path>    Configuration file (default: " << ServerConfig::DEFAULT_CONFIG_PATH << ")" << std::endl;
        std::cout << "  --host <host>          Override server_host" << std::endl;
        std::cout << "  --port, -p <port>      Override server_port" << std::endl;
        std::cout << "  --log-level <level>    Override log_level (TRACE, DEBUG, INFO, WARN, ERROR)" << std::endl;
        std::cout << "  --help, -h             Show this help message" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = ServerConfig::DEFAULT_CONFIG_PATH;
    nlohmann::json overrides = nlohmann::json::object();

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--config" || arg == "-c") && has_value)
        {
            config_path = argv[++i];
        }
        else if (arg == "--host" && has_value)
        {
            overrides["server_host"] = argv[++i];
        }
        else if ((arg == "--port" || arg == "-p") && has_value)
        {
            try
            {
                overrides["server_port"] = std::stoi(argv[++i]);
            }
            catch (const std::exception &)
            {
                std::cerr << "Error: --port expects a number, got '" << argv[i] << "'" << std::endl;
                return 2;
            }
        }
        else if (arg == "--log-level" && has_value)
        {
            overrides["log_level"] = argv[++i];
        }
        else
        {
            std::cerr << "Error: unknown or incomplete option '" << arg << "'" << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    ShutdownManager::getInstance().installSignalHandlers();

    PocoConfigManager config;
    bool config_file_present = std::filesystem::exists(config_path);
    if (config_file_present)
    {
        if (!config.load(config_path))
        {
            Logger::error("Failed to load configuration from " + config_path);
            return 1;
        }
        Logger::info("Configuration loaded from " + config_path);
    }
    else
    {
        Logger::info("No configuration file at " + config_path + ", using defaults");
    }
    config.update(overrides);

    Logger::init(config.getLogLevel());

    if (!config.validateConfig())
    {
        Logger::error("Configuration is invalid, refusing to start");
        return 1;
    }

    LoggerObserver logger_observer(config);
    config.subscribe(&logger_observer);
    if (config_file_present)
    {
        config.startWatching(config_path, 2);
    }

    TransportSettings transport_settings;
    transport_settings.connect_timeout_seconds = config.getConnectTimeoutSeconds();
    transport_settings.read_timeout_seconds = config.getReadTimeoutSeconds();
    transport_settings.user_agent = config.getUserAgent();
    transport_settings.proxy_host = config.getProxyHost();
    transport_settings.proxy_port = config.getProxyPort();

    YouTubeTranscriptProviderFactory provider_factory(transport_settings, config.getAcceptLanguage());
    TranscriptService service(provider_factory);
    HttpServerManager http_server_manager(service, config.getDefaultLanguages(), config.getServerThreads());

    try
    {
        http_server_manager.start(config.getServerHost(), config.getServerPort());
    }
    catch (const std::exception &e)
    {
        Logger::error(e.what());
        config.stopWatching();
        return 1;
    }

    ShutdownManager::getInstance().waitForShutdown();
    Logger::info("Shutdown requested (" + ShutdownManager::getInstance().getReason() + "), cleaning up...");

    http_server_manager.stop();
    config.stopWatching();
    config.unsubscribe(&logger_observer);

    Logger::info("Server shutdown complete");
    return 0;
}
