#pragma once

#include <httplib.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class TranscriptService;

/**
 * @brief Owns the HTTP server and its listener thread.
 *
 * start() builds a fresh httplib::Server, installs the routes through
 * RouteHandlers and serves on a background thread until stop(). Requests
 * run on httplib's worker pool and share nothing but the TranscriptService,
 * which holds no per-request state.
 */
class HttpServerManager
{
public:
    HttpServerManager(TranscriptService &service, std::vector<std::string> default_languages, int worker_threads = 8);
    ~HttpServerManager();
    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    /**
     * @brief Bind and start serving.
     * @param port 0 binds an ephemeral port; getCurrentPort() reports it
     * @throws std::runtime_error when the address cannot be bound
     */
    void start(const std::string &host, int port);
    void stop();
    bool isRunning() const;

    std::string getCurrentHost() const;
    int getCurrentPort() const;

private:
    void serverThread();

    TranscriptService &service_;
    std::vector<std::string> default_languages_;
    int worker_threads_;

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    std::string current_host_;
    int current_port_{0};

    mutable std::mutex server_mutex_;
};
