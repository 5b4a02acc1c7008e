#include "core/http_server_manager.hpp"
#include "core/transcript_service.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"
#include "web/route_handlers.hpp"
#include <algorithm>
#include <stdexcept>

HttpServerManager::HttpServerManager(TranscriptService &service, std::vector<std::string> default_languages, int worker_threads)
    : service_(service), default_languages_(std::move(default_languages)), worker_threads_(std::max(1, worker_threads))
{
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

void HttpServerManager::start(const std::string &host, int port)
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (server_)
    {
        Logger::warn("HttpServerManager: Server is already running on " + current_host_ + ":" + std::to_string(current_port_));
        return;
    }

    server_ = std::make_unique<httplib::Server>();
    int worker_threads = worker_threads_;
    server_->new_task_queue = [worker_threads]
    { return new httplib::ThreadPool(static_cast<size_t>(worker_threads)); };

    RouteHandlers::setupRoutes(*server_, service_, default_languages_);

    int bound_port = port;
    if (port == 0)
    {
        bound_port = server_->bind_to_any_port(host);
    }
    else if (!server_->bind_to_port(host, port))
    {
        bound_port = -1;
    }

    if (bound_port <= 0)
    {
        server_.reset();
        throw std::runtime_error("Failed to bind HTTP server to " + host + ":" + std::to_string(port));
    }

    current_host_ = host;
    current_port_ = bound_port;
    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this);

    Logger::info("HttpServerManager: Server started on http://" + host + ":" + std::to_string(bound_port) +
                 " with " + std::to_string(worker_threads_) + " worker threads");
    Logger::info("HttpServerManager: API documentation available at http://" + host + ":" +
                 std::to_string(bound_port) + ServerConfig::API_DOCS_PATH);
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (!server_)
        return;

    running_.store(false);
    server_->stop();

    // The listener may already have exited on its own; join either way
    if (server_thread_.joinable())
        server_thread_.join();

    server_.reset();

    Logger::info("HttpServerManager: Server stopped");
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

std::string HttpServerManager::getCurrentHost() const
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    return current_host_;
}

int HttpServerManager::getCurrentPort() const
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    return current_port_;
}

void HttpServerManager::serverThread()
{
    try
    {
        bool clean_exit = server_->listen_after_bind();
        if (!clean_exit && running_.load())
        {
            Logger::error("HttpServerManager: Listener on " + current_host_ + ":" + std::to_string(current_port_) + " exited with an error");
        }
        Logger::info("HttpServerManager: Server thread completed");
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Server thread error: " + std::string(e.what()));
    }
    running_.store(false);
}
