#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>

volatile sig_atomic_t ShutdownManager::pending_signal_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    watcher_running_.store(false);
    if (watcher_.joinable())
        watcher_.join();
}

void ShutdownManager::installSignalHandlers()
{
    struct sigaction action = {};
    action.sa_handler = &ShutdownManager::handleSignal;
    sigemptyset(&action.sa_mask);

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGQUIT, &action, nullptr);

    // A client hanging up mid-response must not kill the server
    signal(SIGPIPE, SIG_IGN);

    if (!watcher_running_.exchange(true))
        watcher_ = std::thread(&ShutdownManager::watchSignals, this);

    Logger::info("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    pending_signal_ = sig;
}

void ShutdownManager::watchSignals()
{
    while (watcher_running_.load() && !shutdown_requested_.load())
    {
        int sig = pending_signal_;
        if (sig != 0)
        {
            pending_signal_ = 0;
            requestShutdown("Signal received", sig);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
            return;
        reason_ = reason;
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", shutting down");
    else
        Logger::info("ShutdownManager: shutdown requested - " + reason);
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset()
{
    std::lock_guard<std::mutex> lk(mutex_);
    shutdown_requested_.store(false);
    last_signal_.store(0);
    reason_.clear();
}
