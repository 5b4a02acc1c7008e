#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>

/**
 * Process-wide shutdown coordination.
 * The signal handler only records the signal number; a watcher thread turns
 * it into a shutdown request that main() can block on.
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    // Install SIGINT/SIGTERM/SIGQUIT handlers and start the watcher thread
    void installSignalHandlers();

    // Safe from any thread, not from a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }
    void waitForShutdown();

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Clear a previous request (tests only)
    void reset();

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;
    void watchSignals();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t pending_signal_;
};
