#pragma once

#include <csignal>

#include <chrono>
#include <initializer_list>
#include <optional>
#include <vector>

namespace graceful {

/**
 * @brief Process-wide subscription to a set of termination signals
 *
 * The constructor installs a handler for each signal with sigaction. The
 * handler writes the signal number into a self-pipe, so a signal sent to
 * the process is caught whichever thread the kernel delivers it to,
 * including threads that existed before the watcher. wait_for() reads the
 * pipe. Signals outside the set keep their disposition.
 *
 * One watcher may be active at a time. The destructor restores the
 * previous dispositions and drops notifications that were never consumed.
 */
class SignalWatcher {
public:
    /// @throws std::logic_error if another watcher is active
    /// @throws std::system_error if the pipe or a handler cannot be set up
    explicit SignalWatcher(std::initializer_list<int> signals = {SIGINT, SIGTERM});
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;
    SignalWatcher(SignalWatcher&&) = delete;
    SignalWatcher& operator=(SignalWatcher&&) = delete;

    /**
     * @brief Wait up to timeout for one subscribed signal
     * @return Signal number, or nullopt on timeout or interruption
     * @throws std::system_error if polling the pipe fails
     */
    [[nodiscard]] std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /// Discard pending notifications, returns how many were dropped
    [[nodiscard]] int drain() noexcept;

private:
    void restore_handlers() noexcept;

    std::vector<int> signals_;
    std::vector<struct sigaction> previous_actions_;
    int read_fd_ = -1;
    int write_fd_ = -1;
};

} // namespace graceful
