#include "server/signal_watcher.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace graceful {

namespace {

// Write end of the active watcher's pipe, -1 when none is active
std::atomic<int> g_notify_fd{-1};
static_assert(std::atomic<int>::is_always_lock_free);

extern "C" void on_subscribed_signal(int sig) {
    const int saved_errno = errno;
    const int fd = g_notify_fd.load(std::memory_order_acquire);
    if (fd >= 0) {
        const auto byte = static_cast<unsigned char>(sig);
        // Pipe full: the pending notifications already wake the waiter
        (void)::write(fd, &byte, 1);
    }
    errno = saved_errno;
}

} // anonymous namespace

SignalWatcher::SignalWatcher(std::initializer_list<int> signals) : signals_(signals) {
    for (const int sig : signals_) {
        if (sig <= 0 || sig >= NSIG) {
            throw std::system_error(EINVAL, std::generic_category(), "invalid signal number");
        }
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::system_error(errno, std::generic_category(), "failed to create signal pipe");
    }
    read_fd_ = fds[0];
    write_fd_ = fds[1];

    int expected = -1;
    if (!g_notify_fd.compare_exchange_strong(expected, write_fd_, std::memory_order_acq_rel)) {
        ::close(read_fd_);
        ::close(write_fd_);
        throw std::logic_error("another SignalWatcher is already active");
    }

    struct sigaction action{};
    action.sa_handler = on_subscribed_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    previous_actions_.reserve(signals_.size());
    for (const int sig : signals_) {
        struct sigaction previous{};
        if (::sigaction(sig, &action, &previous) != 0) {
            const int err = errno;
            restore_handlers();
            g_notify_fd.store(-1, std::memory_order_release);
            ::close(read_fd_);
            ::close(write_fd_);
            throw std::system_error(err, std::generic_category(), "failed to install signal handler");
        }
        previous_actions_.push_back(previous);
    }
}

SignalWatcher::~SignalWatcher() {
    restore_handlers();
    g_notify_fd.store(-1, std::memory_order_release);
    (void)drain();
    ::close(read_fd_);
    ::close(write_fd_);
}

void SignalWatcher::restore_handlers() noexcept {
    for (size_t i = 0; i < previous_actions_.size(); ++i) {
        ::sigaction(signals_[i], &previous_actions_[i], nullptr);
    }
    previous_actions_.clear();
}

std::optional<int> SignalWatcher::wait_for(std::chrono::milliseconds timeout) {
    if (timeout.count() < 0) {
        timeout = std::chrono::milliseconds(0);
    }

    pollfd pfd{};
    pfd.fd = read_fd_;
    pfd.events = POLLIN;

    ////////////////////////////////////////
    // blocks here until a signal arrives or the timeout expires
    ////////////////////////////////////////
    const auto poll_ms = std::min<int64_t>(timeout.count(), std::numeric_limits<int>::max());
    const int rc = ::poll(&pfd, 1, static_cast<int>(poll_ms));
    if (rc < 0 && errno != EINTR) {
        throw std::system_error(errno, std::generic_category(), "failed to wait on shutdown signals");
    }

    // EINTR usually means the handler ran on this thread: the byte is there
    unsigned char byte = 0;
    if (::read(read_fd_, &byte, 1) == 1) {
        return static_cast<int>(byte);
    }
    return std::nullopt;
}

int SignalWatcher::drain() noexcept {
    int dropped = 0;
    unsigned char byte = 0;
    while (::read(read_fd_, &byte, 1) == 1) {
        ++dropped;
    }
    return dropped;
}

} // namespace graceful
