#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "server/request_logger.hpp"
#include "server/server_types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace graceful {

/**
 * @brief Everything serve() needs besides the handler
 *
 * middleware is the pluggable access-log capability; it wraps the handler
 * once, before the listener starts.
 */
struct ServeOptions {
    ServerConfig server;
    Middleware middleware = RequestLogger::middleware();
};

/**
 * @brief Runs an HTTP listener until SIGINT/SIGTERM, then drains it
 *
 * Lifecycle of run():
 * 1. Block SIGINT/SIGTERM on the calling thread
 * 2. Bind and listen on a background thread (outcome via std::promise)
 * 3. Wait for a signal, or for the listener to terminate on its own
 * 4. stop() the listener once and race its completion against
 *    shutdown_timeout
 *
 * Single-use: a coordinator runs at most one listener and one shutdown.
 * run() never throws; every failure ends up in the log and the Report.
 */
class ShutdownCoordinator {
public:
    enum class Outcome {
        COMPLETED,        // Listener drained before the deadline
        TIMED_OUT,        // Deadline hit with requests still in flight
        LISTENER_FAILED   // Bind failure, early listener exit, or setup error
    };

    struct Report {
        Outcome outcome = Outcome::LISTENER_FAILED;
        Status listener_status;
        std::optional<int> signal;
        uint32_t abandoned_requests = 0;
        std::chrono::milliseconds shutdown_duration{0};
    };

    /**
     * @brief Request admission and in-flight accounting
     *
     * Shared with the handler chain so a request that outlives run()
     * (timeout path) never touches the coordinator itself.
     */
    class RunState {
    public:
        /// Called at start of each request. Returns false if shutting down.
        [[nodiscard]] bool try_enter_request();

        /// Called when request completes.
        void leave_request();

        void initiate_shutdown() {
            shutting_down_.store(true, std::memory_order_release);
        }

        [[nodiscard]] bool is_shutting_down() const {
            return shutting_down_.load(std::memory_order_acquire);
        }

        [[nodiscard]] uint32_t in_flight_count() const {
            return in_flight_.load(std::memory_order_relaxed);
        }

    private:
        std::atomic<bool> shutting_down_{false};
        std::atomic<uint32_t> in_flight_{0};
    };

    ShutdownCoordinator(Handler handler, ServeOptions options);

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    /// Blocks until the shutdown race resolves or the listener fails
    Report run();

    [[nodiscard]] bool is_shutting_down() const { return state_->is_shutting_down(); }
    [[nodiscard]] uint32_t in_flight_count() const { return state_->in_flight_count(); }

    [[nodiscard]] static const char* outcome_to_string(Outcome outcome);

private:
    Report run_impl();

    // middleware(admission(handler))
    [[nodiscard]] Handler build_handler_chain() const;

    Handler handler_;
    ServeOptions options_;
    std::shared_ptr<RunState> state_;
    std::atomic_flag started_ = ATOMIC_FLAG_INIT;
};

} // namespace graceful
