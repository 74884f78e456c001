#include "server/shutdown_coordinator.hpp"
#include "server/http_constants.hpp"
#include "server/signal_watcher.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <httplib.h>
#include <sys/socket.h>

#include <csignal>
#include <format>
#include <future>
#include <stdexcept>
#include <thread>
#include <utility>

namespace graceful {

namespace {

// How often the signal wait checks for an early listener exit
constexpr std::chrono::milliseconds kListenerPollInterval{100};

std::string signal_name(int sig) {
    switch (sig) {
        case SIGINT:  return "SIGINT";
        case SIGTERM: return "SIGTERM";
        default:      return std::format("signal {}", sig);
    }
}

/**
 * @brief Body of the listener thread
 *
 * Writes bound exactly once, and done exactly once if the bind succeeded.
 * Captures only shared state: the thread may outlive the coordinator.
 */
void listen_task(std::shared_ptr<httplib::Server> server, std::string host, uint16_t port,
                 std::promise<Status> bound, std::promise<Status> done) {
    bool bound_reported = false;
    try {
        if (!server->bind_to_port(host, port)) {
            bound.set_value(Status::error(ErrorCategory::BIND_ERROR,
                std::format("cannot bind {}:{} (address in use or permission denied)", host, port)));
            return;
        }
        bound.set_value(Status::ok());
        bound_reported = true;

        utils::log::info(std::format("Begin listening on port {}", port));

        // Returns once stop() closed the socket and the worker pool drained
        if (server->listen_after_bind()) {
            done.set_value(Status::ok());
        } else {
            done.set_value(Status::error(ErrorCategory::LISTEN_ERROR,
                "listener terminated unexpectedly"));
        }
    } catch (const std::exception& e) {
        auto status = Status::error(ErrorCategory::LISTEN_ERROR, e.what());
        if (bound_reported) {
            done.set_value(std::move(status));
        } else {
            bound.set_value(std::move(status));
        }
    }
}

/**
 * @brief Owns the listener thread until run() decides to join or detach it
 *
 * Unwinding through run_impl() stops the server and detaches the thread
 * instead of letting std::thread's destructor terminate the process.
 */
class ListenerThread {
public:
    ListenerThread(std::shared_ptr<httplib::Server> server, std::thread thread)
        : server_(std::move(server)), thread_(std::move(thread)) {}

    ListenerThread(const ListenerThread&) = delete;
    ListenerThread& operator=(const ListenerThread&) = delete;

    ~ListenerThread() {
        if (thread_.joinable()) {
            if (!stopped_ && server_->is_running()) {
                server_->stop();
            }
            thread_.detach();
        }
    }

    // Called at most once per server
    void stop() {
        if (!stopped_) {
            stopped_ = true;
            server_->stop();
        }
    }

    void join() { thread_.join(); }
    void detach() { thread_.detach(); }

private:
    std::shared_ptr<httplib::Server> server_;
    std::thread thread_;
    bool stopped_ = false;
};

} // anonymous namespace

// ============================================================================
// RunState
// ============================================================================

bool ShutdownCoordinator::RunState::try_enter_request() {
    if (shutting_down_.load(std::memory_order_acquire)) {
        return false;
    }
    in_flight_.fetch_add(1, std::memory_order_relaxed);
    // Double-check after increment (avoid race with initiate_shutdown)
    if (shutting_down_.load(std::memory_order_acquire)) {
        in_flight_.fetch_sub(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

void ShutdownCoordinator::RunState::leave_request() {
    in_flight_.fetch_sub(1, std::memory_order_relaxed);
}

// ============================================================================
// ShutdownCoordinator
// ============================================================================

ShutdownCoordinator::ShutdownCoordinator(Handler handler, ServeOptions options)
    : handler_(std::move(handler)),
      options_(std::move(options)),
      state_(std::make_shared<RunState>()) {}

const char* ShutdownCoordinator::outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::COMPLETED:       return "completed";
        case Outcome::TIMED_OUT:       return "timed out";
        case Outcome::LISTENER_FAILED: return "listener failed";
    }
    return "unknown";
}

Handler ShutdownCoordinator::build_handler_chain() const {
    if (!handler_) {
        throw std::invalid_argument("serve() requires a request handler");
    }

    auto state = state_;
    Handler admission = [state, next = handler_](const httplib::Request& req, httplib::Response& res) {
        if (!state->try_enter_request()) {
            res.status = http::kStatusServiceUnavailable;
            res.set_header(http::kConnectionHeader, "close");
            res.set_content("server is shutting down\n", http::kTextContentType);
            return;
        }
        struct LeaveOnExit {
            RunState& s;
            ~LeaveOnExit() { s.leave_request(); }
        } leave{*state};
        next(req, res);
    };

    if (!options_.middleware) {
        return admission;
    }
    auto chain = options_.middleware(std::move(admission));
    if (!chain) {
        throw std::invalid_argument("middleware returned an empty handler");
    }
    return chain;
}

ShutdownCoordinator::Report ShutdownCoordinator::run() {
    try {
        return run_impl();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Server failed: {}", e.what()));
        utils::log::info("Server stopped");
        Report report;
        report.outcome = Outcome::LISTENER_FAILED;
        report.listener_status = Status::error(ErrorCategory::INTERNAL_ERROR, e.what());
        return report;
    }
}

ShutdownCoordinator::Report ShutdownCoordinator::run_impl() {
    Report report;
    if (started_.test_and_set()) {
        utils::log::error("ShutdownCoordinator::run() called more than once");
        report.listener_status = Status::error(ErrorCategory::INTERNAL_ERROR,
            "coordinator already ran");
        return report;
    }

    const auto& cfg = options_.server;
    if (const auto errors = ConfigLoader::validate_server_config(cfg); !errors.empty()) {
        std::string joined;
        for (const auto& e : errors) {
            if (!joined.empty()) joined += "; ";
            joined += e;
        }
        utils::log::error(std::format("Invalid server options: {}", joined));
        utils::log::info("Server stopped");
        report.listener_status = Status::error(ErrorCategory::CONFIG_ERROR, std::move(joined));
        return report;
    }
    const auto chain = build_handler_chain();

    // Process-wide handlers: caught on whichever thread the kernel picks
    SignalWatcher signals;

    auto server = std::make_shared<httplib::Server>();
    const size_t pool_size = cfg.thread_pool_size;
    server->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    server->set_read_timeout(cfg.read_timeout);
    server->set_write_timeout(cfg.write_timeout);
    server->set_keep_alive_max_count(cfg.keep_alive_max_count);
    server->set_keep_alive_timeout(static_cast<time_t>(cfg.keep_alive_timeout.count()));
    // SO_REUSEADDR only: SO_REUSEPORT would let a second listener share the port
    server->set_socket_options([](int sock) {
        int yes = 1;
        ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    });
    // Every method and path goes to the caller's handler
    server->set_pre_routing_handler([chain](const httplib::Request& req, httplib::Response& res) {
        chain(req, res);
        return httplib::Server::HandlerResponse::Handled;
    });

    std::promise<Status> bound_promise;
    std::promise<Status> done_promise;
    auto bound = bound_promise.get_future();
    auto done = done_promise.get_future();

    ListenerThread listener(server, std::thread(listen_task, server, cfg.host, cfg.port,
        std::move(bound_promise), std::move(done_promise)));

    const Status bind_status = bound.get();
    if (bind_status.is_error()) {
        listener.join();
        utils::log::error(std::format("Failed to start listener: {}", bind_status.to_string()));
        utils::log::info("Server stopped");
        report.listener_status = bind_status;
        return report;
    }

    // stop() is a no-op until the accept loop runs
    while (!server->is_running() &&
           done.wait_for(std::chrono::milliseconds(1)) != std::future_status::ready) {
    }

    std::optional<int> sig;
    while (!sig) {
        if (done.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            report.listener_status = done.get();
            listener.join();
            utils::log::error(std::format("Listener terminated before shutdown signal: {}",
                report.listener_status.to_string()));
            utils::log::info("Server stopped");
            return report;
        }
        sig = signals.wait_for(kListenerPollInterval);
    }
    report.signal = sig;

    utils::log::info(std::format("Received {}", signal_name(*sig)));
    utils::log::info("Shutting down server...");

    // Shut down gracefully, but wait no longer than shutdown_timeout
    const utils::Timer shutdown_timer;
    const auto deadline = std::chrono::steady_clock::now() + cfg.shutdown_timeout;
    state_->initiate_shutdown();
    listener.stop();

    if (done.wait_until(deadline) == std::future_status::ready) {
        report.listener_status = done.get();
        listener.join();
        report.outcome = Outcome::COMPLETED;
        utils::log::info(std::format("Finished listening: {}", report.listener_status.to_string()));
    } else {
        // In-flight handlers keep running on the detached listener's workers
        listener.detach();
        report.outcome = Outcome::TIMED_OUT;
        report.abandoned_requests = state_->in_flight_count();
        utils::log::warn(std::format("Graceful shutdown timed out: {} requests still in flight",
            report.abandoned_requests));
    }
    report.shutdown_duration = shutdown_timer.elapsed_ms();

    utils::log::info("Server stopped");
    return report;
}

} // namespace graceful
