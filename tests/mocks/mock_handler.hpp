#pragma once

#include "server/server_types.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace graceful::testing {

/**
 * @brief Request handler that counts calls and optionally sleeps
 *
 * Paths starting with /slow sleep for the configured delay before
 * answering; every other path answers immediately. State lives behind a
 * shared_ptr so the handler stays valid on a detached listener.
 */
class MockHandler {
public:
    explicit MockHandler(std::chrono::milliseconds slow_delay = std::chrono::milliseconds(0),
                         std::string body = "ok")
        : state_(std::make_shared<State>()) {
        state_->slow_delay = slow_delay;
        state_->body = std::move(body);
    }

    [[nodiscard]] Handler handler() const {
        auto state = state_;
        return [state](const httplib::Request& req, httplib::Response& res) {
            state->calls.fetch_add(1, std::memory_order_relaxed);
            if (req.path.rfind("/slow", 0) == 0) {
                state->slow_entered.fetch_add(1, std::memory_order_release);
                std::this_thread::sleep_for(state->slow_delay);
                state->slow_finished.fetch_add(1, std::memory_order_release);
            }
            res.status = 200;
            res.set_header("X-Mock", "1");
            res.set_content(state->body, "text/plain");
        };
    }

    [[nodiscard]] uint64_t calls() const {
        return state_->calls.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t slow_entered() const {
        return state_->slow_entered.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t slow_finished() const {
        return state_->slow_finished.load(std::memory_order_acquire);
    }

    // Spin until a /slow request is inside the handler
    bool wait_for_slow_request(std::chrono::milliseconds timeout) const {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (slow_entered() == 0) {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

private:
    struct State {
        std::chrono::milliseconds slow_delay{0};
        std::string body;
        std::atomic<uint64_t> calls{0};
        std::atomic<uint64_t> slow_entered{0};
        std::atomic<uint64_t> slow_finished{0};
    };

    std::shared_ptr<State> state_;
};

} // namespace graceful::testing
