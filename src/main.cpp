#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "server/graceful_server.hpp"
#include "server/http_constants.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <format>
#include <string>
#include <thread>

using namespace graceful;

namespace {

// Longest delay /sleep will honor
constexpr int64_t kMaxSleepMs = 60000;

void demo_handler(const httplib::Request& req, httplib::Response& res) {
    if (req.path == "/sleep") {
        const auto ms = utils::parse_int<int64_t>(req.get_param_value("ms"), 1000);
        const auto clamped = std::clamp<int64_t>(ms, 0, kMaxSleepMs);
        std::this_thread::sleep_for(std::chrono::milliseconds(clamped));
        res.set_content(std::format("slept {}ms\n", clamped), http::kTextContentType);
        return;
    }
    if (req.path == "/healthz") {
        res.set_content("ok\n", http::kTextContentType);
        return;
    }
    res.set_content("Hello from graceful-http\n", http::kTextContentType);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    AppConfig config;

    if (argc > 1) {
        const std::string config_file = argv[1];
        utils::log::info(std::format("Loading configuration from {}", config_file));
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return EXIT_FAILURE;
        }
        config = std::move(loaded.config);
    }

    const auto env_status = ConfigLoader::apply_env_overrides(config);
    if (env_status.is_error()) {
        utils::log::error(env_status.error_message());
        return EXIT_FAILURE;
    }

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    serve(demo_handler, make_serve_options(config));
    return EXIT_SUCCESS;
}
