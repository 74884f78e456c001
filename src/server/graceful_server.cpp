#include "server/graceful_server.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace graceful {

void serve(Handler handler) {
    auto config = ConfigLoader::from_environment();
    if (config.is_error()) {
        utils::log::error(std::format("Cannot start server: {}", config.error_message()));
        return;
    }
    serve(std::move(handler), make_serve_options(config.value()));
}

void serve(Handler handler, ServeOptions options) {
    ShutdownCoordinator coordinator(std::move(handler), std::move(options));
    (void)coordinator.run();
}

ServeOptions make_serve_options(const AppConfig& config) {
    ServeOptions options;
    options.server = config.server;
    options.middleware = config.logging.access_log
        ? RequestLogger::middleware()
        : RequestLogger::passthrough();
    return options;
}

} // namespace graceful
