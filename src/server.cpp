#include <exception>
#include <iostream>
#include <string>

#include "dash/config.h"
#include "dash/content_types.h"
#include "dash/logger.h"
#include "dash/static_responder.h"

// --- Main Server ---
// Usage: ./dash_server [config.json]
// Without a file: 0.0.0.0:4443, localhost.pem, current directory.
int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: ./dash_server [config.json]" << std::endl;
        return 1;
    }

    dash::ServerConfig config;
    try {
        if (argc == 2) {
            dash::log_event("Server startup: Loading configuration from " + std::string(argv[1]));
            config = dash::load_server_config(argv[1]);
        }
    } catch (const dash::ConfigError& e) {
        dash::log_error(std::string("FATAL: ") + e.what());
        return 1;
    }

    dash::StaticResponder responder(config, dash::ContentTypeTable::default_table());
    try {
        responder.start();
    } catch (const std::exception& e) {
        dash::log_error(std::string("FATAL: ") + e.what());
        return 1;
    }

    // Serves until the process is terminated.
    responder.wait();
    dash::log_event("Server shutdown: Listener stopped");
    return 0;
}
