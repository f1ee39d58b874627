#include <exception>
#include <iostream>
#include <string>

#include "dash/config.h"
#include "dash/load_harness.h"
#include "dash/logger.h"

// --- Main Function ---
// Usage: ./dash_harness [config.json] [--insecure]
int main(int argc, char* argv[]) {
    std::string config_path;
    bool insecure = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--insecure") {
            insecure = true;
        } else if (config_path.empty() && !arg.empty() && arg[0] != '-') {
            config_path = arg;
        } else {
            std::cerr << "Usage: ./dash_harness [config.json] [--insecure]" << std::endl;
            std::cerr << "  --insecure  skip TLS certificate verification (self-signed test servers)" << std::endl;
            return 1;
        }
    }

    dash::HarnessConfig config;
    try {
        if (!config_path.empty()) {
            config = dash::load_harness_config(config_path);
        }
    } catch (const dash::ConfigError& e) {
        dash::log_error(std::string("FATAL: ") + e.what());
        return 1;
    }
    if (insecure) config.verify_certificate = false;

    try {
        dash::RunSummary summary = dash::run_load(config);
        dash::print_summary(summary, dash::RequestTarget::from_config(config));
        return summary.ok() ? 0 : 1;
    } catch (const std::exception& e) {
        dash::log_error(std::string("FATAL: Load run failed: ") + e.what());
        return 1;
    }
}
