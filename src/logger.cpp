#include "dash/logger.h"

#include <iostream>
#include <mutex>

namespace dash {

namespace {
std::mutex log_mutex;
}

void log_event(const std::string& event) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cout << "[LOG] " << event << std::endl;
}

void log_error(const std::string& event) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << "[ERROR] " << event << std::endl;
}

} // namespace dash
