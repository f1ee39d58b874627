// logger.h
#ifndef DASH_LOGGER_H
#define DASH_LOGGER_H

#include <string>

namespace dash {

// Writes "[LOG] <event>" to stdout. Safe to call from any thread.
void log_event(const std::string& event);

// Writes "[ERROR] <event>" to stderr.
void log_error(const std::string& event);

} // namespace dash

#endif // DASH_LOGGER_H
