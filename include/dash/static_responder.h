#pragma once
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "dash/config.h"
#include "dash/content_types.h"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace dash {

// Thrown by StaticResponder::start() when the TLS identity cannot be loaded,
// the document root is missing or the listener cannot be bound.
class StartupError : public std::runtime_error {
public:
    explicit StartupError(const std::string& what) : std::runtime_error(what) {}
};

// Static file server over HTTPS (or plain HTTP when security.https is off).
// GET and HEAD map the request path onto config.root; the response
// Content-Type comes from the ContentTypeTable given at construction.
class StaticResponder {
public:
    StaticResponder(ServerConfig config, ContentTypeTable types);
    ~StaticResponder();

    StaticResponder(const StaticResponder&) = delete;
    StaticResponder& operator=(const StaticResponder&) = delete;

    // Loads the certificate, binds and starts accepting on a background
    // thread. Connections are accepted as soon as this returns.
    void start();

    // Stops accepting and joins the listener thread. Safe to call twice.
    void stop();

    // Blocks until the responder has stopped.
    void wait();

    int port() const { return _port; }
    bool is_running() const;

    const ServerConfig& config() const { return _config; }

private:
    void register_routes();
    void serve_file(const httplib::Request& req, httplib::Response& res) const;

    const ServerConfig _config;
    const ContentTypeTable _types;

    std::unique_ptr<httplib::Server> _server;
    std::thread _listener;
    int _port = -1;

    mutable std::mutex _mtx;
    std::condition_variable _stopped_cv;
    bool _running = false;
};

} // namespace dash
