#include "dash/static_responder.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include <httplib.h>

#include "dash/logger.h"

namespace fs = std::filesystem;

namespace dash {

namespace {

void plain_error(httplib::Response& res, int status) {
    res.status = status;
    res.set_content(std::to_string(status) + " " + httplib::status_message(status) + "\n",
                    "text/plain");
}

// True if any segment of the request path is "..".
bool escapes_root(const std::string& path) {
    std::stringstream segments(path);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment == "..") return true;
    }
    return false;
}

// True if `target` resolves to `root` or a location below it.
bool within_root(const fs::path& root, const fs::path& target) {
    std::error_code ec;
    fs::path base = fs::weakly_canonical(root, ec);
    if (ec) return false;
    fs::path resolved = fs::weakly_canonical(target, ec);
    if (ec) return false;
    auto diverge = std::mismatch(base.begin(), base.end(), resolved.begin(), resolved.end());
    return diverge.first == base.end();
}

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // namespace

StaticResponder::StaticResponder(ServerConfig config, ContentTypeTable types)
    : _config(std::move(config)), _types(std::move(types)) {}

StaticResponder::~StaticResponder() {
    stop();
}

void StaticResponder::start() {
    if (_server) {
        throw StartupError("Responder already started");
    }

    std::error_code ec;
    if (!fs::is_directory(_config.root, ec)) {
        throw StartupError("Document root '" + _config.root + "' is not a directory");
    }

    std::unique_ptr<httplib::Server> server;
    if (_config.security.https) {
        const std::string& cert = _config.security.certificate_file;
        const std::string& key = _config.security.private_key_file;
        auto ssl = std::make_unique<httplib::SSLServer>(cert.c_str(), key.c_str());
        if (!ssl->is_valid()) {
            throw StartupError("Cannot load TLS certificate '" + cert + "' with private key '" + key + "'");
        }
        server = std::move(ssl);
    } else {
        server = std::make_unique<httplib::Server>();
    }
    _server = std::move(server);

    // Bounds the number of connections served at once.
    const size_t pool_size = _config.performance.thread_pool_size;
    _server->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    if (_config.performance.connection_timeout > 0.0) {
        _server->set_read_timeout(to_millis(_config.performance.connection_timeout));
        _server->set_write_timeout(to_millis(_config.performance.connection_timeout));
    }

    register_routes();

    const std::string& address = _config.network.address;
    if (_config.network.port == 0) {
        _port = _server->bind_to_any_port(address);
    } else if (_server->bind_to_port(address, _config.network.port)) {
        _port = _config.network.port;
    } else {
        _port = -1;
    }
    if (_port < 0) {
        _server.reset();
        throw StartupError("Cannot bind " + address + ":" + std::to_string(_config.network.port));
    }

    {
        std::lock_guard<std::mutex> lock(_mtx);
        _running = true;
    }

    log_event("Server startup: Listening on " + address + ":" + std::to_string(_port)
              + (_config.security.https ? " (https)" : " (http)")
              + " with " + std::to_string(pool_size) + " threads, serving '" + _config.root + "'");

    _listener = std::thread([this] {
        if (!_server->listen_after_bind()) {
            log_error("Server: Listener terminated with an error on port " + std::to_string(_port));
        }
        {
            std::lock_guard<std::mutex> lock(_mtx);
            _running = false;
        }
        _stopped_cv.notify_all();
    });

    // stop() is a no-op until the accept loop runs, so do not return before it does.
    while (!_server->is_running() && is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void StaticResponder::stop() {
    if (!_server) return;
    _server->stop();
    if (_listener.joinable()) {
        _listener.join();
        log_event("Server shutdown: Listener stopped on port " + std::to_string(_port));
    }
}

void StaticResponder::wait() {
    std::unique_lock<std::mutex> lock(_mtx);
    _stopped_cv.wait(lock, [this] { return !_running; });
}

bool StaticResponder::is_running() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _running;
}

void StaticResponder::register_routes() {
    _server->Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
        serve_file(req, res);
    });

    // Only GET (and HEAD, routed to GET by httplib) are served.
    auto not_allowed = [](const httplib::Request&, httplib::Response& res) {
        plain_error(res, 405);
        res.set_header("Allow", "GET, HEAD");
    };
    _server->Post(".*", not_allowed);
    _server->Put(".*", not_allowed);
    _server->Patch(".*", not_allowed);
    _server->Delete(".*", not_allowed);
    _server->Options(".*", not_allowed);

    // Errors produced by httplib itself (bad request line, timeouts) still get a body.
    _server->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) plain_error(res, res.status);
    });

    _server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        log_event("HTTP REQUEST: " + req.method + " " + req.path + " -> " + std::to_string(res.status)
                  + " (" + std::to_string(res.body.size()) + " bytes)");
    });
}

void StaticResponder::serve_file(const httplib::Request& req, httplib::Response& res) const {
    const std::string& path = req.path;
    if (path.empty() || path[0] != '/' || path.find('\0') != std::string::npos) {
        plain_error(res, 400);
        return;
    }
    if (escapes_root(path)) {
        plain_error(res, 403);
        return;
    }

    // "//etc/passwd" would otherwise replace the root on join.
    fs::path relative(path.substr(1));
    if (relative.has_root_name() || relative.has_root_directory()) {
        plain_error(res, 403);
        return;
    }
    fs::path target = fs::path(_config.root) / relative;
    if (!within_root(_config.root, target)) {
        plain_error(res, 403);
        return;
    }

    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        target /= "index.html";
    }
    fs::file_status status = fs::status(target, ec);
    if (!fs::exists(status)) {
        plain_error(res, 404);
        return;
    }
    if (!fs::is_regular_file(status)) {
        plain_error(res, 403);
        return;
    }

    std::ifstream in(target, std::ios::binary);
    if (!in) {
        plain_error(res, 403);
        return;
    }
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        log_error("Server: Read failed for '" + target.string() + "'");
        plain_error(res, 500);
        return;
    }

    res.status = 200;
    if (!_config.network.allow_origin.empty()) {
        res.set_header("Access-Control-Allow-Origin", _config.network.allow_origin);
    }
    res.set_content(std::move(body), _types.lookup(target.generic_string()));
}

} // namespace dash
