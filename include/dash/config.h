#pragma once
#include <stdexcept>
#include <string>

namespace dash {

// Thrown when a configuration file cannot be read, parsed or validated.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// --- Responder configuration ---

struct NetworkConfig {
    std::string address = "0.0.0.0";
    int port = 4443;                   // 0 binds an ephemeral port
    std::string allow_origin = "*";    // Access-Control-Allow-Origin
};

struct PerformanceConfig {
    size_t thread_pool_size = 4;
    double connection_timeout = 30.0;  // seconds, read and write
};

struct SecurityConfig {
    bool https = true;
    // A combined PEM holding both certificate and key is accepted in both fields.
    std::string certificate_file = "localhost.pem";
    std::string private_key_file = "localhost.pem";
};

struct ServerConfig {
    NetworkConfig network;
    PerformanceConfig performance;
    SecurityConfig security;
    std::string root = ".";
};

// --- Harness configuration ---

struct HarnessConfig {
    std::string host = "localhost";
    int port = 8443;
    std::string path = "/test_data/bunny/stream.mpd";
    size_t connections = 1000;
    size_t iterations = 10;
    bool verify_certificate = true;
    std::string ca_cert_file;          // extra trust anchor, optional
    size_t max_threads = 256;
    double connection_timeout = 5.0;   // seconds
    double read_timeout = 5.0;         // seconds
    double deadline = 300.0;           // seconds for the whole run, 0 = none
};

ServerConfig load_server_config(const std::string& path);
HarnessConfig load_harness_config(const std::string& path);

} // namespace dash
