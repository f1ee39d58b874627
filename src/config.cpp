#include "dash/config.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace dash {

namespace {

json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot read the configuration file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigError("JSON formatting error in '" + path + "': " + e.what());
    }
}

const json* section(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) {
        throw ConfigError(std::string("'") + key + "' must be an object");
    }
    return &*it;
}

void read_string(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    out = it->get<std::string>();
}

void read_bool(const json& obj, const char* key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_boolean()) {
        throw ConfigError(std::string("'") + key + "' must be a boolean");
    }
    out = it->get<bool>();
}

// Positive integer, e.g. thread and connection counts.
void read_count(const json& obj, const char* key, size_t& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_number_integer() || it->get<long long>() <= 0) {
        throw ConfigError(std::string("'") + key + "' must be a positive integer");
    }
    out = it->get<size_t>();
}

// Upper bound for timeouts and deadlines, keeps millisecond conversions in range.
constexpr double max_seconds = 86400.0;

void read_seconds(const json& obj, const char* key, double& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_number() || !(it->get<double>() >= 0.0 && it->get<double>() <= max_seconds)) {
        throw ConfigError(std::string("'") + key + "' must be between 0 and 86400 seconds");
    }
    out = it->get<double>();
}

// Ports are accepted both as numbers and as decimal strings ("9443").
void read_port(const json& obj, const char* key, int& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;

    long long value = -1;
    if (it->is_number_integer()) {
        value = it->get<long long>();
    } else if (it->is_string()) {
        const std::string text = it->get<std::string>();
        if (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos
            && text.size() <= 5) {
            value = std::stoll(text);
        }
    }
    if (value < 0 || value > 65535) {
        throw ConfigError(std::string("'") + key + "' must be a port number between 0 and 65535");
    }
    out = static_cast<int>(value);
}

} // namespace

ServerConfig load_server_config(const std::string& path) {
    json root = read_json_file(path);
    if (!root.is_object()) {
        throw ConfigError("Top level of '" + path + "' must be an object");
    }

    ServerConfig config;
    try {
        if (const json* network = section(root, "network")) {
            read_string(*network, "address", config.network.address);
            read_port(*network, "port", config.network.port);
            read_string(*network, "allowOrigin", config.network.allow_origin);
        }
        if (const json* performance = section(root, "performance")) {
            read_count(*performance, "threadPoolSize", config.performance.thread_pool_size);
            read_seconds(*performance, "connectionTimeout", config.performance.connection_timeout);
        }
        if (const json* security = section(root, "security")) {
            read_bool(*security, "https", config.security.https);
            read_string(*security, "certificateFile", config.security.certificate_file);
            read_string(*security, "privateKeyFile", config.security.private_key_file);
        }
        if (const json* content = section(root, "content")) {
            read_string(*content, "root", config.root);
        }
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
    return config;
}

HarnessConfig load_harness_config(const std::string& path) {
    json root = read_json_file(path);
    if (!root.is_object()) {
        throw ConfigError("Top level of '" + path + "' must be an object");
    }

    HarnessConfig config;
    try {
        read_string(root, "host", config.host);
        read_port(root, "port", config.port);
        read_string(root, "path", config.path);
        read_count(root, "connections", config.connections);
        read_count(root, "iterations", config.iterations);
        read_bool(root, "verifyCertificate", config.verify_certificate);
        read_string(root, "caCertFile", config.ca_cert_file);
        read_count(root, "maxThreads", config.max_threads);
        read_seconds(root, "connectionTimeout", config.connection_timeout);
        read_seconds(root, "readTimeout", config.read_timeout);
        read_seconds(root, "deadline", config.deadline);
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
    if (config.path.empty() || config.path[0] != '/') {
        throw ConfigError(path + ": 'path' must start with '/'");
    }
    return config;
}

} // namespace dash
