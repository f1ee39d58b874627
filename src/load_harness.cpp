#include "dash/load_harness.h"

#include <algorithm>
#include <exception>
#include <iostream>

#include <httplib.h>

#include "dash/logger.h"
#include "dash/thread_pool.hpp"

namespace dash {

namespace {

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::string describe(size_t worker_id, size_t iteration) {
    return "worker " + std::to_string(worker_id) + ", iteration " + std::to_string(iteration);
}

} // namespace

RequestTarget RequestTarget::from_config(const HarnessConfig& config) {
    return RequestTarget{config.host,
                         config.port,
                         config.path,
                         config.verify_certificate,
                         config.ca_cert_file,
                         to_millis(config.connection_timeout),
                         to_millis(config.read_timeout)};
}

std::string RequestTarget::url() const {
    return "https://" + host + ":" + std::to_string(port) + path;
}

void RunStats::sample_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_samples.size() < max_samples) _samples.push_back(error);
}

std::vector<std::string> RunStats::samples() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _samples;
}

void run_worker(const RequestTarget& target, size_t worker_id, size_t iterations,
                RunStats& stats, const std::atomic<bool>& cancel) {
    for (size_t i = 0; i < iterations; ++i) {
        if (cancel) return;

        try {
            // A fresh client per iteration: one TLS handshake, one GET, close.
            httplib::SSLClient cli(target.host, target.port);
            cli.enable_server_certificate_verification(target.verify_certificate);
            if (!target.ca_cert_file.empty()) {
                cli.set_ca_cert_path(target.ca_cert_file.c_str());
            }
            cli.set_connection_timeout(target.connection_timeout);
            cli.set_read_timeout(target.read_timeout);
            cli.set_keep_alive(false);

            stats.attempted++;
            auto res = cli.Get(target.path);

            if (!res) {
                std::string error = "Request failed: " + httplib::to_string(res.error())
                                    + " (" + describe(worker_id, i) + ")";
                log_error(error);
                stats.sample_error(error);
                stats.transport_failures++;
                stats.aborted_workers++;
                return;
            }

            if (res->status != 200) {
                log_event("CONNECTION FAILED");
                log_event(std::to_string(res->status) + " " + httplib::status_message(res->status)
                          + " (" + describe(worker_id, i) + ")");
            }

            if (res->body.empty()) {
                std::string error = "Empty response body with status " + std::to_string(res->status)
                                    + " (" + describe(worker_id, i) + "), aborting worker";
                log_error(error);
                stats.sample_error(error);
                stats.hard_failures++;
                stats.aborted_workers++;
                return;
            }

            if (res->status != 200) {
                stats.sample_error("Status " + std::to_string(res->status) + " for " + target.path
                                   + " (" + describe(worker_id, i) + ")");
                stats.status_failures++;
            } else {
                stats.succeeded++;
            }
        } catch (const std::exception& e) {
            std::string error = std::string("Exception in worker: ") + e.what()
                                + " (" + describe(worker_id, i) + ")";
            log_error(error);
            stats.sample_error(error);
            stats.transport_failures++;
            stats.aborted_workers++;
            return;
        }
    }
}

RunSummary run_load(const HarnessConfig& config) {
    const RequestTarget target = RequestTarget::from_config(config);
    const size_t thread_count = std::max<size_t>(1, std::min(config.connections, config.max_threads));

    log_event("Starting load harness against " + target.url());
    log_event("  Connections: " + std::to_string(config.connections) + ", iterations: "
              + std::to_string(config.iterations) + ", threads: " + std::to_string(thread_count));
    if (!target.verify_certificate) {
        log_event("  TLS certificate verification is DISABLED");
    }

    RunStats stats;
    std::atomic<bool> cancel(false);
    bool expired = false;

    auto start = std::chrono::steady_clock::now();
    {
        ThreadPool pool(thread_count);
        for (size_t id = 0; id < config.connections; ++id) {
            pool.enqueue([&target, &stats, &cancel, &config, id] {
                run_worker(target, id, config.iterations, stats, cancel);
            });
        }

        if (config.deadline > 0.0 && !pool.wait_for(std::chrono::duration<double>(config.deadline))) {
            expired = true;
            cancel = true;
            log_error("Deadline of " + std::to_string(config.deadline)
                      + " s expired, cancelling remaining iterations");
        }
        // In-flight requests are bounded by the per-request timeouts.
        pool.wait();
    }
    auto end = std::chrono::steady_clock::now();

    RunSummary summary;
    summary.attempted = stats.attempted;
    summary.succeeded = stats.succeeded;
    summary.status_failures = stats.status_failures;
    summary.transport_failures = stats.transport_failures;
    summary.hard_failures = stats.hard_failures;
    summary.aborted_workers = stats.aborted_workers;
    summary.deadline_expired = expired;
    summary.elapsed_seconds = std::chrono::duration<double>(end - start).count();
    summary.sampled_errors = stats.samples();
    return summary;
}

void print_summary(const RunSummary& summary, const RequestTarget& target) {
    std::cout << "\n--- Load test finished ---" << std::endl;
    std::cout << "Target: " << target.url() << std::endl;
    std::cout << "Requests attempted: " << summary.attempted << std::endl;
    std::cout << "Succeeded: " << summary.succeeded << std::endl;
    std::cout << "Status failures: " << summary.status_failures << std::endl;
    std::cout << "Transport failures: " << summary.transport_failures << std::endl;
    std::cout << "Empty bodies: " << summary.hard_failures << std::endl;
    std::cout << "Aborted workers: " << summary.aborted_workers << std::endl;
    if (summary.deadline_expired) {
        std::cout << "Deadline expired before all workers finished" << std::endl;
    }
    std::cout << "Total Test Time: " << summary.elapsed_seconds << " s" << std::endl;

    double throughput = summary.elapsed_seconds > 0 ? summary.attempted / summary.elapsed_seconds : 0;
    std::cout << "Average Throughput: " << throughput << " req/sec" << std::endl;

    if (!summary.sampled_errors.empty()) {
        std::cout << "----------------------------------" << std::endl;
        std::cout << "Sampled errors:" << std::endl;
        for (const auto& error : summary.sampled_errors) {
            std::cout << "  " << error << std::endl;
        }
    }
}

} // namespace dash
