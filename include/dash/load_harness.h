#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "dash/config.h"

namespace dash {

// The endpoint every worker requests. Built once per run, never mutated.
struct RequestTarget {
    const std::string host;
    const int port;
    const std::string path;
    const bool verify_certificate;
    const std::string ca_cert_file;
    const std::chrono::milliseconds connection_timeout;
    const std::chrono::milliseconds read_timeout;

    static RequestTarget from_config(const HarnessConfig& config);
    std::string url() const;
};

// Totals shared by all workers of one run. Counters are atomic; the error
// samples are guarded by a mutex and capped at max_samples.
class RunStats {
public:
    static constexpr size_t max_samples = 10;

    std::atomic<long long> attempted{0};
    std::atomic<long long> succeeded{0};
    std::atomic<long long> status_failures{0};
    std::atomic<long long> transport_failures{0};
    std::atomic<long long> hard_failures{0};
    std::atomic<long long> aborted_workers{0};

    void sample_error(const std::string& error);
    std::vector<std::string> samples() const;

private:
    mutable std::mutex _mtx;
    std::vector<std::string> _samples;
};

struct RunSummary {
    long long attempted = 0;
    long long succeeded = 0;
    long long status_failures = 0;    // non-200, worker continued
    long long transport_failures = 0; // no response, worker aborted
    long long hard_failures = 0;      // empty body, worker aborted
    long long aborted_workers = 0;
    bool deadline_expired = false;
    double elapsed_seconds = 0.0;
    std::vector<std::string> sampled_errors;

    // No worker aborted and the run finished in time.
    bool ok() const {
        return hard_failures == 0 && transport_failures == 0 && !deadline_expired;
    }
};

// One worker: `iterations` sequential GETs, a new TLS connection each time.
// Stops early on an empty body, a transport error or when `cancel` is set.
void run_worker(const RequestTarget& target, size_t worker_id, size_t iterations,
                RunStats& stats, const std::atomic<bool>& cancel);

// Runs config.connections workers on a pool of at most config.max_threads
// threads and blocks until all are done or the deadline expires.
RunSummary run_load(const HarnessConfig& config);

void print_summary(const RunSummary& summary, const RequestTarget& target);

} // namespace dash
