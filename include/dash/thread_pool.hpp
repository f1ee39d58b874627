#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace dash {

// Fixed set of worker threads draining a FIFO task queue. wait() is the
// join barrier: it returns once every task enqueued so far has finished.
class ThreadPool {
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex mtx;
    std::condition_variable cv;
    std::condition_variable idle_cv;
    size_t pending = 0; // queued + running
    bool stop = false;

public:
    explicit ThreadPool(size_t n) {
        if (n == 0) n = 1;
        workers.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            workers.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(mtx);
                        cv.wait(lock, [this] { return stop || !tasks.empty(); });
                        if (stop && tasks.empty()) return;
                        task = std::move(tasks.front());
                        tasks.pop();
                    }
                    task();
                    {
                        std::lock_guard<std::mutex> lock(mtx);
                        if (--pending == 0) idle_cv.notify_all();
                    }
                }
            });
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stop = true;
        }
        cv.notify_all();
        for (auto& w : workers) w.join();
    }

    // Tasks must not throw; an escaping exception terminates the process.
    void enqueue(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            tasks.push(std::move(task));
            ++pending;
        }
        cv.notify_one();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mtx);
        idle_cv.wait(lock, [this] { return pending == 0; });
    }

    // Returns false if tasks are still pending when the timeout expires.
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        return idle_cv.wait_for(lock, timeout, [this] { return pending == 0; });
    }

    size_t size() const { return workers.size(); }
};

} // namespace dash
