#pragma once
#include "bounded_queue.hpp"
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Fixed set of threads draining one record queue. Each record popped by a
// worker is handed to on_line together with the worker index, so handlers can
// keep per-worker state without locking. When the queue is closed and empty
// every worker calls on_drain once.
class WorkerPool {
public:
    using LineHandler = std::function<void(size_t worker, const std::string &line)>;
    using DrainHandler = std::function<void(size_t worker)>;

    WorkerPool(size_t n, BoundedQueue<std::string> &q, LineHandler on_line, DrainHandler on_drain = nullptr);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    size_t size() const noexcept { return workers.size(); }

    // Waits for every worker. Rethrows the first exception raised by a
    // handler, or run_interrupted if g_terminate stopped the workers.
    void join();

private:
    void worker_loop(size_t idx);
    void record_error(std::exception_ptr ep);

    std::vector<std::thread> workers;
    BoundedQueue<std::string> &queue;
    LineHandler on_line;
    DrainHandler on_drain;

    std::mutex err_mu;
    std::exception_ptr first_error;
    std::atomic<bool> interrupted{false};
};
