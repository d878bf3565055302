// Worker threads are wrapped in try/catch and report exceptions via
// safe_log(); the first one is handed back to the caller by join().

#include "worker_pool.hpp"
#include "errors.hpp"
#include "global_ctl.hpp"
#include "util_log.hpp"

WorkerPool::WorkerPool(size_t num_workers, BoundedQueue<std::string> &queue_,
                       LineHandler on_line_, DrainHandler on_drain_)
    : queue(queue_), on_line(std::move(on_line_)), on_drain(std::move(on_drain_))
{
    size_t n = (num_workers == 0) ? 1 : num_workers;
    workers.reserve(n);
    try {
        for (size_t i = 0; i < n; ++i) {
            workers.emplace_back([this, i]() { worker_loop(i); });
        }
    } catch (...) {
        // thread creation failed part way: release the ones already running
        queue.close();
        for (auto &t : workers) if (t.joinable()) t.join();
        throw;
    }
}

void WorkerPool::worker_loop(size_t idx) {
    try {
        std::string line;
        while (queue.pop(line)) {
            if (g_terminate.load()) {
                interrupted.store(true);
                queue.close();
                return;
            }
            on_line(idx, line);
        }
        if (g_terminate.load()) {
            interrupted.store(true);
            return;
        }
        if (on_drain) on_drain(idx);
    } catch (const std::exception &ex) {
        safe_log(std::string("worker ") + std::to_string(idx) + ": exception: " + ex.what());
        record_error(std::current_exception());
    } catch (...) {
        safe_log(std::string("worker ") + std::to_string(idx) + ": unknown exception");
        record_error(std::current_exception());
    }
}

void WorkerPool::record_error(std::exception_ptr ep) {
    {
        std::lock_guard<std::mutex> lk(err_mu);
        if (!first_error) first_error = ep;
    }
    // unblock the producer; the run is lost anyway
    queue.close();
}

void WorkerPool::join() {
    for (auto &t : workers) {
        if (t.joinable()) t.join();
    }
    std::exception_ptr ep;
    {
        std::lock_guard<std::mutex> lk(err_mu);
        ep = first_error;
    }
    if (ep) std::rethrow_exception(ep);
    if (interrupted.load()) throw run_interrupted("worker pool interrupted");
}

WorkerPool::~WorkerPool() {
    queue.close();
    for (auto &t : workers) {
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::exception &ex) {
                safe_log(std::string("Exception joining worker thread: ") + ex.what());
            }
        }
    }
}
