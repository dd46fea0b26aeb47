#pragma once

#include "risk_analysis.hpp"
#include "risk_types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Fixed-size pool of worker threads draining a FIFO task queue.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void post(std::function<void()> task);

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }
    [[nodiscard]] std::size_t pending() const;

private:
    void workerLoop();

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

// Handle to a simulation running on the pool.
class SimulationJob {
public:
    SimulationJob(std::future<SimulationResult> result, std::shared_ptr<std::atomic<bool>> cancelFlag);

    // Blocks until the run finishes; rethrows its error, including
    // SimulationCancelledError after cancel().
    [[nodiscard]] SimulationResult get();

    // Cooperative: the run stops at the next trial-block boundary.
    void cancel() const noexcept;

    [[nodiscard]] bool ready() const;

private:
    std::future<SimulationResult> result_;
    std::shared_ptr<std::atomic<bool>> cancelFlag_;
};

// Runs simulations off the caller's thread. Requests are validated on the
// calling thread so input errors surface immediately from submit().
class SimulationService {
public:
    explicit SimulationService(std::size_t workers = std::thread::hardware_concurrency());

    [[nodiscard]] SimulationJob submit(const SimulationRequest& request, RunOptions options = {});

    [[nodiscard]] std::size_t workers() const noexcept { return pool_.size(); }

private:
    WorkerPool pool_;
};
