#include "simulation_service.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

WorkerPool::WorkerPool(std::size_t workers) {
    workers = std::max<std::size_t>(1, workers);
    threads_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        threads_.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard guard(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    for (auto& thread : threads_) {
        thread.join();
    }
}

void WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard guard(mutex_);
        if (stopping_) {
            throw std::runtime_error("WorkerPool is shutting down");
        }
        queue_.push_back(std::move(task));
    }
    wake_.notify_one();
}

std::size_t WorkerPool::pending() const {
    std::lock_guard guard(mutex_);
    return queue_.size();
}

// Drains remaining tasks before exiting so no submitted future is orphaned.
void WorkerPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

SimulationJob::SimulationJob(std::future<SimulationResult> result,
                             std::shared_ptr<std::atomic<bool>> cancelFlag)
    : result_(std::move(result)), cancelFlag_(std::move(cancelFlag)) {}

SimulationResult SimulationJob::get() {
    return result_.get();
}

void SimulationJob::cancel() const noexcept {
    cancelFlag_->store(true);
}

bool SimulationJob::ready() const {
    return result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

SimulationService::SimulationService(std::size_t workers) : pool_(workers) {}

SimulationJob SimulationService::submit(const SimulationRequest& request, RunOptions options) {
    PreparedRun run = prepareRun(request);

    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    options.cancelFlag = cancelFlag.get();

    // packaged_task is move-only; std::function needs a copyable callable.
    auto task = std::make_shared<std::packaged_task<SimulationResult()>>(
        [run = std::move(run), options, cancelFlag]() { return executeRun(run, options); });
    std::future<SimulationResult> future = task->get_future();
    pool_.post([task]() { (*task)(); });

    return SimulationJob(std::move(future), std::move(cancelFlag));
}
