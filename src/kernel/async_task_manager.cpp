#include "kernel/async_task_manager.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace reverie::kernel {

AsyncTaskManager::AsyncTaskManager(size_t worker_count, size_t max_results_per_agent)
    : max_results_per_agent_(max_results_per_agent) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    spdlog::debug("AsyncTaskManager: {} worker(s)", worker_count);
}

AsyncTaskManager::~AsyncTaskManager() {
    stopping_ = true;
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

uint64_t AsyncTaskManager::next_request_id() {
    return next_request_id_.fetch_add(1, std::memory_order_relaxed);
}

bool AsyncTaskManager::submit(uint32_t agent_id, ipc::SyscallOp opcode, uint64_t request_id, TaskFn task,
                              bool keep_result) {
    if (stopping_) {
        return false;
    }

    pending_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(Task{agent_id, request_id, opcode, std::move(task), keep_result});
    }
    queue_cv_.notify_one();
    return true;
}

std::vector<AsyncTaskManager::AsyncResult> AsyncTaskManager::poll(uint32_t agent_id, int max_results) {
    std::vector<AsyncResult> results;
    if (max_results <= 0) {
        return results;
    }

    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = results_.find(agent_id);
    if (it == results_.end()) {
        return results;
    }

    auto& queue = it->second.results;
    while (!queue.empty() && static_cast<int>(results.size()) < max_results) {
        results.push_back(queue.front());
        queue.pop_front();
    }

    return results;
}

size_t AsyncTaskManager::queued_results(uint32_t agent_id) {
    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = results_.find(agent_id);
    return it == results_.end() ? 0 : it->second.results.size();
}

uint64_t AsyncTaskManager::dropped_results(uint32_t agent_id) {
    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = results_.find(agent_id);
    return it == results_.end() ? 0 : it->second.dropped;
}

bool AsyncTaskManager::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return pending_.load() == 0; });
}

void AsyncTaskManager::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        AsyncResult result{task.request_id, task.opcode, {}};
        try {
            ipc::Message response = task.fn();
            result.payload = response.payload_str();
        } catch (const std::exception& e) {
            spdlog::error("AsyncTaskManager: {} request {} failed: {}",
                          ipc::opcode_to_string(task.opcode), task.request_id, e.what());
            nlohmann::json response;
            response["success"] = false;
            response["error"] = e.what();
            result.payload = response.dump();
        }

        if (task.keep_result) {
            std::lock_guard<std::mutex> lock(results_mutex_);
            auto& queue = results_[task.agent_id];
            if (max_results_per_agent_ > 0 && queue.results.size() >= max_results_per_agent_) {
                queue.results.pop_front();
                queue.dropped++;
                spdlog::warn("AsyncTaskManager: result queue for agent {} full, oldest result dropped",
                             task.agent_id);
            }
            queue.results.push_back(std::move(result));
        }

        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            pending_.fetch_sub(1);
        }
        idle_cv_.notify_all();
    }
}

} // namespace reverie::kernel
