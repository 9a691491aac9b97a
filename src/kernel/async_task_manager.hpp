#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "ipc/protocol.hpp"

namespace reverie::kernel {

// Worker pool for syscalls that may run long (consolidation). Results are
// queued per agent and collected with SYS_ASYNC_POLL. A full result queue
// drops its oldest entry.
class AsyncTaskManager {
public:
    using TaskFn = std::function<ipc::Message()>;

    struct AsyncResult {
        uint64_t request_id;
        ipc::SyscallOp opcode;
        std::string payload;
    };

    explicit AsyncTaskManager(size_t worker_count = 2, size_t max_results_per_agent = 1024);
    ~AsyncTaskManager();

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    uint64_t next_request_id();
    // With keep_result false the reply is discarded once the task finishes.
    bool submit(uint32_t agent_id, ipc::SyscallOp opcode, uint64_t request_id, TaskFn task,
                bool keep_result = true);
    std::vector<AsyncResult> poll(uint32_t agent_id, int max_results);

    // Results waiting for an agent
    size_t queued_results(uint32_t agent_id);
    uint64_t dropped_results(uint32_t agent_id);

    // Tasks queued or executing
    size_t pending() const { return pending_.load(); }

    // Blocks until nothing is pending or the timeout passes. Returns true when idle.
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    struct Task {
        uint32_t agent_id;
        uint64_t request_id;
        ipc::SyscallOp opcode;
        TaskFn fn;
        bool keep_result = true;
    };

    struct ResultQueue {
        std::deque<AsyncResult> results;
        uint64_t dropped = 0;
    };

    void worker_loop();

    std::deque<Task> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopping_{false};

    std::atomic<size_t> pending_{0};
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;

    size_t max_results_per_agent_;
    std::unordered_map<uint32_t, ResultQueue> results_;
    std::mutex results_mutex_;

    std::atomic<uint64_t> next_request_id_{1};
};

} // namespace reverie::kernel
