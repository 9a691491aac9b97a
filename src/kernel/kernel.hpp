/**
 * Reverie Kernel
 *
 * Wires the memory service to the syscall surface:
 * - MemoryService (store, retrieval, dream cycle)
 * - EventBus (memory events for subscribed agents)
 * - AsyncTaskManager (background consolidation)
 * - DreamScheduler (periodic consolidation on tick)
 */
#pragma once
#include <memory>
#include <vector>
#include "ipc/protocol.hpp"
#include "kernel/async_task_manager.hpp"
#include "kernel/config.hpp"
#include "kernel/dream_scheduler.hpp"
#include "kernel/event_bus.hpp"
#include "kernel/syscall_handlers.hpp"
#include "kernel/syscall_router.hpp"
#include "memory/memory_service.hpp"
#include "memory/providers.hpp"

namespace reverie::kernel {

class Kernel {
public:
    using Config = KernelConfig;

    // Throws memory::StorageUnavailable when persisted memory cannot be loaded.
    explicit Kernel(const Config& config,
                    std::shared_ptr<memory::ExtractionProvider> extractor = nullptr,
                    std::shared_ptr<memory::EmbeddingProvider> embedder = nullptr);
    ~Kernel();

    // Non-copyable
    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Dispatch one syscall
    ipc::Message handle(const ipc::Message& msg);

    // Give every module its periodic turn
    void tick();

    memory::MemoryService& memory() { return *memory_; }
    EventBus& events() { return event_bus_; }
    AsyncTaskManager& async_tasks() { return *async_tasks_; }
    DreamScheduler& dream_scheduler() { return *dream_scheduler_; }
    const Config& get_config() const { return config_; }

private:
    Config config_;
    std::unique_ptr<memory::MemoryService> memory_;
    EventBus event_bus_;
    std::unique_ptr<AsyncTaskManager> async_tasks_;
    std::unique_ptr<KernelContext> context_;
    SyscallRouter router_;
    std::vector<std::unique_ptr<KernelModule>> modules_;
    DreamScheduler* dream_scheduler_ = nullptr;
};

} // namespace reverie::kernel
