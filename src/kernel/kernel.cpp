#include "kernel/kernel.hpp"
#include <spdlog/spdlog.h>

namespace reverie::kernel {

Kernel::Kernel(const Config& config,
               std::shared_ptr<memory::ExtractionProvider> extractor,
               std::shared_ptr<memory::EmbeddingProvider> embedder)
    : config_(config) {
    memory_ = memory::MemoryService::open(config_.memory, std::move(extractor), std::move(embedder));
    async_tasks_ = std::make_unique<AsyncTaskManager>(config_.worker_count);
    context_ = std::make_unique<KernelContext>(KernelContext{*memory_, event_bus_, *async_tasks_});

    modules_.push_back(std::make_unique<MemorySyscalls>(*context_));
    modules_.push_back(std::make_unique<EventSyscalls>(*context_));
    modules_.push_back(std::make_unique<AsyncSyscalls>(*context_));
    auto scheduler = std::make_unique<DreamScheduler>(*context_, config_.memory.dream_interval_ms);
    dream_scheduler_ = scheduler.get();
    modules_.push_back(std::move(scheduler));

    for (auto& module : modules_) {
        module->register_syscalls(router_);
        spdlog::debug("Kernel: module {} registered", module->name());
    }

    spdlog::info("Kernel: ready ({} workers, dream interval {}ms)",
                 config_.worker_count, config_.memory.dream_interval_ms);
}

Kernel::~Kernel() {
    // Workers may still be running a dream cycle against memory_.
    async_tasks_.reset();
}

ipc::Message Kernel::handle(const ipc::Message& msg) {
    return router_.handle(msg);
}

void Kernel::tick() {
    for (auto& module : modules_) {
        module->on_tick();
    }
}

} // namespace reverie::kernel
