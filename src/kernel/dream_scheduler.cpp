#include "kernel/dream_scheduler.hpp"
#include "kernel/async_task_manager.hpp"
#include "memory/memory_service.hpp"
#include <spdlog/spdlog.h>

namespace reverie::kernel {

DreamScheduler::DreamScheduler(KernelContext& context, memory::Timestamp interval_ms)
    : context_(context), interval_ms_(interval_ms) {}

void DreamScheduler::register_syscalls(SyscallRouter& router) {
    // Consolidation on demand goes through SYS_CONSOLIDATE. Scheduled runs
    // publish their reports as CONSOLIDATION_* events only.
    (void)router;
}

void DreamScheduler::on_tick() {
    if (interval_ms_ <= 0 || in_flight_.load()) {
        return;
    }

    const memory::Timestamp now = context_.memory.store().now();
    if (last_submit_ == 0) {
        // First tick starts the interval.
        last_submit_ = now;
        return;
    }
    if (now - last_submit_ < interval_ms_) {
        return;
    }

    in_flight_ = true;
    last_submit_ = now;
    const uint64_t request_id = context_.async_tasks.next_request_id();
    bool queued = context_.async_tasks.submit(0, ipc::SyscallOp::SYS_CONSOLIDATE, request_id,
        [this]() {
            struct ClearFlag {
                std::atomic<bool>& flag;
                ~ClearFlag() { flag = false; }
            } clear{in_flight_};
            return MemorySyscalls::run_consolidation(context_, 0);
        },
        false);

    if (!queued) {
        in_flight_ = false;
        spdlog::warn("DreamScheduler: worker pool unavailable, dream cycle skipped");
        return;
    }
    runs_submitted_++;
    spdlog::debug("DreamScheduler: dream cycle queued (request {})", request_id);
}

} // namespace reverie::kernel
