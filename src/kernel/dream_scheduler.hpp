#pragma once
#include <atomic>
#include <cstdint>
#include "kernel/syscall_router.hpp"
#include "kernel/syscall_handlers.hpp"
#include "memory/types.hpp"

namespace reverie::kernel {

// Periodic trigger for the dream cycle. Each tick checks whether the
// interval has elapsed and, if so, queues one consolidation on the worker
// pool. Reports go out as CONSOLIDATION_* events, not into an async queue.
class DreamScheduler : public KernelModule {
public:
    DreamScheduler(KernelContext& context, memory::Timestamp interval_ms);

    const char* name() const override { return "dream_scheduler"; }
    void register_syscalls(SyscallRouter& router) override;
    void on_tick() override;

    bool in_flight() const { return in_flight_.load(); }
    uint64_t runs_submitted() const { return runs_submitted_.load(); }

private:
    KernelContext& context_;
    memory::Timestamp interval_ms_;
    memory::Timestamp last_submit_ = 0;
    std::atomic<bool> in_flight_{false};
    std::atomic<uint64_t> runs_submitted_{0};
};

} // namespace reverie::kernel
