#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"
#include "kernel/syscall_router.hpp"
#include "kernel/event_bus.hpp"

namespace reverie::memory {
class MemoryService;
}

namespace reverie::kernel {

class AsyncTaskManager;

// Shared state handed to every syscall module
struct KernelContext {
    memory::MemoryService& memory;
    EventBus& event_bus;
    AsyncTaskManager& async_tasks;
};

class MemorySyscalls : public KernelModule {
public:
    explicit MemorySyscalls(KernelContext& context) : context_(context) {}
    const char* name() const override { return "memory"; }
    void register_syscalls(SyscallRouter& router) override;

    // Runs one dream cycle, publishes its events and builds the response.
    static ipc::Message run_consolidation(KernelContext& context, uint32_t agent_id);

private:
    KernelContext& context_;

    ipc::Message handle_append_episode(const ipc::Message& msg);
    ipc::Message handle_query_memory(const ipc::Message& msg);
    ipc::Message handle_get(const ipc::Message& msg);
    ipc::Message handle_list(const ipc::Message& msg);
    ipc::Message handle_evidence(const ipc::Message& msg);
    ipc::Message handle_inspect(const ipc::Message& msg);
    ipc::Message handle_watermark(const ipc::Message& msg);
    ipc::Message handle_create_goal(const ipc::Message& msg);
    ipc::Message handle_update_goal(const ipc::Message& msg);
    ipc::Message handle_register_hypothesis(const ipc::Message& msg);
    ipc::Message handle_resolve_hypothesis(const ipc::Message& msg);
    ipc::Message handle_consolidate(const ipc::Message& msg);
};

class EventSyscalls : public KernelModule {
public:
    explicit EventSyscalls(KernelContext& context) : context_(context) {}
    const char* name() const override { return "events"; }
    void register_syscalls(SyscallRouter& router) override;

private:
    KernelContext& context_;

    void emit_event(KernelEventType type, const nlohmann::json& data, uint32_t source_agent_id);
    ipc::Message handle_subscribe(const ipc::Message& msg);
    ipc::Message handle_unsubscribe(const ipc::Message& msg);
    ipc::Message handle_poll_events(const ipc::Message& msg);
    ipc::Message handle_emit(const ipc::Message& msg);
};

class AsyncSyscalls : public KernelModule {
public:
    explicit AsyncSyscalls(KernelContext& context) : context_(context) {}
    const char* name() const override { return "async"; }
    void register_syscalls(SyscallRouter& router) override;

private:
    KernelContext& context_;

    ipc::Message handle_async_poll(const ipc::Message& msg);
};

} // namespace reverie::kernel
