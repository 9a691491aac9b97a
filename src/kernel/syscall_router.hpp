#pragma once
#include <functional>
#include <unordered_map>
#include "ipc/protocol.hpp"

namespace reverie::kernel {

class SyscallRouter;

// A group of syscalls plus an optional periodic hook
class KernelModule {
public:
    virtual ~KernelModule() = default;
    virtual const char* name() const = 0;
    virtual void register_syscalls(SyscallRouter& router) = 0;
    virtual void on_tick() {}
};

// Centralized syscall dispatch table. Handlers may throw; memory errors and
// malformed payloads are turned into {"success": false, "error": ...}
// replies here.
class SyscallRouter {
public:
    using Handler = std::function<ipc::Message(const ipc::Message&)>;

    SyscallRouter() = default;

    ipc::Message handle(const ipc::Message& msg) const;

    // Later registrations for the same opcode replace earlier ones.
    void register_handler(ipc::SyscallOp op, Handler handler);

private:
    std::unordered_map<ipc::SyscallOp, Handler> handlers_;
};

} // namespace reverie::kernel
