#include "ipc/protocol.hpp"

namespace reverie::ipc {

const char* opcode_to_string(SyscallOp op) {
    switch (op) {
        case SyscallOp::SYS_NOOP:                return "NOOP";
        case SyscallOp::SYS_APPEND_EPISODE:      return "APPEND_EPISODE";
        case SyscallOp::SYS_QUERY_MEMORY:        return "QUERY_MEMORY";
        case SyscallOp::SYS_GET:                 return "GET";
        case SyscallOp::SYS_LIST:                return "LIST";
        case SyscallOp::SYS_EVIDENCE:            return "EVIDENCE";
        case SyscallOp::SYS_INSPECT:             return "INSPECT";
        case SyscallOp::SYS_WATERMARK:           return "WATERMARK";
        case SyscallOp::SYS_CREATE_GOAL:         return "CREATE_GOAL";
        case SyscallOp::SYS_UPDATE_GOAL:         return "UPDATE_GOAL";
        case SyscallOp::SYS_REGISTER_HYPOTHESIS: return "REGISTER_HYPOTHESIS";
        case SyscallOp::SYS_RESOLVE_HYPOTHESIS:  return "RESOLVE_HYPOTHESIS";
        case SyscallOp::SYS_CONSOLIDATE:         return "CONSOLIDATE";
        case SyscallOp::SYS_SUBSCRIBE:           return "SUBSCRIBE";
        case SyscallOp::SYS_UNSUBSCRIBE:         return "UNSUBSCRIBE";
        case SyscallOp::SYS_POLL_EVENTS:         return "POLL_EVENTS";
        case SyscallOp::SYS_EMIT:                return "EMIT";
        case SyscallOp::SYS_ASYNC_POLL:          return "ASYNC_POLL";
        default: return "UNKNOWN";
    }
}

} // namespace reverie::ipc
