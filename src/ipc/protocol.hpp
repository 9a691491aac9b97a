/**
 * Reverie syscall protocol
 *
 * A request or response is an opcode plus a JSON payload, tagged with the
 * caller's agent id. Responses reuse the request opcode.
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace reverie::ipc {

enum class SyscallOp : uint8_t {
    SYS_NOOP                = 0x00,

    // Episodes and retrieval
    SYS_APPEND_EPISODE      = 0x10,
    SYS_QUERY_MEMORY        = 0x11,
    SYS_GET                 = 0x12,   // {"type": "belief", "id": 3}
    SYS_LIST                = 0x13,   // {"type": "belief"}
    SYS_EVIDENCE            = 0x14,
    SYS_INSPECT             = 0x15,
    SYS_WATERMARK           = 0x16,

    // Goals
    SYS_CREATE_GOAL         = 0x20,
    SYS_UPDATE_GOAL         = 0x21,

    // Hypotheses
    SYS_REGISTER_HYPOTHESIS = 0x28,
    SYS_RESOLVE_HYPOTHESIS  = 0x29,

    // Dream cycle
    SYS_CONSOLIDATE         = 0x30,

    // Events
    SYS_SUBSCRIBE           = 0x40,
    SYS_UNSUBSCRIBE         = 0x41,
    SYS_POLL_EVENTS         = 0x42,
    SYS_EMIT                = 0x43,

    // Async results
    SYS_ASYNC_POLL          = 0x50
};

const char* opcode_to_string(SyscallOp op);

struct Message {
    uint32_t agent_id = 0;
    SyscallOp opcode = SyscallOp::SYS_NOOP;
    std::vector<uint8_t> payload;

    Message() = default;
    Message(uint32_t id, SyscallOp op, const std::string& data)
        : agent_id(id), opcode(op), payload(data.begin(), data.end()) {}

    std::string payload_str() const {
        return std::string(payload.begin(), payload.end());
    }
};

} // namespace reverie::ipc
