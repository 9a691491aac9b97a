#include "kernel/syscall_router.hpp"
#include "memory/errors.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace reverie::kernel {

namespace {

ipc::Message error_reply(const ipc::Message& msg, const std::string& error) {
    nlohmann::json response;
    response["success"] = false;
    response["error"] = error;
    return ipc::Message(msg.agent_id, msg.opcode, response.dump());
}

} // namespace

ipc::Message SyscallRouter::handle(const ipc::Message& msg) const {
    auto it = handlers_.find(msg.opcode);
    if (it == handlers_.end()) {
        spdlog::warn("Unknown opcode: 0x{:02x}", static_cast<uint8_t>(msg.opcode));
        return error_reply(msg, "unknown opcode");
    }

    try {
        return it->second(msg);
    } catch (const memory::MemoryError& e) {
        spdlog::warn("Agent {} {} failed: {}", msg.agent_id, ipc::opcode_to_string(msg.opcode), e.what());
        return error_reply(msg, e.what());
    } catch (const nlohmann::json::exception& e) {
        return error_reply(msg, std::string("invalid request: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Agent {} {} raised: {}", msg.agent_id, ipc::opcode_to_string(msg.opcode), e.what());
        return error_reply(msg, std::string("internal error: ") + e.what());
    }
}

void SyscallRouter::register_handler(ipc::SyscallOp op, Handler handler) {
    if (handlers_.count(op) > 0) {
        spdlog::warn("SyscallRouter: handler for {} replaced", ipc::opcode_to_string(op));
    }
    handlers_[op] = std::move(handler);
}

} // namespace reverie::kernel
