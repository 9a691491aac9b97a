#include "kernel/syscall_handlers.hpp"
#include "kernel/syscall_router.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace reverie::kernel {

namespace {

ipc::Message error_response(const ipc::Message& msg, ipc::SyscallOp op, const std::string& error) {
    json response;
    response["success"] = false;
    response["error"] = error;
    return ipc::Message(msg.agent_id, op, response.dump());
}

// "event_types", "events" or a single "event"
std::vector<std::string> requested_events(const json& j) {
    std::vector<std::string> names;
    for (const char* key : {"event_types", "events"}) {
        if (j.contains(key) && j[key].is_array()) {
            for (const auto& e : j[key]) {
                names.push_back(e.get<std::string>());
            }
            return names;
        }
    }
    if (j.contains("event")) {
        names.push_back(j["event"].get<std::string>());
    }
    return names;
}

// Names that are not known event types are reported back, not mapped to CUSTOM.
bool parse_event_types(const std::vector<std::string>& names, std::vector<KernelEventType>& types,
                       std::string& unknown) {
    types.reserve(names.size());
    for (const auto& name : names) {
        auto type = kernel_event_type_from_string(name);
        if (type == KernelEventType::CUSTOM && name != "CUSTOM") {
            unknown = name;
            return false;
        }
        types.push_back(type);
    }
    return true;
}

} // namespace

void EventSyscalls::register_syscalls(SyscallRouter& router) {
    router.register_handler(ipc::SyscallOp::SYS_SUBSCRIBE,
        [this](const ipc::Message& msg) { return handle_subscribe(msg); });
    router.register_handler(ipc::SyscallOp::SYS_UNSUBSCRIBE,
        [this](const ipc::Message& msg) { return handle_unsubscribe(msg); });
    router.register_handler(ipc::SyscallOp::SYS_POLL_EVENTS,
        [this](const ipc::Message& msg) { return handle_poll_events(msg); });
    router.register_handler(ipc::SyscallOp::SYS_EMIT,
        [this](const ipc::Message& msg) { return handle_emit(msg); });
}

void EventSyscalls::emit_event(KernelEventType type, const nlohmann::json& data, uint32_t source_agent_id) {
    context_.event_bus.emit(type, data, source_agent_id);
}

ipc::Message EventSyscalls::handle_subscribe(const ipc::Message& msg) {
    try {
        json j = json::parse(msg.payload_str());

        auto names = requested_events(j);
        if (names.empty()) {
            return error_response(msg, ipc::SyscallOp::SYS_SUBSCRIBE, "No events specified");
        }

        std::vector<KernelEventType> types;
        std::string unknown;
        if (!parse_event_types(names, types, unknown)) {
            return error_response(msg, ipc::SyscallOp::SYS_SUBSCRIBE,
                                  "unknown event type '" + unknown + "'");
        }
        context_.event_bus.subscribe(msg.agent_id, types);

        spdlog::debug("Agent {} subscribed to {} event type(s)", msg.agent_id, names.size());

        json response;
        response["success"] = true;
        response["subscribed"] = names;
        return ipc::Message(msg.agent_id, ipc::SyscallOp::SYS_SUBSCRIBE, response.dump());

    } catch (const std::exception& e) {
        return error_response(msg, ipc::SyscallOp::SYS_SUBSCRIBE,
                              std::string("invalid request: ") + e.what());
    }
}

ipc::Message EventSyscalls::handle_unsubscribe(const ipc::Message& msg) {
    try {
        json j = json::parse(msg.payload_str());

        bool unsubscribe_all = j.value("all", false);
        std::vector<KernelEventType> types;
        if (!unsubscribe_all) {
            std::string unknown;
            if (!parse_event_types(requested_events(j), types, unknown)) {
                return error_response(msg, ipc::SyscallOp::SYS_UNSUBSCRIBE,
                                      "unknown event type '" + unknown + "'");
            }
        }

        context_.event_bus.unsubscribe(msg.agent_id, types, unsubscribe_all);

        if (unsubscribe_all) {
            spdlog::debug("Agent {} unsubscribed from all events", msg.agent_id);
        } else {
            spdlog::debug("Agent {} unsubscribed from {} event type(s)", msg.agent_id, types.size());
        }

        json response;
        response["success"] = true;
        return ipc::Message(msg.agent_id, ipc::SyscallOp::SYS_UNSUBSCRIBE, response.dump());

    } catch (const std::exception& e) {
        return error_response(msg, ipc::SyscallOp::SYS_UNSUBSCRIBE,
                              std::string("invalid request: ") + e.what());
    }
}

ipc::Message EventSyscalls::handle_poll_events(const ipc::Message& msg) {
    try {
        json j = json::object();
        if (!msg.payload.empty()) {
            j = json::parse(msg.payload_str());
        }

        int max_events = j.value("max", 100);
        json events_array = context_.event_bus.poll(msg.agent_id, max_events);

        json response;
        response["success"] = true;
        response["events"] = events_array;
        response["count"] = events_array.size();
        response["dropped"] = context_.event_bus.dropped(msg.agent_id);
        return ipc::Message(msg.agent_id, ipc::SyscallOp::SYS_POLL_EVENTS, response.dump());

    } catch (const std::exception& e) {
        return error_response(msg, ipc::SyscallOp::SYS_POLL_EVENTS,
                              std::string("invalid request: ") + e.what());
    }
}

ipc::Message EventSyscalls::handle_emit(const ipc::Message& msg) {
    try {
        json j = json::parse(msg.payload_str());

        // Agents may only publish custom events; memory events come from the store.
        std::string event_name = j.value("event", "CUSTOM");
        json event_data = j.value("data", json::object());
        if (event_name != "CUSTOM") {
            event_data["custom_type"] = event_name;
        }

        emit_event(KernelEventType::CUSTOM, event_data, msg.agent_id);

        spdlog::debug("Agent {} emitted event: {}", msg.agent_id, event_name);

        json response;
        response["success"] = true;
        response["event"] = event_name;
        return ipc::Message(msg.agent_id, ipc::SyscallOp::SYS_EMIT, response.dump());

    } catch (const std::exception& e) {
        return error_response(msg, ipc::SyscallOp::SYS_EMIT,
                              std::string("invalid request: ") + e.what());
    }
}

} // namespace reverie::kernel
