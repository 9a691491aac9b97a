#include "kernel/syscall_handlers.hpp"
#include "kernel/syscall_router.hpp"
#include "kernel/async_task_manager.hpp"
#include "memory/errors.hpp"
#include "memory/memory_service.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace reverie::kernel {

using memory::EntityId;
using memory::EntityType;

namespace {

ipc::Message error_response(const ipc::Message& msg, ipc::SyscallOp op, const std::string& error) {
    json response;
    response["success"] = false;
    response["error"] = error;
    return ipc::Message(msg.agent_id, op, response.dump());
}

json parse_payload(const ipc::Message& msg) {
    if (msg.payload.empty()) {
        return json::object();
    }
    json j = json::parse(msg.payload_str());
    if (!j.is_object()) {
        throw memory::ValidationFailure("payload must be a JSON object");
    }
    return j;
}

EntityId require_id(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number_integer()) {
        throw memory::ValidationFailure(std::string(key) + " is required");
    }
    return j[key].get<EntityId>();
}

EntityType require_type(const json& j) {
    const std::string raw = j.value("type", "");
    auto type = memory::entity_type_from_string(raw);
    if (!type) {
        throw memory::ValidationFailure("unknown entity type '" + raw + "'");
    }
    return *type;
}

template <typename T>
json records(const std::vector<T>& items, size_t limit) {
    json arr = json::array();
    for (const auto& item : items) {
        if (arr.size() >= limit) break;
        arr.push_back(json(item));
    }
    return arr;
}

template <typename T>
json record(const std::optional<T>& item) {
    return item ? json(*item) : json(nullptr);
}

} // namespace

void MemorySyscalls::register_syscalls(SyscallRouter& router) {
    router.register_handler(ipc::SyscallOp::SYS_APPEND_EPISODE,
        [this](const ipc::Message& msg) { return handle_append_episode(msg); });
    router.register_handler(ipc::SyscallOp::SYS_QUERY_MEMORY,
        [this](const ipc::Message& msg) { return handle_query_memory(msg); });
    router.register_handler(ipc::SyscallOp::SYS_GET,
        [this](const ipc::Message& msg) { return handle_get(msg); });
    router.register_handler(ipc::SyscallOp::SYS_LIST,
        [this](const ipc::Message& msg) { return handle_list(msg); });
    router.register_handler(ipc::SyscallOp::SYS_EVIDENCE,
        [this](const ipc::Message& msg) { return handle_evidence(msg); });
    router.register_handler(ipc::SyscallOp::SYS_INSPECT,
        [this](const ipc::Message& msg) { return handle_inspect(msg); });
    router.register_handler(ipc::SyscallOp::SYS_WATERMARK,
        [this](const ipc::Message& msg) { return handle_watermark(msg); });
    router.register_handler(ipc::SyscallOp::SYS_CREATE_GOAL,
        [this](const ipc::Message& msg) { return handle_create_goal(msg); });
    router.register_handler(ipc::SyscallOp::SYS_UPDATE_GOAL,
        [this](const ipc::Message& msg) { return handle_update_goal(msg); });
    router.register_handler(ipc::SyscallOp::SYS_REGISTER_HYPOTHESIS,
        [this](const ipc::Message& msg) { return handle_register_hypothesis(msg); });
    router.register_handler(ipc::SyscallOp::SYS_RESOLVE_HYPOTHESIS,
        [this](const ipc::Message& msg) { return handle_resolve_hypothesis(msg); });
    router.register_handler(ipc::SyscallOp::SYS_CONSOLIDATE,
        [this](const ipc::Message& msg) { return handle_consolidate(msg); });
}

ipc::Message MemorySyscalls::handle_append_episode(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_APPEND_EPISODE;
    json j = parse_payload(msg);

    const std::string kind_str = j.value("kind", "observation");
    auto kind = memory::episode_kind_from_string(kind_str);
    if (!kind) {
        return error_response(msg, op, "unknown episode kind '" + kind_str + "'");
    }

    memory::EpisodePayload payload;
    payload.text = j.value("text", "");
    payload.fields = j.value("fields", json::object());
    payload.verified = j.value("verified", false);
    if (j.contains("goal_id") && !j["goal_id"].is_null()) {
        payload.goal_id = require_id(j, "goal_id");
    }

    std::optional<double> salience;
    if (j.contains("salience") && j["salience"].is_number()) {
        salience = j["salience"].get<double>();
    }

    EntityId id = context_.memory.append_episode(*kind, payload, salience);

    json event_data;
    event_data["episode_id"] = id;
    event_data["kind"] = kind_str;
    context_.event_bus.emit(KernelEventType::EPISODE_APPENDED, event_data, msg.agent_id);

    json response;
    response["success"] = true;
    response["episode_id"] = id;
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::handle_query_memory(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_QUERY_MEMORY;
    auto query = memory::MemoryQuery::from_json(parse_payload(msg));
    auto ranked = context_.memory.query_memory(query);

    json response;
    response["success"] = true;
    response["results"] = ranked;
    response["count"] = ranked.size();
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::handle_get(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_GET;
    json j = parse_payload(msg);
    EntityType type = require_type(j);
    EntityId id = require_id(j, "id");

    json found;
    auto& mem = context_.memory;
    switch (type) {
        case EntityType::EPISODE:    found = record(mem.get_episode(id)); break;
        case EntityType::BELIEF:     found = record(mem.get_belief(id)); break;
        case EntityType::SKILL:      found = record(mem.get_skill(id)); break;
        case EntityType::GOAL:       found = record(mem.get_goal(id)); break;
        case EntityType::SELF_MODEL: found = record(mem.get_self_model(id)); break;
        case EntityType::HYPOTHESIS: found = record(mem.get_hypothesis(id)); break;
    }

    json response;
    response["success"] = true;
    response["exists"] = !found.is_null();
    response["record"] = found;
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::handle_list(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_LIST;
    json j = parse_payload(msg);
    EntityType type = require_type(j);
    size_t limit = j.value("limit", static_cast<size_t>(1000));

    json items;
    auto& mem = context_.memory;
    switch (type) {
        case EntityType::EPISODE:
            items = records(mem.list_episodes(j.value("include_pruned", true)), limit);
            break;
        case EntityType::BELIEF:     items = records(mem.list_beliefs(), limit); break;
        case EntityType::SKILL:      items = records(mem.list_skills(), limit); break;
        case EntityType::GOAL:       items = records(mem.list_goals(), limit); break;
        case EntityType::SELF_MODEL: items = records(mem.list_self_model(), limit); break;
        case EntityType::HYPOTHESIS: items = records(mem.list_hypotheses(), limit); break;
    }

    json response;
    response["success"] = true;
    response["type"] = memory::entity_type_to_string(type);
    response["items"] = items;
    response["count"] = items.size();
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::handle_evidence(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_EVIDENCE;
    EntityId belief_id = require_id(parse_payload(msg), "belief_id");
    auto evidence = context_.memory.evidence_for(belief_id);
    if (!evidence) {
        return error_response(msg, op, "unknown belief " + std::to_string(belief_id));
    }

    json response;
    response["success"] = true;
    response["belief_id"] = belief_id;
    response["evidence"] = *evidence;
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::handle_inspect(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_INSPECT;
    json j = parse_payload(msg);
    json response = context_.memory.inspect_recent(j.value("limit", static_cast<size_t>(10)));
    response["success"] = true;
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::handle_watermark(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_WATERMARK;
    json response;
    response["success"] = true;
    response["watermark"] = context_.memory.watermark();
    response["consolidator"] = memory::consolidator_state_to_string(
        context_.memory.consolidator().state());
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::handle_create_goal(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_CREATE_GOAL;
    json j = parse_payload(msg);
    auto goal = context_.memory.create_goal(j.value("description", ""), j.value("priority", 5));

    json event_data;
    event_data["goal_id"] = goal.id;
    event_data["status"] = memory::goal_status_to_string(goal.status);
    event_data["action"] = "create";
    context_.event_bus.emit(KernelEventType::GOAL_UPDATED, event_data, msg.agent_id);

    json response;
    response["success"] = true;
    response["goal"] = goal;
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::handle_update_goal(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_UPDATE_GOAL;
    json j = parse_payload(msg);
    EntityId id = require_id(j, "goal_id");

    bool has_progress = j.contains("progress") && j["progress"].is_number();
    bool has_status = j.contains("status") && j["status"].is_string();
    if (!has_progress && !has_status) {
        return error_response(msg, op, "progress or status is required");
    }

    std::optional<memory::GoalStatus> status;
    if (has_status) {
        const std::string raw = j["status"].get<std::string>();
        status = memory::goal_status_from_string(raw);
        if (!status) {
            return error_response(msg, op, "unknown goal status '" + raw + "'");
        }
    }

    memory::Goal goal;
    if (has_progress) {
        goal = context_.memory.update_goal_progress(id, j["progress"].get<double>());
    }
    if (status) {
        goal = context_.memory.update_goal_status(id, *status);
    }

    json event_data;
    event_data["goal_id"] = goal.id;
    event_data["status"] = memory::goal_status_to_string(goal.status);
    event_data["progress"] = goal.progress;
    event_data["action"] = "update";
    context_.event_bus.emit(KernelEventType::GOAL_UPDATED, event_data, msg.agent_id);

    json response;
    response["success"] = true;
    response["goal"] = goal;
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::handle_register_hypothesis(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_REGISTER_HYPOTHESIS;
    json j = parse_payload(msg);
    auto h = context_.memory.register_hypothesis(j.value("claim", ""),
                                                 j.value("verification_plan", ""),
                                                 j.value("confidence", 0.5));
    json response;
    response["success"] = true;
    response["hypothesis"] = h;
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::handle_resolve_hypothesis(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_RESOLVE_HYPOTHESIS;
    json j = parse_payload(msg);
    EntityId id = require_id(j, "hypothesis_id");

    const std::string raw = j.value("outcome", "");
    auto outcome = memory::hypothesis_status_from_string(raw);
    if (!outcome || *outcome == memory::HypothesisStatus::OPEN) {
        return error_response(msg, op, "outcome must be 'verified' or 'rejected'");
    }
    std::optional<double> confidence;
    if (j.contains("confidence") && j["confidence"].is_number()) {
        confidence = j["confidence"].get<double>();
    }

    auto h = context_.memory.resolve_hypothesis(id, *outcome, confidence);

    json event_data;
    event_data["hypothesis_id"] = h.id;
    event_data["outcome"] = memory::hypothesis_status_to_string(h.status);
    context_.event_bus.emit(KernelEventType::HYPOTHESIS_RESOLVED, event_data, msg.agent_id);

    json response;
    response["success"] = true;
    response["hypothesis"] = h;
    return ipc::Message(msg.agent_id, op, response.dump());
}

ipc::Message MemorySyscalls::run_consolidation(KernelContext& context, uint32_t agent_id) {
    auto report = context.memory.consolidate();
    json report_json = report.to_json();

    switch (report.status) {
        case memory::ConsolidationStatus::COMMITTED:
            context.event_bus.emit(KernelEventType::CONSOLIDATION_COMMITTED, report_json, agent_id);
            for (EntityId id : report.disputed_belief_ids) {
                json event_data;
                event_data["belief_id"] = id;
                if (auto belief = context.memory.get_belief(id)) {
                    event_data["conflicts_with"] = belief->conflicts_with_ids;
                }
                context.event_bus.emit(KernelEventType::BELIEF_DISPUTED, event_data, agent_id);
            }
            break;
        case memory::ConsolidationStatus::ABORTED:
            context.event_bus.emit(KernelEventType::CONSOLIDATION_ABORTED, report_json, agent_id);
            break;
        case memory::ConsolidationStatus::REJECTED:
            break;
    }

    json response = report_json;
    // A rejected trigger is a no-op, not a failure.
    response["success"] = report.status != memory::ConsolidationStatus::ABORTED;
    if (report.status == memory::ConsolidationStatus::ABORTED) {
        response["error"] = "consolidation aborted: " + report.reason;
    }
    return ipc::Message(agent_id, ipc::SyscallOp::SYS_CONSOLIDATE, response.dump());
}

ipc::Message MemorySyscalls::handle_consolidate(const ipc::Message& msg) {
    const auto op = ipc::SyscallOp::SYS_CONSOLIDATE;
    json j = parse_payload(msg);
    if (!j.value("async", false)) {
        return run_consolidation(context_, msg.agent_id);
    }

    uint64_t request_id = context_.async_tasks.next_request_id();
    KernelContext& context = context_;
    uint32_t agent_id = msg.agent_id;
    bool queued = context_.async_tasks.submit(agent_id, op, request_id,
        [&context, agent_id]() { return run_consolidation(context, agent_id); });
    if (!queued) {
        return error_response(msg, op, "worker pool is shutting down");
    }

    json response;
    response["success"] = true;
    response["async"] = true;
    response["request_id"] = request_id;
    return ipc::Message(msg.agent_id, op, response.dump());
}

} // namespace reverie::kernel
