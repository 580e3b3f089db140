#include "ffcc/core/events.hpp"
#include "ffcc/core/utils.hpp"

namespace ffcc::core {

namespace {

void merge_into(json& event, const json& extra) {
    if (!extra.is_object()) return;
    for (const auto& item : extra.items()) {
        event[item.key()] = item.value();
    }
}

} // namespace

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {{"type", type}, {"run_id", run_id}, {"ts", get_iso_timestamp()}};
}

json EventEmitter::stage_event(const std::string& type, const std::string& run_id, Stage stage) {
    json event = base_event(type, run_id);
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    return event;
}

// One JSON document per line, flushed so a consumer can tail the stream.
void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << '\n' << std::flush;
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    merge_into(event, extra);
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::stage_start(const std::string& run_id, Stage stage, std::ostream& out) {
    emit(stage_event("stage_start", run_id, stage), out);
}

void EventEmitter::stage_end(const std::string& run_id, Stage stage,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = stage_event("stage_end", run_id, stage);
    event["status"] = status;
    merge_into(event, extra);
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace ffcc::core
