#include "drop_synth/runner/events.hpp"
#include "drop_synth/core/utils.hpp"

namespace drop_synth::runner {

EventEmitter::EventEmitter(std::ostream& out, std::ofstream* log_file)
    : out_(out), log_file_(log_file) {}

nlohmann::json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", core::get_iso_timestamp()}
    };
}

void EventEmitter::emit(const nlohmann::json& event) {
    std::string line = event.dump();

    out_ << line << std::endl;

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << std::endl;
    }
}

void EventEmitter::run_start(const std::string& run_id, const nlohmann::json& data) {
    nlohmann::json event = base_event("run_start", run_id);

    if (!data.empty() && data.is_object()) {
        for (auto& [key, value] : data.items()) {
            event[key] = value;
        }
    }

    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success, const nlohmann::json& data) {
    nlohmann::json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = success ? "ok" : "error";

    if (!data.empty() && data.is_object()) {
        for (auto& [key, value] : data.items()) {
            event[key] = value;
        }
    }

    emit(event);
}

void EventEmitter::image_done(const std::string& run_id, int index, int total,
                              const std::string& name, const nlohmann::json& extra) {
    nlohmann::json event = base_event("image_done", run_id);
    event["index"] = index;
    event["total"] = total;
    event["image"] = name;

    if (!extra.empty() && extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }

    emit(event);
}

void EventEmitter::image_failed(const std::string& run_id, int index, int total,
                                const std::string& name, const std::string& error) {
    nlohmann::json event = base_event("image_failed", run_id);
    event["index"] = index;
    event["total"] = total;
    event["image"] = name;
    event["error"] = error;
    emit(event);
}

} // namespace drop_synth::runner
