#pragma once

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <string>

namespace drop_synth::runner {

/**
 * Event emission for batch runs.
 * One JSON object per line on the given stream, mirrored to an optional
 * log file.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out = std::cout, std::ofstream* log_file = nullptr);

    void emit(const nlohmann::json& event);

    void run_start(const std::string& run_id, const nlohmann::json& data);
    void run_end(const std::string& run_id, bool success,
                 const nlohmann::json& data = nlohmann::json::object());

    void image_done(const std::string& run_id, int index, int total, const std::string& name,
                    const nlohmann::json& extra = nlohmann::json::object());
    void image_failed(const std::string& run_id, int index, int total, const std::string& name,
                      const std::string& error);

private:
    std::ostream& out_;
    std::ofstream* log_file_;

    nlohmann::json base_event(const std::string& type, const std::string& run_id) const;
};

} // namespace drop_synth::runner
