#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace tile_pyramid::core {

using json = nlohmann::json;

// Build phases reported on the event stream
enum class Phase {
    INGEST = 0,
    COARSEN = 1
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::INGEST: return "INGEST";
        case Phase::COARSEN: return "COARSEN";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

/**
 * JSON-lines event stream for progress reporting. One object per line, each
 * carrying type, run_id and an ISO-8601 timestamp.
 */
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, std::ostream& out);
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        const std::string& message, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void frame_processed(const std::string& run_id, int frame_idx, int total_frames,
                         bool skipped, std::ostream& out);

    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

} // namespace tile_pyramid::core
