#pragma once

#include "tile_pyramid/core/types.hpp"
#include "tile_pyramid/io/metadata.hpp"

#include <string>
#include <utility>
#include <vector>

namespace tile_pyramid::builder {

// One recorded acquisition event ({"time", "name", "value"} in events.json).
struct AcquisitionEvent {
    double time = 0.0;
    std::string name;
    std::string value;
};

// Reads events.json; a missing file is an empty list.
std::vector<AcquisitionEvent> load_events(const fs::path& path);

/**
 * Step function from frame index to a value. The value switches at the
 * frames given by the events and holds until the next one; frames before
 * the first event get the initial value.
 */
class PiecewiseMapping {
public:
    explicit PiecewiseMapping(double initial = 0.0) : initial_(initial) {}

    // Events named `event_name`, each applying from frame
    // ceil((time - StartTime) / Camera.CycleTime).
    static PiecewiseMapping from_events(const std::vector<AcquisitionEvent>& events,
                                        const io::MetadataDocument& metadata,
                                        const std::string& event_name, double initial);

    void add_step(int frame, double value);

    double operator()(int frame) const;
    std::vector<double> sample(int n_frames) const;

    size_t step_count() const { return steps_.size(); }

private:
    double initial_;
    std::vector<std::pair<int, double>> steps_;  // sorted by frame
};

} // namespace tile_pyramid::builder
