#include "tile_pyramid/builder/position_mapping.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>

namespace tile_pyramid::builder {

using json = nlohmann::json;

std::vector<AcquisitionEvent> load_events(const fs::path& path) {
    std::vector<AcquisitionEvent> events;
    if (!fs::exists(path)) return events;

    json j;
    try {
        j = json::parse(core::read_text(path));
    } catch (const json::parse_error& e) {
        throw ValidationError("cannot parse " + path.string() + ": " + e.what());
    }
    if (!j.is_array()) {
        throw ValidationError(path.string() + " must hold a list of events");
    }

    for (const auto& item : j) {
        AcquisitionEvent ev;
        try {
            ev.time = item.at("time").get<double>();
            ev.name = item.at("name").get<std::string>();
            const json& value = item.at("value");
            ev.value = value.is_string() ? value.get<std::string>() : value.dump();
        } catch (const json::exception& e) {
            throw ValidationError("bad event in " + path.string() + ": " + e.what());
        }
        events.push_back(std::move(ev));
    }
    return events;
}

PiecewiseMapping PiecewiseMapping::from_events(const std::vector<AcquisitionEvent>& events,
                                               const io::MetadataDocument& metadata,
                                               const std::string& event_name, double initial) {
    PiecewiseMapping mapping(initial);

    std::vector<const AcquisitionEvent*> matching;
    for (const auto& ev : events) {
        if (ev.name == event_name) matching.push_back(&ev);
    }
    if (matching.empty()) return mapping;

    const double start = metadata.get_as<double>("StartTime");
    const double cycle = metadata.get_as<double>("Camera.CycleTime");
    if (!(cycle > 0.0)) {
        throw MetadataError("Camera.CycleTime must be positive");
    }

    std::stable_sort(matching.begin(), matching.end(),
                     [](const AcquisitionEvent* a, const AcquisitionEvent* b) {
                         return a->time < b->time;
                     });

    for (const AcquisitionEvent* ev : matching) {
        double value = 0.0;
        try {
            value = std::stod(ev->value);
        } catch (const std::exception&) {
            throw ValidationError("event " + event_name + " has non-numeric value '" +
                                  ev->value + "'");
        }
        const int frame = static_cast<int>(std::ceil((ev->time - start) / cycle));
        mapping.add_step(frame, value);
    }
    return mapping;
}

void PiecewiseMapping::add_step(int frame, double value) {
    auto it = std::upper_bound(steps_.begin(), steps_.end(), frame,
                               [](int f, const std::pair<int, double>& s) { return f < s.first; });
    steps_.insert(it, {frame, value});
}

double PiecewiseMapping::operator()(int frame) const {
    auto it = std::upper_bound(steps_.begin(), steps_.end(), frame,
                               [](int f, const std::pair<int, double>& s) { return f < s.first; });
    if (it == steps_.begin()) return initial_;
    return std::prev(it)->second;
}

std::vector<double> PiecewiseMapping::sample(int n_frames) const {
    std::vector<double> out(static_cast<size_t>(std::max(0, n_frames)));
    for (int i = 0; i < n_frames; ++i) {
        out[static_cast<size_t>(i)] = (*this)(i);
    }
    return out;
}

} // namespace tile_pyramid::builder
