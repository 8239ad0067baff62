#pragma once

#include <metro_model/timeline_config.hpp>
#include <metro_model/types.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace metro_layout {

enum class LabelPriority {
    Default,
    Hovered,
    Selected
};

struct LabelCandidate {
    std::string station_id;
    double x = 0;
    double top_y = 0;     // label anchor; the label stacks upward from here
    double priority = 1.0; // weight, larger = displaced less
};

struct LabelPlacement {
    std::string station_id;
    double vertical_offset = 0; // >= 0, upward
};

double priority_weight(const metro_model::LabelParams& params, LabelPriority priority);

// Greedy single pass in x order: each label is pushed up just enough to clear
// the labels already placed within the horizontal window, then the push is
// divided by its priority weight. Zero or one candidate gives an empty result.
std::vector<LabelPlacement> place_labels(std::vector<LabelCandidate> candidates,
    const metro_model::LabelParams& params);

// Candidates for the stations the caller considers visible.
std::vector<LabelCandidate> gather_label_candidates(
    const std::vector<metro_model::PlacedStation>& placed,
    const metro_model::TimelineConfig& config,
    const std::function<bool(const metro_model::PlacedStation&)>& is_visible,
    const std::function<LabelPriority(const std::string&)>& priority_of);

std::unordered_map<std::string, double> label_offsets_by_id(const std::vector<LabelPlacement>& placements);

} // namespace metro_layout
