#include <metro_layout/label_placer.hpp>
#include <metro_layout/corridor.hpp>
#include <algorithm>
#include <cmath>

namespace metro_layout {

namespace {

struct PlacedLabel {
    double x;
    double y;
};

} // namespace

double priority_weight(const metro_model::LabelParams& params, LabelPriority priority) {
    switch (priority) {
    case LabelPriority::Selected: return params.selected_priority;
    case LabelPriority::Hovered: return params.hovered_priority;
    case LabelPriority::Default: return params.default_priority;
    }
    return params.default_priority;
}

std::vector<LabelPlacement> place_labels(std::vector<LabelCandidate> candidates,
    const metro_model::LabelParams& params)
{
    std::vector<LabelPlacement> out;
    if (candidates.size() < 2) return out;

    std::stable_sort(candidates.begin(), candidates.end(),
        [](const LabelCandidate& a, const LabelCandidate& b) { return a.x < b.x; });

    const double spacing = params.label_height + params.min_gap;
    std::vector<PlacedLabel> placed;
    placed.reserve(candidates.size());
    out.reserve(candidates.size());

    for (const auto& c : candidates) {
        double accumulated = 0.0;
        for (const auto& p : placed) {
            if (std::abs(c.x - p.x) >= params.horizontal_window) continue;
            const double y = c.top_y - accumulated;
            if (std::abs(y - p.y) < spacing) {
                // Lift until this label sits a full spacing above the other one.
                accumulated += y - (p.y - spacing);
            }
        }
        const double weight = c.priority > 0.0 ? c.priority : 1.0;
        const double offset = accumulated / weight;
        placed.push_back({ c.x, c.top_y - offset });
        out.push_back({ c.station_id, offset });
    }
    return out;
}

std::vector<LabelCandidate> gather_label_candidates(
    const std::vector<metro_model::PlacedStation>& placed,
    const metro_model::TimelineConfig& config,
    const std::function<bool(const metro_model::PlacedStation&)>& is_visible,
    const std::function<LabelPriority(const std::string&)>& priority_of)
{
    std::vector<LabelCandidate> out;
    for (const auto& ps : placed) {
        if (is_visible && !is_visible(ps)) continue;
        LabelCandidate c;
        c.station_id = ps.station.id;
        c.x = ps.coords.x;
        c.top_y = top_corridor_y(config, ps.station);
        const LabelPriority priority = priority_of ? priority_of(ps.station.id) : LabelPriority::Default;
        c.priority = priority_weight(config.labels, priority);
        out.push_back(std::move(c));
    }
    return out;
}

std::unordered_map<std::string, double> label_offsets_by_id(const std::vector<LabelPlacement>& placements) {
    std::unordered_map<std::string, double> out;
    for (const auto& p : placements)
        out[p.station_id] = p.vertical_offset;
    return out;
}

} // namespace metro_layout
