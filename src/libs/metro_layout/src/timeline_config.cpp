#include <metro_layout/timeline_config.hpp>
#include <metro_layout/layout_constants.hpp>
#include <set>
#include <string>

namespace metro_layout {

using metro_model::LineId;

metro_model::TimelineConfig default_timeline_config() {
    metro_model::TimelineConfig c;
    c.canvas.width = layout::canvas_width;
    c.canvas.height = layout::canvas_height;
    c.canvas.min_zoom = layout::min_zoom;
    c.canvas.max_zoom = layout::max_zoom;

    // Ancient history is compressed; the last two centuries get a quarter of the width.
    c.anchors = {
        { layout::timeline_start, 0.00 },
        { -3000, 0.10 },
        { -1000, 0.20 },
        { 0, 0.30 },
        { 500, 0.38 },
        { 1000, 0.44 },
        { 1500, 0.50 },
        { 1800, 0.62 },
        { 1900, 0.74 },
        { 1950, 0.84 },
        { 2000, 0.94 },
        { layout::timeline_end, 1.00 },
    };

    // Convergence offsets stack the bundle tech, population, war, empire, philosophy.
    c.corridors = {{
        { LineId::Tech, 0.18, 0.0 },
        { LineId::War, 0.36, 60.0 },
        { LineId::Population, 0.50, 30.0 },
        { LineId::Philosophy, 0.64, 120.0 },
        { LineId::Empire, 0.82, 90.0 },
    }};

    c.convergence.year = layout::convergence_year;
    c.convergence.y_fraction = layout::convergence_y_fraction;
    c.convergence.approach_run = layout::convergence_approach_run;
    c.convergence.extension = layout::convergence_extension;

    c.placement.collision_threshold = layout::collision_threshold;
    c.placement.offset_step = layout::offset_step;
    c.placement.max_attempts = layout::max_offset_attempts;

    c.labels.horizontal_window = layout::label_window;
    c.labels.label_height = layout::label_height;
    c.labels.min_gap = layout::label_min_gap;

    c.braided_line = LineId::Population;
    c.braid_offset = layout::braid_offset;
    c.tangent_ratio = layout::tangent_ratio;

    c.journey_station_ids = {
        "neolithic", "uruk", "classical", "columbian", "industrial", "crisis", "singularity"
    };
    c.eras = {
        { "ancient", "Ancient", -10000, -1000 },
        { "classical", "Classical", -1000, 500 },
        { "medieval", "Medieval", 500, 1500 },
        { "modern", "Modern", 1500, 1900 },
        { "contemporary", "Contemporary", 1900, 2025 },
    };
    return c;
}

std::vector<ConfigIssue> validate_timeline_config(const metro_model::TimelineConfig& config) {
    std::vector<ConfigIssue> issues;
    auto add = [&](const char* code, std::string message) {
        issues.push_back(ConfigIssue{ code, std::move(message) });
    };

    if (!(config.canvas.width > 0.0) || !(config.canvas.height > 0.0))
        add("canvas_size", "canvas width and height must be positive");
    if (!(config.canvas.min_zoom > 0.0) || config.canvas.min_zoom > config.canvas.max_zoom)
        add("zoom_limits", "min_zoom must be positive and not above max_zoom");

    const auto& anchors = config.anchors;
    if (anchors.size() < 2) {
        add("anchor_count", "at least two time anchors are required");
    } else {
        if (anchors.front().position != 0.0)
            add("anchor_first", "first anchor position must be 0");
        if (anchors.back().position != 1.0)
            add("anchor_last", "last anchor position must be 1");
        for (std::size_t i = 1; i < anchors.size(); ++i) {
            if (anchors[i].year <= anchors[i - 1].year || anchors[i].position <= anchors[i - 1].position) {
                add("anchor_order", "anchor " + std::to_string(i) + " (year " + std::to_string(anchors[i].year)
                    + ") is not strictly increasing");
            }
        }
    }

    std::set<double> y_fractions;
    std::set<double> offsets;
    for (std::size_t i = 0; i < config.corridors.size(); ++i) {
        const auto& c = config.corridors[i];
        const char* name = metro_model::line_name(metro_model::all_lines[i]);
        if (c.line != metro_model::all_lines[i])
            add("corridor_order", std::string("corridor slot ") + name + " holds another line");
        if (!(c.y_fraction > 0.0 && c.y_fraction < 1.0))
            add("corridor_y", std::string(name) + " y_fraction must lie in (0, 1)");
        if (c.convergence_offset < 0.0)
            add("corridor_offset", std::string(name) + " convergence_offset must be >= 0");
        if (!y_fractions.insert(c.y_fraction).second)
            add("corridor_y_duplicate", std::string(name) + " shares its y_fraction with another line");
        if (!offsets.insert(c.convergence_offset).second)
            add("corridor_offset_duplicate", std::string(name) + " shares its convergence_offset with another line");
    }

    if (!(config.placement.collision_threshold >= 0.0) || !(config.placement.offset_step > 0.0))
        add("placement", "collision threshold must be >= 0 and offset step > 0");
    if (config.placement.max_attempts < 0)
        add("placement_attempts", "max_attempts must be >= 0");
    if (!(config.convergence.extension >= 0.0) || !(config.convergence.approach_run >= 0.0))
        add("convergence", "convergence extension and approach run must be >= 0");
    if (!(config.labels.default_priority > 0.0) || !(config.labels.hovered_priority > 0.0)
        || !(config.labels.selected_priority > 0.0))
        add("label_priority", "label priority weights must be positive");

    for (const auto& era : config.eras) {
        if (era.end_year < era.start_year)
            add("era_range", "era " + era.id + " ends before it starts");
    }
    return issues;
}

} // namespace metro_layout
