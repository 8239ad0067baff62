#pragma once

#include <metro_model/types.hpp>
#include <array>
#include <string>
#include <vector>

namespace metro_model {

struct TimeAnchor {
    int year = 0;
    double position = 0; // fraction of canvas width, [0, 1]
};

struct Corridor {
    LineId line = LineId::Tech;
    double y_fraction = 0.5;         // fraction of canvas height, (0, 1)
    double convergence_offset = 0.0; // world units below the convergence point
};

struct CanvasSpec {
    double width = 8000;
    double height = 4000;
    double min_zoom = 0.05;
    double max_zoom = 20;
};

struct ConvergenceSpec {
    int year = 2025;
    double y_fraction = 0.15;
    // Horizontal run before the convergence x where a line starts bending into the bundle.
    double approach_run = 400;
    // Terminal extension past the convergence x ("the unknown future").
    double extension = 2000;
};

struct PlacementParams {
    double collision_threshold = 70;
    double offset_step = 80;
    int max_attempts = 12;
};

struct LabelParams {
    double horizontal_window = 180;
    double label_height = 30;
    double min_gap = 6;
    double default_priority = 1.0;
    double hovered_priority = 1.5;
    double selected_priority = 2.0;
};

struct Era {
    std::string id;
    std::string label;
    int start_year = 0;
    int end_year = 0;
};

struct TimelineConfig {
    CanvasSpec canvas;
    std::vector<TimeAnchor> anchors;
    // Indexed by line_index(); corridors[i].line == all_lines[i].
    std::array<Corridor, line_count> corridors;
    ConvergenceSpec convergence;
    PlacementParams placement;
    LabelParams labels;
    LineId braided_line = LineId::Population;
    double braid_offset = 3.0;
    double tangent_ratio = 0.5;
    std::vector<std::string> journey_station_ids;
    std::vector<Era> eras;

    const Corridor& corridor(LineId line) const { return corridors[line_index(line)]; }
    double corridor_y(LineId line) const { return corridor(line).y_fraction * canvas.height; }
};

} // namespace metro_model
