#pragma once

#include <metro_layout/time_scale.hpp>
#include <metro_model/timeline_config.hpp>
#include <metro_model/types.hpp>
#include <array>
#include <string>
#include <vector>

namespace metro_layout {

enum class PathCommandKind {
    Move,
    Line,
    Cubic
};

struct PathCommand {
    PathCommandKind kind = PathCommandKind::Move;
    metro_model::Point c1; // Cubic only
    metro_model::Point c2; // Cubic only
    metro_model::Point to;
};

struct LinePath {
    std::vector<PathCommand> commands;

    bool empty() const { return commands.empty(); }
    // "M x y L x y C c1x c1y, c2x c2y, x y ..." or "" for an empty path.
    std::string to_svg() const;
};

// Main path plus the two offset strands of a braided line.
struct BraidedPath {
    LinePath main;
    LinePath braid1; // +offset in y
    LinePath braid2; // -offset in y
};

struct MetroLinePath {
    metro_model::LineId line = metro_model::LineId::Tech;
    LinePath main;
    bool braided = false;
    LinePath braid1;
    LinePath braid2;
};

// Waypoints of one line: canvas left edge at corridor y, every station on the
// line (by x, at its own coords), the approach/convergence points and the
// terminal extension.
std::vector<metro_model::Point> build_line_waypoints(
    const metro_model::Corridor& corridor,
    const std::vector<metro_model::PlacedStation>& placed,
    const metro_model::TimelineConfig& config,
    const TimeScale& scale);

// Straight segments where consecutive points are level (|dy| < 1), otherwise
// cubic curves with horizontal tangents at both ends. Fewer than two points
// yields an empty path.
LinePath generate_smooth_path(const std::vector<metro_model::Point>& points,
    double tangent_ratio = 0.5);

BraidedPath generate_braided_path(const std::vector<metro_model::Point>& points,
    double offset, double tangent_ratio = 0.5);

// All five lines in corridor order; config.braided_line gets the braid strands.
std::array<MetroLinePath, metro_model::line_count> build_metro_paths(
    const std::vector<metro_model::PlacedStation>& placed,
    const metro_model::TimelineConfig& config,
    const TimeScale& scale);

// Number formatting used in path strings: integral values without a decimal
// point, others with up to three decimals.
std::string format_coordinate(double value);

} // namespace metro_layout
