#pragma once

#include <metro_layout/time_scale.hpp>
#include <metro_model/timeline_config.hpp>

namespace metro_layout {

// World y of a line's corridor.
double corridor_y(const metro_model::TimelineConfig& config, metro_model::LineId line);

// Shared terminal point all lines bundle into (before per-line offsets).
metro_model::Point convergence_point(const metro_model::TimelineConfig& config, const TimeScale& scale);

// Convergence point of one line: the shared point pushed down by the line's offset.
metro_model::Point line_convergence_point(const metro_model::TimelineConfig& config,
    const TimeScale& scale, metro_model::LineId line);

// End of the line's terminal extension past the convergence point.
metro_model::Point line_terminal_point(const metro_model::TimelineConfig& config,
    const TimeScale& scale, metro_model::LineId line);

// Top-most corridor among the lines a station belongs to (label anchor).
double top_corridor_y(const metro_model::TimelineConfig& config, const metro_model::Station& station);

} // namespace metro_layout
