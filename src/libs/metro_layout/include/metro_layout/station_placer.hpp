#pragma once

#include <metro_layout/time_scale.hpp>
#include <metro_model/timeline_config.hpp>
#include <metro_model/types.hpp>
#include <vector>

namespace metro_layout {

// Places every station on its primary corridor at year_to_x(year), then
// resolves collisions by nudging x only (+step, -step, +2step, -2step, ...).
// Processing order is (x, y) ascending, ties keep input order, so the result
// is repeatable. Candidates are clamped to the canvas; a clamped x that was
// already tried is skipped without using an attempt. Returned in input order.
std::vector<metro_model::PlacedStation> place_stations(
    const std::vector<metro_model::Station>& stations,
    const metro_model::TimelineConfig& config,
    const TimeScale& scale);

// Signed offset tried on the given 1-based attempt: +1, -1, +2, -2, ... times step.
double nudge_offset(int attempt, double step);

} // namespace metro_layout
