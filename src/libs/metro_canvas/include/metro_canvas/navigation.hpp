#pragma once

#include <metro_canvas/viewport.hpp>
#include <metro_layout/time_scale.hpp>
#include <metro_model/timeline_config.hpp>
#include <metro_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace metro_canvas {

struct JourneyStop {
    std::string station_id;
    metro_model::Point point;
};

std::optional<metro_model::Point> find_station_point(const std::vector<metro_model::PlacedStation>& placed,
    const std::string& station_id);

// Tour stops in configured order; ids without a placed station are skipped.
std::vector<JourneyStop> build_journey(const metro_model::TimelineConfig& config,
    const std::vector<metro_model::PlacedStation>& placed);

// View covering the era's x range with the given width/height aspect,
// vertically centred on the canvas, clamped. The height is capped at the
// canvas height, which narrows the view for very wide aspects. A
// non-positive aspect means the canvas aspect.
metro_model::Rect era_view(const metro_model::Era& era, const metro_layout::TimeScale& scale,
    const ViewportLimits& limits, double aspect);

} // namespace metro_canvas
