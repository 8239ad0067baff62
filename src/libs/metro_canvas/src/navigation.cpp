#include <metro_canvas/navigation.hpp>
#include <metro_logging/logging.hpp>
#include <algorithm>
#include <cmath>

namespace metro_canvas {

std::optional<metro_model::Point> find_station_point(const std::vector<metro_model::PlacedStation>& placed,
    const std::string& station_id)
{
    for (const auto& ps : placed) {
        if (ps.station.id == station_id) return ps.coords;
    }
    return std::nullopt;
}

std::vector<JourneyStop> build_journey(const metro_model::TimelineConfig& config,
    const std::vector<metro_model::PlacedStation>& placed)
{
    std::vector<JourneyStop> stops;
    for (const auto& id : config.journey_station_ids) {
        auto point = find_station_point(placed, id);
        if (!point) {
            metro_logging::get_logger("canvas")->warn("journey stop not in catalog id={}", id);
            continue;
        }
        stops.push_back({ id, *point });
    }
    return stops;
}

metro_model::Rect era_view(const metro_model::Era& era, const metro_layout::TimeScale& scale,
    const ViewportLimits& limits, double aspect)
{
    if (!(aspect > 0.0)) aspect = limits.canvas_width / limits.canvas_height;

    const double x0 = scale.year_to_x(era.start_year);
    const double x1 = scale.year_to_x(era.end_year);
    const double min_width = std::max(limits.canvas_width, limits.canvas_height * aspect) * limits.min_zoom;
    double width = std::max(std::abs(x1 - x0), min_width);
    double height = width / aspect;
    if (height > limits.canvas_height) {
        height = limits.canvas_height;
        width = height * aspect;
    }
    if (width > limits.canvas_width) {
        width = limits.canvas_width;
        height = width / aspect;
    }

    const double cx = (x0 + x1) * 0.5;
    const double cy = limits.canvas_height * 0.5;
    return clamp_view({ cx - width * 0.5, cy - height * 0.5, width, height }, limits);
}

} // namespace metro_canvas
