#include <metro_canvas/viewport.hpp>
#include <algorithm>
#include <cmath>

namespace metro_canvas {

namespace {

double clamp_extent(double value, double canvas_extent, double min_zoom, double max_zoom) {
    const double hi = std::min(canvas_extent * max_zoom, canvas_extent);
    const double lo = std::min(canvas_extent * min_zoom, hi);
    return std::clamp(value, lo, hi);
}

} // namespace

ViewportLimits limits_from(const metro_model::CanvasSpec& canvas) {
    return { canvas.width, canvas.height, canvas.min_zoom, canvas.max_zoom };
}

metro_model::Rect clamp_view(const metro_model::Rect& rect, const ViewportLimits& limits) {
    metro_model::Rect out;
    out.width = clamp_extent(rect.width, limits.canvas_width, limits.min_zoom, limits.max_zoom);
    out.height = clamp_extent(rect.height, limits.canvas_height, limits.min_zoom, limits.max_zoom);
    out.x = std::clamp(rect.x, 0.0, limits.canvas_width - out.width);
    out.y = std::clamp(rect.y, 0.0, limits.canvas_height - out.height);
    return out;
}

metro_model::Rect zoom_at_point(const metro_model::Rect& rect, double factor,
    const metro_model::Point& anchor, const ViewportLimits& limits)
{
    if (!(factor > 0.0) || !(rect.width > 0.0) || !(rect.height > 0.0))
        return clamp_view(rect, limits);

    const double new_width = clamp_extent(rect.width * factor, limits.canvas_width, limits.min_zoom, limits.max_zoom);
    const double new_height = clamp_extent(rect.height * factor, limits.canvas_height, limits.min_zoom, limits.max_zoom);
    // Effective factors after the zoom limits; the anchor keeps its relative position.
    const double fx = new_width / rect.width;
    const double fy = new_height / rect.height;

    metro_model::Rect out;
    out.width = new_width;
    out.height = new_height;
    out.x = anchor.x - (anchor.x - rect.x) * fx;
    out.y = anchor.y - (anchor.y - rect.y) * fy;
    return clamp_view(out, limits);
}

metro_model::Rect pan_by(const metro_model::Rect& rect, double dx, double dy, const ViewportLimits& limits) {
    return clamp_view({ rect.x + dx, rect.y + dy, rect.width, rect.height }, limits);
}

metro_model::Rect center_on(const metro_model::Rect& rect, const metro_model::Point& point,
    const ViewportLimits& limits)
{
    return clamp_view({ point.x - rect.width * 0.5, point.y - rect.height * 0.5, rect.width, rect.height }, limits);
}

metro_model::Rect full_view(const ViewportLimits& limits) {
    return clamp_view({ 0.0, 0.0, limits.canvas_width, limits.canvas_height }, limits);
}

metro_model::Point screen_to_world(const metro_model::Rect& view, double region_width, double region_height,
    double screen_x, double screen_y)
{
    if (region_width <= 0.0 || region_height <= 0.0) return { view.x, view.y };
    return { view.x + screen_x / region_width * view.width, view.y + screen_y / region_height * view.height };
}

metro_model::Point world_to_screen(const metro_model::Rect& view, double region_width, double region_height,
    double world_x, double world_y)
{
    if (view.width <= 0.0 || view.height <= 0.0) return { 0.0, 0.0 };
    return { (world_x - view.x) / view.width * region_width, (world_y - view.y) / view.height * region_height };
}

bool same_rect(const metro_model::Rect& a, const metro_model::Rect& b, double eps) {
    return std::abs(a.x - b.x) <= eps && std::abs(a.y - b.y) <= eps
        && std::abs(a.width - b.width) <= eps && std::abs(a.height - b.height) <= eps;
}

} // namespace metro_canvas
