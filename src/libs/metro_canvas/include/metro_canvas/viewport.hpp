#pragma once

#include <metro_model/timeline_config.hpp>
#include <metro_model/types.hpp>

namespace metro_canvas {

struct ViewportLimits {
    double canvas_width = 8000;
    double canvas_height = 4000;
    double min_zoom = 0.05;
    double max_zoom = 20;
};

ViewportLimits limits_from(const metro_model::CanvasSpec& canvas);

// Width/height into [min_zoom, max_zoom] x canvas size (never larger than the
// canvas itself), then x/y so the rect stays inside the canvas. Idempotent.
metro_model::Rect clamp_view(const metro_model::Rect& rect, const ViewportLimits& limits);

// Scales the rect by factor keeping anchor at the same relative position, then clamps.
metro_model::Rect zoom_at_point(const metro_model::Rect& rect, double factor,
    const metro_model::Point& anchor, const ViewportLimits& limits);

metro_model::Rect pan_by(const metro_model::Rect& rect, double dx, double dy, const ViewportLimits& limits);

metro_model::Rect center_on(const metro_model::Rect& rect, const metro_model::Point& point,
    const ViewportLimits& limits);

metro_model::Rect full_view(const ViewportLimits& limits);

// World <-> screen for a view rect shown in a screen region of the given size.
metro_model::Point screen_to_world(const metro_model::Rect& view, double region_width, double region_height,
    double screen_x, double screen_y);
metro_model::Point world_to_screen(const metro_model::Rect& view, double region_width, double region_height,
    double world_x, double world_y);

bool same_rect(const metro_model::Rect& a, const metro_model::Rect& b, double eps = 1e-9);

} // namespace metro_canvas
