#pragma once

#include <cstddef>

namespace metro_layout {

// Shared layout constants for the metro map (used by layout, canvas and renderer).
// All values in world units (double); renderer may cast to float.

namespace layout {

constexpr double canvas_width = 8000.0;
constexpr double canvas_height = 4000.0;
constexpr double min_zoom = 0.05;
constexpr double max_zoom = 20.0;

constexpr int timeline_start = -10000; // 10,000 BCE
constexpr int timeline_end = 2025;

constexpr int convergence_year = 2025;
constexpr double convergence_y_fraction = 0.15;
constexpr double convergence_approach_run = 400.0;
constexpr double convergence_extension = 2000.0;
// Last waypoint closer than this to the convergence x skips the explicit convergence point.
constexpr double convergence_snap = 10.0;

// Station collision resolution.
constexpr double collision_threshold = 70.0;
constexpr double offset_step = 80.0;
constexpr int max_offset_attempts = 12;

// Curve synthesis.
constexpr double flat_segment_tolerance = 1.0; // |dy| below this emits a straight segment
constexpr double tangent_ratio = 0.5;          // control point offset as a fraction of dx
constexpr double braid_offset = 3.0;

// Label stacking.
constexpr double label_window = 180.0;
constexpr double label_height = 30.0;
constexpr double label_min_gap = 6.0;
constexpr double label_anchor_gap = 30.0; // label baseline sits this far above the top corridor
constexpr double label_zoom_threshold = 0.6;

// Station marker sizing.
constexpr double station_radius = 28.0;
constexpr double selected_radius = 34.0;
constexpr double hub_scale = 1.15;
constexpr double crisis_scale = 1.1;
constexpr double minor_scale = 0.9;

// Navigation.
constexpr double zoom_in_factor = 0.8;
constexpr double zoom_out_factor = 1.25;
constexpr double wheel_zoom_in = 0.85;
constexpr double wheel_zoom_out = 1.15;
constexpr double keyboard_pan_step = 100.0;
constexpr double zoom_duration_ms = 200.0;
constexpr double focus_duration_ms = 1200.0;

// Current zoom relative to the full canvas (1 = whole canvas width visible).
inline constexpr double zoom_level(double full_width, double view_width) {
    return view_width > 0.0 ? full_width / view_width : 0.0;
}

} // namespace layout
} // namespace metro_layout
