#pragma once

#include <metro_canvas/viewport.hpp>
#include <metro_model/types.hpp>
#include <array>
#include <cstddef>
#include <string>

namespace metro_canvas {

// Everything the map view owns. Transitions below are pure: they take a state
// and return the next one; MapController is the only place that stores it.
struct MapViewState {
    metro_model::Rect view;
    bool panning = false;
    std::string hovered_station_id;
    std::string selected_station_id;
    std::array<bool, metro_model::line_count> visible_lines{ { true, true, true, true, true } };
    bool show_all_labels = false;
    bool journey_mode = false;
    std::size_t journey_index = 0;
    std::string focused_era;
    std::string search_query;

    bool line_visible(metro_model::LineId line) const { return visible_lines[metro_model::line_index(line)]; }
};

// Opening view: the middle 80% x 70% of the canvas.
MapViewState initial_view_state(const ViewportLimits& limits);

double current_zoom(const MapViewState& state, const ViewportLimits& limits);

MapViewState apply_set_view(MapViewState state, const metro_model::Rect& view, const ViewportLimits& limits);
MapViewState apply_zoom_in(MapViewState state, const ViewportLimits& limits);
MapViewState apply_zoom_out(MapViewState state, const ViewportLimits& limits);
MapViewState apply_reset_view(MapViewState state, const ViewportLimits& limits);
MapViewState apply_center_on(MapViewState state, const metro_model::Point& point, const ViewportLimits& limits);
// Arrow-key pan in steps of keyboard_pan_step world units.
MapViewState apply_keyboard_pan(MapViewState state, int steps_x, int steps_y, const ViewportLimits& limits);

MapViewState apply_toggle_line(MapViewState state, metro_model::LineId line);
MapViewState apply_show_all_lines(MapViewState state);
MapViewState apply_hover_station(MapViewState state, const std::string& station_id);
MapViewState apply_select_station(MapViewState state, const std::string& station_id);
MapViewState apply_clear_selection(MapViewState state);
MapViewState apply_toggle_labels(MapViewState state);
MapViewState apply_set_search(MapViewState state, const std::string& query);
MapViewState apply_focus_era(MapViewState state, const std::string& era_id);

} // namespace metro_canvas
