#include <metro_canvas/view_state.hpp>
#include <metro_layout/layout_constants.hpp>

namespace metro_canvas {

namespace {

using namespace metro_layout::layout;

metro_model::Rect zoom_about_center(const metro_model::Rect& view, double factor, const ViewportLimits& limits) {
    const metro_model::Point center{ view.x + view.width * 0.5, view.y + view.height * 0.5 };
    const double w = view.width * factor;
    const double h = view.height * factor;
    return clamp_view({ center.x - w * 0.5, center.y - h * 0.5, w, h }, limits);
}

} // namespace

MapViewState initial_view_state(const ViewportLimits& limits) {
    MapViewState state;
    state.view = clamp_view({
        limits.canvas_width * 0.1,
        limits.canvas_height * 0.15,
        limits.canvas_width * 0.8,
        limits.canvas_height * 0.7 }, limits);
    return state;
}

double current_zoom(const MapViewState& state, const ViewportLimits& limits) {
    return zoom_level(limits.canvas_width, state.view.width);
}

MapViewState apply_set_view(MapViewState state, const metro_model::Rect& view, const ViewportLimits& limits) {
    state.view = clamp_view(view, limits);
    return state;
}

MapViewState apply_zoom_in(MapViewState state, const ViewportLimits& limits) {
    state.view = zoom_about_center(state.view, zoom_in_factor, limits);
    return state;
}

MapViewState apply_zoom_out(MapViewState state, const ViewportLimits& limits) {
    state.view = zoom_about_center(state.view, zoom_out_factor, limits);
    return state;
}

MapViewState apply_reset_view(MapViewState state, const ViewportLimits& limits) {
    state.view = full_view(limits);
    return state;
}

MapViewState apply_center_on(MapViewState state, const metro_model::Point& point, const ViewportLimits& limits) {
    state.view = center_on(state.view, point, limits);
    return state;
}

MapViewState apply_keyboard_pan(MapViewState state, int steps_x, int steps_y, const ViewportLimits& limits) {
    state.view = pan_by(state.view, steps_x * keyboard_pan_step, steps_y * keyboard_pan_step, limits);
    return state;
}

MapViewState apply_toggle_line(MapViewState state, metro_model::LineId line) {
    bool& visible = state.visible_lines[metro_model::line_index(line)];
    visible = !visible;
    return state;
}

MapViewState apply_show_all_lines(MapViewState state) {
    state.visible_lines.fill(true);
    return state;
}

MapViewState apply_hover_station(MapViewState state, const std::string& station_id) {
    state.hovered_station_id = station_id;
    return state;
}

MapViewState apply_select_station(MapViewState state, const std::string& station_id) {
    state.selected_station_id = station_id;
    return state;
}

MapViewState apply_clear_selection(MapViewState state) {
    state.selected_station_id.clear();
    return state;
}

MapViewState apply_toggle_labels(MapViewState state) {
    state.show_all_labels = !state.show_all_labels;
    return state;
}

MapViewState apply_set_search(MapViewState state, const std::string& query) {
    state.search_query = query;
    return state;
}

MapViewState apply_focus_era(MapViewState state, const std::string& era_id) {
    state.focused_era = era_id;
    return state;
}

} // namespace metro_canvas
