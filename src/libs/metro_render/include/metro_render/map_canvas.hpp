#pragma once

#include <metro_canvas/map_controller.hpp>
#include <metro_layout/layout_cache.hpp>
#include <metro_layout/time_scale.hpp>
#include <metro_model/timeline_config.hpp>
#include <metro_render/renderer.hpp>
#include <string>

namespace metro_render {

// ImGui widget showing the map. All view changes go through the controller;
// the widget only turns mouse and keyboard input into controller calls.
class MapCanvas {
public:
    MapCanvas(metro_canvas::MapController& controller, const metro_model::TimelineConfig& config);

    void set_layout(const metro_layout::MetroLayout* layout) { layout_ = layout; }
    const metro_layout::MetroLayout* layout() const { return layout_; }

    // Year under the mouse cursor, valid while the cursor is over the map.
    double cursor_year() const { return cursor_year_; }
    bool cursor_in_map() const { return cursor_in_map_; }

    bool update_and_draw(float region_width, float region_height);

private:
    void handle_input(float origin_x, float origin_y, float region_width, float region_height);
    void handle_keyboard();
    std::string pick_station_at(const metro_model::Point& world, double tolerance) const;
    bool label_visible(const metro_model::PlacedStation& ps) const;
    void build_render_input(MapRenderInput& input) const;

    metro_canvas::MapController& controller_;
    const metro_model::TimelineConfig& config_;
    metro_layout::TimeScale scale_;
    const metro_layout::MetroLayout* layout_ = nullptr;
    bool mouse_down_ = false;
    bool dragging_ = false;
    float press_x_ = 0;
    float press_y_ = 0;
    metro_model::Rect drag_view_;
    double cursor_year_ = 0;
    bool cursor_in_map_ = false;
};

} // namespace metro_render
