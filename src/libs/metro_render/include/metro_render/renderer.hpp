#pragma once

#include <metro_canvas/view_state.hpp>
#include <metro_layout/layout_cache.hpp>
#include <metro_model/timeline_config.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>

struct ImDrawList;

namespace metro_render {

// Screen mapping of the current view: world (x, y) lands at
// origin + (world - view.xy) * scale.
struct ScreenTransform {
    float origin_x = 0;
    float origin_y = 0;
    float scale_x = 1;
    float scale_y = 1;
    metro_model::Rect view;
};

ScreenTransform make_transform(const metro_model::Rect& view, float origin_x, float origin_y,
    float region_width, float region_height);

struct MapRenderInput {
    const metro_layout::MetroLayout* layout = nullptr;
    const metro_model::TimelineConfig* config = nullptr;
    const metro_canvas::MapViewState* state = nullptr;
    // Stations that get a label this frame and their stacking offsets.
    std::unordered_set<std::string> labelled_ids;
    std::unordered_map<std::string, double> label_offsets;
    // Non-empty while a search is active; stations outside it are dimmed.
    std::unordered_set<std::string> search_matches;
    bool search_active = false;
};

void render_metro_map(ImDrawList* draw_list, const MapRenderInput& input, const ScreenTransform& tr);

// Era bands and their titles along the top edge of the region.
void render_era_ruler(ImDrawList* draw_list, const metro_model::TimelineConfig& config,
    const metro_layout::TimeScale& scale, const ScreenTransform& tr, float region_width);

} // namespace metro_render
