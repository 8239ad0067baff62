#include <metro_render/map_canvas.hpp>
#include <metro_render/style.hpp>
#include <metro_canvas/viewport.hpp>
#include <metro_layout/label_placer.hpp>
#include <metro_layout/layout_constants.hpp>
#include <metro_layout/station_filter.hpp>
#include <metro_logging/logging.hpp>
#include "imgui.h"
#include <cmath>
#include <limits>

namespace metro_render {

namespace {

namespace layout = metro_layout::layout;

// Press-release distance in pixels below which a press counts as a click.
const float click_slop = 4.0f;

} // namespace

MapCanvas::MapCanvas(metro_canvas::MapController& controller, const metro_model::TimelineConfig& config)
    : controller_(controller)
    , config_(config)
    , scale_(config)
{
}

std::string MapCanvas::pick_station_at(const metro_model::Point& world, double tolerance) const {
    if (!layout_) return {};
    std::string best;
    double best_d2 = std::numeric_limits<double>::max();
    for (const auto& ps : layout_->stations) {
        const double r = station_radius(ps.station.significance, false) + tolerance;
        const double dx = ps.coords.x - world.x;
        const double dy = ps.coords.y - world.y;
        const double d2 = dx * dx + dy * dy;
        if (d2 <= r * r && d2 < best_d2) {
            best_d2 = d2;
            best = ps.station.id;
        }
    }
    return best;
}

bool MapCanvas::label_visible(const metro_model::PlacedStation& ps) const {
    const auto& state = controller_.state();
    bool on_visible_line = false;
    for (auto l : ps.station.lines)
        if (state.line_visible(l)) on_visible_line = true;
    if (!on_visible_line) return false;
    if (ps.station.id == state.selected_station_id || ps.station.id == state.hovered_station_id) return true;
    if (state.show_all_labels) return true;
    if (!state.search_query.empty() && !metro_layout::station_matches(ps.station, state.search_query)) return false;
    return metro_canvas::current_zoom(state, controller_.limits()) > layout::label_zoom_threshold;
}

void MapCanvas::build_render_input(MapRenderInput& input) const {
    const auto& state = controller_.state();
    input.layout = layout_;
    input.config = &config_;
    input.state = &state;

    auto candidates = metro_layout::gather_label_candidates(layout_->stations, config_,
        [this](const metro_model::PlacedStation& ps) { return label_visible(ps); },
        [&state](const std::string& id) {
            if (id == state.selected_station_id) return metro_layout::LabelPriority::Selected;
            if (id == state.hovered_station_id) return metro_layout::LabelPriority::Hovered;
            return metro_layout::LabelPriority::Default;
        });
    for (const auto& c : candidates) input.labelled_ids.insert(c.station_id);
    input.label_offsets = metro_layout::label_offsets_by_id(
        metro_layout::place_labels(std::move(candidates), config_.labels));

    const metro_model::Era* era = state.focused_era.empty() ? nullptr : metro_layout::find_era(config_, state.focused_era);
    input.search_active = !state.search_query.empty() || era != nullptr;
    if (input.search_active) {
        for (const auto* ps : metro_layout::filter_stations(layout_->stations, state.search_query, era))
            input.search_matches.insert(ps->station.id);
    }
}

void MapCanvas::handle_keyboard() {
    if (!ImGui::IsWindowFocused() || ImGui::GetIO().WantTextInput) return;
    const auto& limits = controller_.limits();

    int px = 0;
    int py = 0;
    if (ImGui::IsKeyPressed(ImGuiKey_LeftArrow)) px -= 1;
    if (ImGui::IsKeyPressed(ImGuiKey_RightArrow)) px += 1;
    if (ImGui::IsKeyPressed(ImGuiKey_UpArrow)) py -= 1;
    if (ImGui::IsKeyPressed(ImGuiKey_DownArrow)) py += 1;
    if (px != 0 || py != 0) {
        controller_.apply([&](const metro_canvas::MapViewState& s) {
            return metro_canvas::apply_keyboard_pan(s, px, py, limits);
        });
    }

    if (ImGui::IsKeyPressed(ImGuiKey_Equal) || ImGui::IsKeyPressed(ImGuiKey_KeypadAdd)) controller_.zoom_in();
    if (ImGui::IsKeyPressed(ImGuiKey_Minus) || ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract)) controller_.zoom_out();
    if (ImGui::IsKeyPressed(ImGuiKey_0)) controller_.reset_view();
    if (ImGui::IsKeyPressed(ImGuiKey_L)) controller_.apply(metro_canvas::apply_toggle_labels);

    const auto& state = controller_.state();
    if (state.journey_mode) {
        if (ImGui::IsKeyPressed(ImGuiKey_N) || ImGui::IsKeyPressed(ImGuiKey_Space)) controller_.journey_next();
        if (ImGui::IsKeyPressed(ImGuiKey_P)) controller_.journey_prev();
    }
    if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
        if (state.journey_mode) controller_.end_journey();
        else controller_.apply(metro_canvas::apply_clear_selection);
    }
}

void MapCanvas::handle_input(float origin_x, float origin_y, float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    const ImVec2 mouse = io.MousePos;
    const metro_model::Rect view = controller_.state().view;

    cursor_in_map_ = ImGui::IsWindowHovered() &&
        mouse.x >= origin_x && mouse.x <= origin_x + region_width &&
        mouse.y >= origin_y && mouse.y <= origin_y + region_height;

    const metro_model::Point world = metro_canvas::screen_to_world(view, region_width, region_height,
        mouse.x - origin_x, mouse.y - origin_y);
    const double px_to_world = region_width > 0.0f ? view.width / region_width : 1.0;
    if (cursor_in_map_) cursor_year_ = scale_.x_to_year(world.x);

    if (ImGui::IsMouseClicked(0) && cursor_in_map_) {
        mouse_down_ = true;
        dragging_ = false;
        press_x_ = mouse.x;
        press_y_ = mouse.y;
    }

    if (mouse_down_ && !dragging_ &&
        (std::abs(mouse.x - press_x_) > click_slop || std::abs(mouse.y - press_y_) > click_slop)) {
        dragging_ = true;
        controller_.begin_drag();
        drag_view_ = controller_.state().view;
    }

    if (dragging_) {
        const double sx = region_width > 0.0f ? drag_view_.width / region_width : 1.0;
        const double sy = region_height > 0.0f ? drag_view_.height / region_height : 1.0;
        controller_.drag_by(-(mouse.x - press_x_) * sx, -(mouse.y - press_y_) * sy);
    }

    if (ImGui::IsMouseReleased(0) && mouse_down_) {
        if (dragging_) {
            controller_.end_drag();
        } else {
            const std::string hit = pick_station_at(world, 4.0 * px_to_world);
            if (hit.empty()) {
                controller_.apply(metro_canvas::apply_clear_selection);
            } else {
                controller_.apply([&](const metro_canvas::MapViewState& s) {
                    return metro_canvas::apply_select_station(s, hit);
                });
                metro_logging::get_logger("canvas")->debug("selected station {}", hit);
            }
        }
        mouse_down_ = false;
        dragging_ = false;
    }

    if (!dragging_) {
        const std::string hover = cursor_in_map_ ? pick_station_at(world, 4.0 * px_to_world) : std::string();
        if (hover != controller_.state().hovered_station_id) {
            controller_.apply([&](const metro_canvas::MapViewState& s) {
                return metro_canvas::apply_hover_station(s, hover);
            });
        }
    }

    if (cursor_in_map_ && io.MouseWheel != 0.0f && !dragging_) {
        const double factor = io.MouseWheel > 0 ? layout::wheel_zoom_in : layout::wheel_zoom_out;
        controller_.zoom_at(world, factor);
    }

    handle_keyboard();
}

bool MapCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0 || !layout_) return false;

    const ImVec2 origin = ImGui::GetCursorScreenPos();
    handle_input(origin.x, origin.y, region_width, region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    draw_list->PushClipRect(origin, ImVec2(origin.x + region_width, origin.y + region_height), true);
    draw_list->AddRectFilled(origin, ImVec2(origin.x + region_width, origin.y + region_height),
        IM_COL32((style::background >> 16) & 0xff, (style::background >> 8) & 0xff, style::background & 0xff, 255));

    const ScreenTransform tr = make_transform(controller_.state().view, origin.x, origin.y, region_width, region_height);
    MapRenderInput input;
    build_render_input(input);
    render_metro_map(draw_list, input, tr);
    render_era_ruler(draw_list, config_, scale_, tr, region_width);
    draw_list->PopClipRect();

    ImGui::Dummy(ImVec2(region_width, region_height));
    return true;
}

} // namespace metro_render
