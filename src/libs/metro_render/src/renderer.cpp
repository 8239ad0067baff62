#include <metro_render/renderer.hpp>
#include <metro_render/style.hpp>
#include <metro_layout/corridor.hpp>
#include <metro_layout/layout_constants.hpp>
#include <metro_layout/time_scale.hpp>
#include "imgui.h"
#include <algorithm>

namespace metro_render {

namespace {

ImU32 to_col(std::uint32_t rgb, float alpha = 1.0f) {
    const int a = std::clamp(static_cast<int>(alpha * 255.0f + 0.5f), 0, 255);
    return IM_COL32((rgb >> 16) & 0xff, (rgb >> 8) & 0xff, rgb & 0xff, a);
}

ImVec2 to_screen(const ScreenTransform& tr, const metro_model::Point& p) {
    return ImVec2(tr.origin_x + static_cast<float>(p.x - tr.view.x) * tr.scale_x,
                  tr.origin_y + static_cast<float>(p.y - tr.view.y) * tr.scale_y);
}

void stroke_path(ImDrawList* dl, const metro_layout::LinePath& path, const ScreenTransform& tr,
    ImU32 color, float world_width) {
    if (path.empty()) return;
    for (const auto& cmd : path.commands) {
        switch (cmd.kind) {
        case metro_layout::PathCommandKind::Move:
        case metro_layout::PathCommandKind::Line:
            dl->PathLineTo(to_screen(tr, cmd.to));
            break;
        case metro_layout::PathCommandKind::Cubic:
            dl->PathBezierCubicCurveTo(to_screen(tr, cmd.c1), to_screen(tr, cmd.c2), to_screen(tr, cmd.to));
            break;
        }
    }
    dl->PathStroke(color, ImDrawFlags_None, std::max(1.0f, world_width * tr.scale_x));
}

} // namespace

ScreenTransform make_transform(const metro_model::Rect& view, float origin_x, float origin_y,
    float region_width, float region_height)
{
    ScreenTransform tr;
    tr.origin_x = origin_x;
    tr.origin_y = origin_y;
    tr.view = view;
    tr.scale_x = view.width > 0.0 ? region_width / static_cast<float>(view.width) : 1.0f;
    tr.scale_y = view.height > 0.0 ? region_height / static_cast<float>(view.height) : 1.0f;
    return tr;
}

void render_metro_map(ImDrawList* draw_list, const MapRenderInput& input, const ScreenTransform& tr) {
    if (!draw_list || !input.layout || !input.config || !input.state) return;
    const auto& state = *input.state;

    for (const auto& line : input.layout->paths) {
        const LineStyle& ls = line_style(line.line);
        const float fade = state.line_visible(line.line) ? 1.0f : static_cast<float>(style::hidden_line_opacity);
        stroke_path(draw_list, line.main, tr, to_col(ls.color_dark, 0.5f * fade), static_cast<float>(style::casing_width));
        if (line.braided) {
            stroke_path(draw_list, line.braid1, tr, to_col(ls.color, 0.6f * fade), static_cast<float>(style::braid_width));
            stroke_path(draw_list, line.braid2, tr, to_col(ls.color, 0.6f * fade), static_cast<float>(style::braid_width));
        }
        stroke_path(draw_list, line.main, tr, to_col(ls.color, 0.9f * fade), static_cast<float>(style::main_width));
        stroke_path(draw_list, line.main, tr, to_col(style::station_fill, 0.35f * fade), static_cast<float>(style::core_width));
    }

    for (const auto& ps : input.layout->stations) {
        bool on_visible_line = false;
        for (auto l : ps.station.lines)
            if (state.line_visible(l)) on_visible_line = true;
        const bool matched = !input.search_active || input.search_matches.count(ps.station.id) > 0;
        const float alpha = on_visible_line && matched ? 1.0f : 0.25f;

        const bool selected = ps.station.id == state.selected_station_id;
        const bool hovered = ps.station.id == state.hovered_station_id;
        const ImVec2 c = to_screen(tr, ps.coords);
        const float r = std::max(2.0f, static_cast<float>(station_radius(ps.station.significance, selected)) * tr.scale_x);
        const LineStyle& ls = line_style(ps.station.primary_line());

        draw_list->AddCircleFilled(c, r, to_col(style::station_fill, alpha));
        draw_list->AddCircle(c, r, to_col(ls.color, alpha), 0, std::max(1.0f, r * 0.2f));
        if (ps.station.significance == metro_model::Significance::Hub ||
            ps.station.significance == metro_model::Significance::Current) {
            draw_list->AddCircle(c, r * 0.6f, to_col(ls.color_dark, alpha), 0, std::max(1.0f, r * 0.12f));
        }
        if (selected || hovered)
            draw_list->AddCircle(c, r + 4.0f, to_col(0xffffff, selected ? 0.9f : 0.5f), 0, 2.0f);
    }

    const double anchor_gap = metro_layout::layout::label_anchor_gap;
    for (const auto& ps : input.layout->stations) {
        if (!input.labelled_ids.count(ps.station.id)) continue;
        double offset = 0.0;
        auto it = input.label_offsets.find(ps.station.id);
        if (it != input.label_offsets.end()) offset = it->second;

        const double top_y = metro_layout::top_corridor_y(*input.config, ps.station);
        const ImVec2 anchor = to_screen(tr, { ps.coords.x, top_y - anchor_gap - offset });

        const ImVec2 name_size = ImGui::CalcTextSize(ps.station.name.c_str());
        const ImVec2 year_size = ImGui::CalcTextSize(ps.station.year_label.c_str());
        const ImVec2 name_pos(anchor.x - name_size.x * 0.5f, anchor.y - name_size.y - year_size.y);
        const ImVec2 year_pos(anchor.x - year_size.x * 0.5f, anchor.y - year_size.y);
        draw_list->AddRectFilled(ImVec2(name_pos.x - 4.0f, name_pos.y - 2.0f),
            ImVec2(name_pos.x + name_size.x + 4.0f, anchor.y + 2.0f), to_col(style::background, 0.75f), 4.0f);
        draw_list->AddText(name_pos, to_col(style::label_text), ps.station.name.c_str());
        draw_list->AddText(year_pos, to_col(style::year_text), ps.station.year_label.c_str());
    }
}

void render_era_ruler(ImDrawList* draw_list, const metro_model::TimelineConfig& config,
    const metro_layout::TimeScale& scale, const ScreenTransform& tr, float region_width)
{
    if (!draw_list) return;
    const float band_h = 22.0f;
    for (std::size_t i = 0; i < config.eras.size(); ++i) {
        const auto& era = config.eras[i];
        const ImVec2 a = to_screen(tr, { scale.year_to_x(era.start_year), tr.view.y });
        const ImVec2 b = to_screen(tr, { scale.year_to_x(era.end_year), tr.view.y });
        const float x0 = std::max(a.x, tr.origin_x);
        const float x1 = std::min(b.x, tr.origin_x + region_width);
        if (x1 <= x0) continue;
        const ImU32 fill = (i % 2 == 0) ? IM_COL32(30, 41, 59, 200) : IM_COL32(51, 65, 85, 200);
        draw_list->AddRectFilled(ImVec2(x0, tr.origin_y), ImVec2(x1, tr.origin_y + band_h), fill);
        const ImVec2 ts = ImGui::CalcTextSize(era.label.c_str());
        if (ts.x + 8.0f < x1 - x0)
            draw_list->AddText(ImVec2(x0 + 4.0f, tr.origin_y + (band_h - ts.y) * 0.5f),
                to_col(style::label_text), era.label.c_str());
    }
}

} // namespace metro_render
