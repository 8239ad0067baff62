#pragma once

#include <metro_layout/layout_cache.hpp>
#include <metro_model/timeline_config.hpp>
#include <metro_model/types.hpp>
#include <array>
#include <optional>
#include <string>

namespace metro_render {

struct SvgOptions {
    std::array<bool, metro_model::line_count> visible_lines{ { true, true, true, true, true } };
    bool show_labels = true;
    std::string selected_station_id;
    // viewBox; whole canvas when empty.
    std::optional<metro_model::Rect> view;
};

// Standalone SVG document of the map: line casings and strokes (braid strands
// for the braided line), station markers, stacked labels.
std::string render_svg(const metro_layout::MetroLayout& layout,
    const metro_model::TimelineConfig& config,
    const SvgOptions& options = {});

// Writes render_svg() to path. Returns false (and logs) if the file cannot be written.
bool export_svg_file(const std::string& path,
    const metro_layout::MetroLayout& layout,
    const metro_model::TimelineConfig& config,
    const SvgOptions& options = {});

} // namespace metro_render
