#include <metro_render/style.hpp>
#include <metro_layout/layout_constants.hpp>
#include <spdlog/fmt/fmt.h>

namespace metro_render {

namespace {

// Corridor order, see metro_model::all_lines.
const LineStyle line_styles[metro_model::line_count] = {
    { "Technology", 0x22d3ee, 0x0e7490 },
    { "Conflict", 0xef4444, 0x7f1d1d },
    { "Population", 0x22c55e, 0x14532d },
    { "Ideas", 0xfbbf24, 0x78350f },
    { "Empire", 0xa855f7, 0x4c1d95 },
};

} // namespace

const LineStyle& line_style(metro_model::LineId line) {
    return line_styles[metro_model::line_index(line)];
}

double station_radius(metro_model::Significance significance, bool selected) {
    namespace layout = metro_layout::layout;
    const double base = selected ? layout::selected_radius : layout::station_radius;
    switch (significance) {
    case metro_model::Significance::Hub:
    case metro_model::Significance::Current:
        return base * layout::hub_scale;
    case metro_model::Significance::Crisis:
        return base * layout::crisis_scale;
    case metro_model::Significance::Minor:
        return base * layout::minor_scale;
    case metro_model::Significance::Normal:
    case metro_model::Significance::Major:
        break;
    }
    return base;
}

std::string hex_color(std::uint32_t rgb) {
    return fmt::format("#{:06x}", rgb & 0xffffffu);
}

} // namespace metro_render
