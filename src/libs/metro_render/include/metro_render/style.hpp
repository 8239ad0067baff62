#pragma once

#include <metro_model/types.hpp>
#include <cstdint>
#include <string>

namespace metro_render {

struct LineStyle {
    const char* display_name;
    std::uint32_t color;      // 0xRRGGBB
    std::uint32_t color_dark; // casing under the main stroke
};

const LineStyle& line_style(metro_model::LineId line);

namespace style {

constexpr double casing_width = 24.0;
constexpr double main_width = 16.0;
constexpr double core_width = 6.0;
constexpr double braid_width = 12.0;
constexpr double hidden_line_opacity = 0.15;

constexpr std::uint32_t background = 0x0b1020;
constexpr std::uint32_t station_fill = 0xf8fafc;
constexpr std::uint32_t label_text = 0xe2e8f0;
constexpr std::uint32_t year_text = 0x94a3b8;

} // namespace style

// Marker radius in world units.
double station_radius(metro_model::Significance significance, bool selected);

// "#rrggbb"
std::string hex_color(std::uint32_t rgb);

} // namespace metro_render
