#include <metro_render/svg_export.hpp>
#include <metro_render/style.hpp>
#include <metro_layout/corridor.hpp>
#include <metro_layout/label_placer.hpp>
#include <metro_layout/layout_constants.hpp>
#include <metro_layout/path_builder.hpp>
#include <metro_logging/logging.hpp>
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <iterator>
#include <unordered_map>

namespace metro_render {

namespace {

using metro_layout::format_coordinate;

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default: out += c; break;
        }
    }
    return out;
}

void append_path(std::string& out, const metro_layout::LinePath& path, std::uint32_t color,
    double width, double opacity) {
    if (path.empty()) return;
    fmt::format_to(std::back_inserter(out),
        "    <path d=\"{}\" fill=\"none\" stroke=\"{}\" stroke-width=\"{}\" stroke-linecap=\"round\" "
        "stroke-linejoin=\"round\" opacity=\"{}\"/>\n",
        path.to_svg(), hex_color(color), format_coordinate(width), format_coordinate(opacity));
}

void append_line(std::string& out, const metro_layout::MetroLinePath& line, bool visible) {
    const LineStyle& ls = line_style(line.line);
    const double fade = visible ? 1.0 : style::hidden_line_opacity;
    fmt::format_to(std::back_inserter(out), "  <g id=\"line-{}\">\n", metro_model::line_name(line.line));
    append_path(out, line.main, ls.color_dark, style::casing_width, 0.5 * fade);
    if (line.braided) {
        append_path(out, line.braid1, ls.color, style::braid_width, 0.6 * fade);
        append_path(out, line.braid2, ls.color, style::braid_width, 0.6 * fade);
    }
    append_path(out, line.main, ls.color, style::main_width, 0.9 * fade);
    append_path(out, line.main, style::station_fill, style::core_width, 0.35 * fade);
    out += "  </g>\n";
}

} // namespace

std::string render_svg(const metro_layout::MetroLayout& layout,
    const metro_model::TimelineConfig& config,
    const SvgOptions& options)
{
    const metro_model::Rect view = options.view.value_or(
        metro_model::Rect{ 0.0, 0.0, config.canvas.width, config.canvas.height });

    std::string out;
    fmt::format_to(std::back_inserter(out),
        "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"{} {} {} {}\" width=\"{}\" height=\"{}\">\n",
        format_coordinate(view.x), format_coordinate(view.y),
        format_coordinate(view.width), format_coordinate(view.height),
        format_coordinate(view.width), format_coordinate(view.height));
    fmt::format_to(std::back_inserter(out),
        "  <rect x=\"0\" y=\"0\" width=\"{}\" height=\"{}\" fill=\"{}\"/>\n",
        format_coordinate(config.canvas.width), format_coordinate(config.canvas.height),
        hex_color(style::background));

    for (const auto& line : layout.paths)
        append_line(out, line, options.visible_lines[metro_model::line_index(line.line)]);

    auto station_visible = [&](const metro_model::PlacedStation& ps) {
        for (metro_model::LineId l : ps.station.lines)
            if (options.visible_lines[metro_model::line_index(l)]) return true;
        return false;
    };

    out += "  <g id=\"stations\">\n";
    for (const auto& ps : layout.stations) {
        if (!station_visible(ps)) continue;
        const bool selected = ps.station.id == options.selected_station_id;
        const LineStyle& ls = line_style(ps.station.primary_line());
        fmt::format_to(std::back_inserter(out),
            "    <circle id=\"station-{}\" cx=\"{}\" cy=\"{}\" r=\"{}\" fill=\"{}\" stroke=\"{}\" stroke-width=\"6\"/>\n",
            xml_escape(ps.station.id), format_coordinate(ps.coords.x), format_coordinate(ps.coords.y),
            format_coordinate(station_radius(ps.station.significance, selected)),
            hex_color(style::station_fill), hex_color(ls.color));
    }
    out += "  </g>\n";

    if (options.show_labels) {
        const std::string selected_id = options.selected_station_id;
        auto candidates = metro_layout::gather_label_candidates(layout.stations, config, station_visible,
            [&](const std::string& id) {
                return id == selected_id ? metro_layout::LabelPriority::Selected
                                         : metro_layout::LabelPriority::Default;
            });
        const auto offsets = metro_layout::label_offsets_by_id(
            metro_layout::place_labels(candidates, config.labels));

        std::unordered_map<std::string, const metro_model::Station*> by_id;
        for (const auto& ps : layout.stations) by_id[ps.station.id] = &ps.station;

        out += "  <g id=\"labels\" font-family=\"sans-serif\" text-anchor=\"middle\">\n";
        for (const auto& c : candidates) {
            const metro_model::Station* st = by_id[c.station_id];
            auto it = offsets.find(c.station_id);
            const double offset = it != offsets.end() ? it->second : 0.0;
            const double y = c.top_y - metro_layout::layout::label_anchor_gap - offset;
            fmt::format_to(std::back_inserter(out),
                "    <text x=\"{}\" y=\"{}\" font-size=\"22\" fill=\"{}\">{}</text>\n",
                format_coordinate(c.x), format_coordinate(y), hex_color(style::label_text),
                xml_escape(st->name));
            fmt::format_to(std::back_inserter(out),
                "    <text x=\"{}\" y=\"{}\" font-size=\"16\" fill=\"{}\">{}</text>\n",
                format_coordinate(c.x), format_coordinate(y + 20.0), hex_color(style::year_text),
                xml_escape(st->year_label));
        }
        out += "  </g>\n";
    }

    out += "</svg>\n";
    return out;
}

bool export_svg_file(const std::string& path,
    const metro_layout::MetroLayout& layout,
    const metro_model::TimelineConfig& config,
    const SvgOptions& options)
{
    auto log = metro_logging::get_logger("render");
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        log->error("cannot open '{}' for writing", path);
        return false;
    }
    f << render_svg(layout, config, options);
    if (!f) {
        log->error("failed writing '{}'", path);
        return false;
    }
    log->info("wrote {} ({} stations)", path, layout.stations.size());
    return true;
}

} // namespace metro_render
