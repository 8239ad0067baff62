#include <metro_layout/path_builder.hpp>
#include <metro_layout/corridor.hpp>
#include <metro_layout/layout_constants.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace metro_layout {

namespace {

std::vector<metro_model::Point> offset_points(const std::vector<metro_model::Point>& points, double dy) {
    std::vector<metro_model::Point> out;
    out.reserve(points.size());
    for (const auto& p : points)
        out.push_back({ p.x, p.y + dy });
    return out;
}

void append_point(std::string& out, const metro_model::Point& p) {
    out += format_coordinate(p.x);
    out += ' ';
    out += format_coordinate(p.y);
}

} // namespace

std::string format_coordinate(double value) {
    if (std::abs(value) < 5e-4) return "0";
    const double rounded = std::round(value);
    if (std::abs(value - rounded) < 5e-4) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", rounded);
        return buf;
    }
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    std::string s(buf);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

std::string LinePath::to_svg() const {
    std::string out;
    for (const auto& cmd : commands) {
        if (!out.empty()) out += ' ';
        switch (cmd.kind) {
        case PathCommandKind::Move:
            out += "M ";
            append_point(out, cmd.to);
            break;
        case PathCommandKind::Line:
            out += "L ";
            append_point(out, cmd.to);
            break;
        case PathCommandKind::Cubic:
            out += "C ";
            append_point(out, cmd.c1);
            out += ", ";
            append_point(out, cmd.c2);
            out += ", ";
            append_point(out, cmd.to);
            break;
        }
    }
    return out;
}

std::vector<metro_model::Point> build_line_waypoints(
    const metro_model::Corridor& corridor,
    const std::vector<metro_model::PlacedStation>& placed,
    const metro_model::TimelineConfig& config,
    const TimeScale& scale)
{
    std::vector<metro_model::Point> points;
    points.push_back({ 0.0, corridor.y_fraction * config.canvas.height });

    std::vector<const metro_model::PlacedStation*> on_line;
    for (const auto& ps : placed) {
        if (ps.station.has_line(corridor.line)) on_line.push_back(&ps);
    }
    std::stable_sort(on_line.begin(), on_line.end(),
        [](const metro_model::PlacedStation* a, const metro_model::PlacedStation* b) {
            return a->coords.x < b->coords.x;
        });
    for (const auto* ps : on_line)
        points.push_back(ps->coords);

    const metro_model::Point converge = line_convergence_point(config, scale, corridor.line);
    const metro_model::Point terminal = line_terminal_point(config, scale, corridor.line);

    // Stay level until the approach run, then bend into the bundle.
    const metro_model::Point last = points.back();
    const double approach_x = converge.x - config.convergence.approach_run;
    if (approach_x > last.x + layout::convergence_snap)
        points.push_back({ approach_x, last.y });
    if (points.back().x < converge.x - layout::convergence_snap)
        points.push_back(converge);
    points.push_back(terminal);
    return points;
}

LinePath generate_smooth_path(const std::vector<metro_model::Point>& points, double tangent_ratio) {
    LinePath path;
    if (points.size() < 2) return path;

    path.commands.reserve(points.size());
    path.commands.push_back(PathCommand{ PathCommandKind::Move, {}, {}, points.front() });
    for (std::size_t i = 1; i < points.size(); ++i) {
        const auto& prev = points[i - 1];
        const auto& curr = points[i];
        const double dx = curr.x - prev.x;
        const double dy = std::abs(curr.y - prev.y);

        PathCommand cmd;
        cmd.to = curr;
        if (dy < layout::flat_segment_tolerance) {
            cmd.kind = PathCommandKind::Line;
        } else {
            // Control points level with their end points: flat departure and arrival.
            cmd.kind = PathCommandKind::Cubic;
            cmd.c1 = { prev.x + dx * tangent_ratio, prev.y };
            cmd.c2 = { curr.x - dx * tangent_ratio, curr.y };
        }
        path.commands.push_back(cmd);
    }
    return path;
}

BraidedPath generate_braided_path(const std::vector<metro_model::Point>& points,
    double offset, double tangent_ratio)
{
    BraidedPath out;
    out.main = generate_smooth_path(points, tangent_ratio);
    out.braid1 = generate_smooth_path(offset_points(points, offset), tangent_ratio);
    out.braid2 = generate_smooth_path(offset_points(points, -offset), tangent_ratio);
    return out;
}

std::array<MetroLinePath, metro_model::line_count> build_metro_paths(
    const std::vector<metro_model::PlacedStation>& placed,
    const metro_model::TimelineConfig& config,
    const TimeScale& scale)
{
    std::array<MetroLinePath, metro_model::line_count> out;
    for (auto line : metro_model::all_lines) {
        auto& lp = out[metro_model::line_index(line)];
        lp.line = line;
        const auto waypoints = build_line_waypoints(config.corridor(line), placed, config, scale);
        if (line == config.braided_line) {
            BraidedPath braided = generate_braided_path(waypoints, config.braid_offset, config.tangent_ratio);
            lp.braided = true;
            lp.main = std::move(braided.main);
            lp.braid1 = std::move(braided.braid1);
            lp.braid2 = std::move(braided.braid2);
        } else {
            lp.main = generate_smooth_path(waypoints, config.tangent_ratio);
        }
    }
    return out;
}

} // namespace metro_layout
