#include <metro_layout/corridor.hpp>
#include <algorithm>

namespace metro_layout {

double corridor_y(const metro_model::TimelineConfig& config, metro_model::LineId line) {
    return config.corridor_y(line);
}

metro_model::Point convergence_point(const metro_model::TimelineConfig& config, const TimeScale& scale) {
    return { scale.year_to_x(config.convergence.year), config.convergence.y_fraction * config.canvas.height };
}

metro_model::Point line_convergence_point(const metro_model::TimelineConfig& config,
    const TimeScale& scale, metro_model::LineId line)
{
    metro_model::Point p = convergence_point(config, scale);
    p.y += config.corridor(line).convergence_offset;
    return p;
}

metro_model::Point line_terminal_point(const metro_model::TimelineConfig& config,
    const TimeScale& scale, metro_model::LineId line)
{
    metro_model::Point p = line_convergence_point(config, scale, line);
    p.x += config.convergence.extension;
    return p;
}

double top_corridor_y(const metro_model::TimelineConfig& config, const metro_model::Station& station) {
    if (station.lines.empty()) return config.canvas.height * 0.5;
    double top = config.corridor_y(station.lines.front());
    for (auto line : station.lines)
        top = std::min(top, config.corridor_y(line));
    return top;
}

} // namespace metro_layout
