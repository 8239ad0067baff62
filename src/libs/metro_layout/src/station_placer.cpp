#include <metro_layout/station_placer.hpp>
#include <metro_layout/corridor.hpp>
#include <metro_logging/logging.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace metro_layout {

namespace {

bool collides(const std::vector<metro_model::Point>& placed, double x, double y, double threshold) {
    for (const auto& p : placed) {
        if (std::abs(p.x - x) < threshold && std::abs(p.y - y) < threshold)
            return true;
    }
    return false;
}

} // namespace

double nudge_offset(int attempt, double step) {
    const int magnitude = (attempt + 1) / 2;
    const double sign = (attempt % 2 == 1) ? 1.0 : -1.0;
    return sign * magnitude * step;
}

std::vector<metro_model::PlacedStation> place_stations(
    const std::vector<metro_model::Station>& stations,
    const metro_model::TimelineConfig& config,
    const TimeScale& scale)
{
    auto logger = metro_logging::get_logger("layout");
    const auto& params = config.placement;

    std::vector<metro_model::PlacedStation> out;
    out.reserve(stations.size());
    for (const auto& s : stations) {
        metro_model::PlacedStation ps;
        ps.station = s;
        if (!s.lines.empty()) {
            ps.coords.y = corridor_y(config, s.primary_line());
        } else {
            // Loaders reject empty line lists; keep such a station mid-canvas rather than failing.
            ps.coords.y = config.canvas.height * 0.5;
        }
        ps.coords.x = scale.year_to_x(s.year);
        out.push_back(std::move(ps));
    }

    std::vector<std::size_t> order(out.size());
    std::iota(order.begin(), order.end(), std::size_t{ 0 });
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        const auto& pa = out[a].coords;
        const auto& pb = out[b].coords;
        if (pa.x != pb.x) return pa.x < pb.x;
        return pa.y < pb.y;
    });

    std::vector<metro_model::Point> placed;
    placed.reserve(out.size());
    std::size_t offset_count = 0;
    for (std::size_t idx : order) {
        auto& ps = out[idx];
        const double original_x = ps.coords.x;
        const double y = ps.coords.y;
        double x = original_x;

        int attempt = 0;
        bool blocked = collides(placed, x, y, params.collision_threshold);
        if (params.offset_step > 0.0) {
            // Candidates are clamped before testing so the accepted x is the tested one.
            // Near a canvas edge several nudges clamp to the same x; only new ones use the budget.
            std::vector<double> tried{ original_x };
            const double reach = config.canvas.width + params.offset_step;
            for (int k = 1; blocked && attempt < params.max_attempts; ++k) {
                const double offset = nudge_offset(k, params.offset_step);
                if (std::abs(offset) > reach) break;
                const double candidate = std::clamp(original_x + offset, 0.0, config.canvas.width);
                if (std::find(tried.begin(), tried.end(), candidate) != tried.end()) continue;
                tried.push_back(candidate);
                ++attempt;
                x = candidate;
                blocked = collides(placed, x, y, params.collision_threshold);
            }
        }

        ps.coords.x = x;
        ps.was_offset = x != original_x;
        ps.placement_exhausted = blocked;
        placed.push_back(ps.coords);

        if (ps.was_offset) {
            ++offset_count;
            logger->debug("station_offset id={} year={} from_x={} to_x={} attempts={}",
                ps.station.id, ps.station.year, original_x, x, attempt);
        }
        if (blocked) {
            logger->warn("station_placement_exhausted id={} x={} y={} attempts={}",
                ps.station.id, x, y, attempt);
        }
    }

    logger->debug("placed {} stations, {} offset", out.size(), offset_count);
    return out;
}

} // namespace metro_layout
