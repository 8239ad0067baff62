#include <metro_layout/layout_cache.hpp>
#include <metro_layout/station_placer.hpp>
#include <metro_layout/time_scale.hpp>
#include <metro_logging/logging.hpp>
#include <functional>
#include <string>

namespace metro_layout {

namespace {

template <typename T>
void hash_combine(std::size_t& seed, const T& value) {
    seed ^= std::hash<T>{}(value) + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
}

bool same_station(const metro_model::Station& a, const metro_model::Station& b) {
    return a.id == b.id && a.year == b.year && a.lines == b.lines && a.significance == b.significance
        && a.name == b.name && a.year_label == b.year_label;
}

bool same_layout_config(const metro_model::TimelineConfig& a, const metro_model::TimelineConfig& b) {
    if (a.canvas.width != b.canvas.width || a.canvas.height != b.canvas.height) return false;
    if (a.anchors.size() != b.anchors.size()) return false;
    for (std::size_t i = 0; i < a.anchors.size(); ++i) {
        if (a.anchors[i].year != b.anchors[i].year || a.anchors[i].position != b.anchors[i].position)
            return false;
    }
    for (std::size_t i = 0; i < a.corridors.size(); ++i) {
        if (a.corridors[i].y_fraction != b.corridors[i].y_fraction
            || a.corridors[i].convergence_offset != b.corridors[i].convergence_offset)
            return false;
    }
    return a.convergence.year == b.convergence.year
        && a.convergence.y_fraction == b.convergence.y_fraction
        && a.convergence.approach_run == b.convergence.approach_run
        && a.convergence.extension == b.convergence.extension
        && a.placement.collision_threshold == b.placement.collision_threshold
        && a.placement.offset_step == b.placement.offset_step
        && a.placement.max_attempts == b.placement.max_attempts
        && a.braided_line == b.braided_line
        && a.braid_offset == b.braid_offset
        && a.tangent_ratio == b.tangent_ratio;
}

} // namespace

MetroLayout compute_layout(const std::vector<metro_model::Station>& stations,
    const metro_model::TimelineConfig& config)
{
    const TimeScale scale(config);
    MetroLayout out;
    out.stations = place_stations(stations, config, scale);
    out.paths = build_metro_paths(out.stations, config, scale);
    return out;
}

std::size_t layout_fingerprint(const std::vector<metro_model::Station>& stations,
    const metro_model::TimelineConfig& config)
{
    std::size_t seed = stations.size();
    for (const auto& s : stations) {
        hash_combine(seed, s.id);
        hash_combine(seed, s.year);
        hash_combine(seed, static_cast<int>(s.significance));
        hash_combine(seed, s.name);
        hash_combine(seed, s.year_label);
        for (auto line : s.lines)
            hash_combine(seed, static_cast<int>(line));
    }
    hash_combine(seed, config.canvas.width);
    hash_combine(seed, config.canvas.height);
    for (const auto& a : config.anchors) {
        hash_combine(seed, a.year);
        hash_combine(seed, a.position);
    }
    for (const auto& c : config.corridors) {
        hash_combine(seed, c.y_fraction);
        hash_combine(seed, c.convergence_offset);
    }
    hash_combine(seed, config.convergence.year);
    hash_combine(seed, config.convergence.y_fraction);
    hash_combine(seed, config.convergence.approach_run);
    hash_combine(seed, config.convergence.extension);
    hash_combine(seed, config.placement.collision_threshold);
    hash_combine(seed, config.placement.offset_step);
    hash_combine(seed, config.placement.max_attempts);
    hash_combine(seed, static_cast<int>(config.braided_line));
    hash_combine(seed, config.braid_offset);
    hash_combine(seed, config.tangent_ratio);
    return seed;
}

const MetroLayout& LayoutCache::get(const std::vector<metro_model::Station>& stations,
    const metro_model::TimelineConfig& config)
{
    const std::size_t key = layout_fingerprint(stations, config);
    if (matches(key, stations, config)) return layout_;

    layout_ = compute_layout(stations, config);
    key_ = key;
    stations_ = stations;
    config_ = config;
    ++recompute_count_;
    metro_logging::get_logger("layout")->info("layout recomputed stations={} pass={}",
        layout_.stations.size(), recompute_count_);
    return layout_;
}

bool LayoutCache::matches(std::size_t key, const std::vector<metro_model::Station>& stations,
    const metro_model::TimelineConfig& config) const
{
    if (!key_ || *key_ != key || stations_.size() != stations.size()) return false;
    for (std::size_t i = 0; i < stations.size(); ++i) {
        if (!same_station(stations_[i], stations[i])) return false;
    }
    return same_layout_config(config_, config);
}

void LayoutCache::invalidate() {
    key_.reset();
    stations_.clear();
}

} // namespace metro_layout
