#pragma once

#include <metro_layout/path_builder.hpp>
#include <metro_model/timeline_config.hpp>
#include <metro_model/types.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace metro_layout {

struct MetroLayout {
    std::vector<metro_model::PlacedStation> stations;
    std::array<MetroLinePath, metro_model::line_count> paths;
};

// Full placement + path pass. Throws std::invalid_argument on a malformed anchor table.
MetroLayout compute_layout(const std::vector<metro_model::Station>& stations,
    const metro_model::TimelineConfig& config);

// Hash of everything the layout depends on: station records, canvas,
// anchors, corridors, convergence, placement and path parameters.
std::size_t layout_fingerprint(const std::vector<metro_model::Station>& stations,
    const metro_model::TimelineConfig& config);

// Memoises compute_layout; recomputes wholesale when the inputs change. The
// fingerprint is only a quick reject; a match is confirmed against the stored inputs.
class LayoutCache {
public:
    const MetroLayout& get(const std::vector<metro_model::Station>& stations,
        const metro_model::TimelineConfig& config);
    void invalidate();
    std::size_t recompute_count() const { return recompute_count_; }

private:
    bool matches(std::size_t key, const std::vector<metro_model::Station>& stations,
        const metro_model::TimelineConfig& config) const;

    std::optional<std::size_t> key_;
    std::vector<metro_model::Station> stations_;
    metro_model::TimelineConfig config_;
    MetroLayout layout_;
    std::size_t recompute_count_ = 0;
};

} // namespace metro_layout
