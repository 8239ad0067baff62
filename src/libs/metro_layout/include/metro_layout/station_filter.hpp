#pragma once

#include <metro_model/timeline_config.hpp>
#include <metro_model/types.hpp>
#include <string>
#include <vector>

namespace metro_layout {

const metro_model::Era* find_era(const metro_model::TimelineConfig& config, const std::string& era_id);

// Case-insensitive substring match on id, name and year label. Empty query matches.
bool station_matches(const metro_model::Station& station, const std::string& query);

// Stations matching the query and, when era is non-null, inside the era's year range.
std::vector<const metro_model::PlacedStation*> filter_stations(
    const std::vector<metro_model::PlacedStation>& placed,
    const std::string& query,
    const metro_model::Era* era = nullptr);

} // namespace metro_layout
