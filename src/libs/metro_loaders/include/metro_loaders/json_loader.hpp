#pragma once

#include <metro_model/timeline_config.hpp>
#include <metro_model/types.hpp>
#include <istream>
#include <optional>
#include <string>

namespace metro_loaders {

// Station catalog: { "name": ..., "stations": [ { "id", "year", "lines", "significance", "name", "year_label" } ] }.
// Unknown line names, empty line lists and duplicate ids reject the whole catalog.
std::optional<metro_model::StationSet> load_stations_from_json(std::istream& in);
std::optional<metro_model::StationSet> load_stations_from_json_file(const std::string& path);

// Timeline overrides: every section present in the document replaces the
// corresponding part of base; absent sections keep base values.
std::optional<metro_model::TimelineConfig> load_timeline_config_from_json(std::istream& in,
    const metro_model::TimelineConfig& base);
std::optional<metro_model::TimelineConfig> load_timeline_config_from_json_file(const std::string& path,
    const metro_model::TimelineConfig& base);

} // namespace metro_loaders
