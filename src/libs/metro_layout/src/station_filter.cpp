#include <metro_layout/station_filter.hpp>
#include <algorithm>
#include <cctype>

namespace metro_layout {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(const std::string& haystack_lower, const std::string& needle_lower) {
    return haystack_lower.find(needle_lower) != std::string::npos;
}

} // namespace

const metro_model::Era* find_era(const metro_model::TimelineConfig& config, const std::string& era_id) {
    for (const auto& era : config.eras)
        if (era.id == era_id) return &era;
    return nullptr;
}

bool station_matches(const metro_model::Station& station, const std::string& query) {
    if (query.empty()) return true;
    const std::string q = to_lower(query);
    return contains(to_lower(station.id), q)
        || contains(to_lower(station.name), q)
        || contains(to_lower(station.year_label), q);
}

std::vector<const metro_model::PlacedStation*> filter_stations(
    const std::vector<metro_model::PlacedStation>& placed,
    const std::string& query,
    const metro_model::Era* era)
{
    std::vector<const metro_model::PlacedStation*> out;
    for (const auto& ps : placed) {
        if (era && (ps.station.year < era->start_year || ps.station.year > era->end_year)) continue;
        if (!station_matches(ps.station, query)) continue;
        out.push_back(&ps);
    }
    return out;
}

} // namespace metro_layout
