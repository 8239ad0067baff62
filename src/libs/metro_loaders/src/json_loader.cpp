#include <metro_loaders/json_loader.hpp>
#include <metro_logging/logging.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <unordered_set>

namespace metro_loaders {

namespace {

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

double number_or(const nlohmann::json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

int int_or(const nlohmann::json& j, const char* key, int fallback) {
    return j.contains(key) && j[key].is_number_integer() ? j[key].get<int>() : fallback;
}

std::optional<metro_model::Station> parse_station(const nlohmann::json& s) {
    auto log = metro_logging::get_logger("loaders");
    metro_model::Station st;
    if (!s.contains("id") || !s["id"].is_string()) {
        log->warn("station without string id");
        return std::nullopt;
    }
    st.id = s["id"].get<std::string>();
    if (!s.contains("year") || !s["year"].is_number_integer()) {
        log->warn("station '{}': missing integer year", st.id);
        return std::nullopt;
    }
    st.year = s["year"].get<int>();
    if (!s.contains("lines") || !s["lines"].is_array() || s["lines"].empty()) {
        log->warn("station '{}': lines must be a non-empty array", st.id);
        return std::nullopt;
    }
    for (const auto& l : s["lines"]) {
        auto line = l.is_string() ? metro_model::line_from_string(l.get<std::string>()) : std::nullopt;
        if (!line) {
            log->warn("station '{}': unknown line {}", st.id, l.dump());
            return std::nullopt;
        }
        if (!st.has_line(*line)) st.lines.push_back(*line);
    }
    if (s.contains("significance")) {
        auto sig = s["significance"].is_string()
            ? metro_model::significance_from_string(s["significance"].get<std::string>())
            : std::nullopt;
        if (!sig) {
            log->warn("station '{}': unknown significance {}", st.id, s["significance"].dump());
            return std::nullopt;
        }
        st.significance = *sig;
    }
    st.name = string_or(s, "name", st.id);
    // Older catalogs use the camelCase key.
    st.year_label = string_or(s, "year_label", string_or(s, "yearLabel", std::to_string(st.year)));
    return st;
}

std::optional<metro_model::StationSet> parse_station_set(const nlohmann::json& j) {
    auto log = metro_logging::get_logger("loaders");
    if (!j.contains("stations") || !j["stations"].is_array()) {
        log->warn("station catalog has no 'stations' array");
        return std::nullopt;
    }
    metro_model::StationSet out;
    out.name = string_or(j, "name", "");
    std::unordered_set<std::string> seen;
    for (const auto& s : j["stations"]) {
        auto st = parse_station(s);
        if (!st) return std::nullopt;
        if (!seen.insert(st->id).second) {
            log->warn("duplicate station id '{}'", st->id);
            return std::nullopt;
        }
        out.stations.push_back(std::move(*st));
    }
    return out;
}

metro_model::Corridor parse_corridor(const nlohmann::json& c, const metro_model::Corridor& base) {
    metro_model::Corridor out = base;
    out.y_fraction = number_or(c, "y_fraction", base.y_fraction);
    out.convergence_offset = number_or(c, "convergence_offset", base.convergence_offset);
    return out;
}

std::optional<metro_model::TimelineConfig> parse_timeline_config(const nlohmann::json& j,
    const metro_model::TimelineConfig& base) {
    auto log = metro_logging::get_logger("loaders");
    if (!j.is_object()) {
        log->warn("timeline config must be a JSON object");
        return std::nullopt;
    }
    metro_model::TimelineConfig out = base;

    if (j.contains("canvas") && j["canvas"].is_object()) {
        const auto& c = j["canvas"];
        out.canvas.width = number_or(c, "width", out.canvas.width);
        out.canvas.height = number_or(c, "height", out.canvas.height);
        out.canvas.min_zoom = number_or(c, "min_zoom", out.canvas.min_zoom);
        out.canvas.max_zoom = number_or(c, "max_zoom", out.canvas.max_zoom);
    }

    if (j.contains("anchors")) {
        if (!j["anchors"].is_array()) {
            log->warn("'anchors' must be an array");
            return std::nullopt;
        }
        out.anchors.clear();
        for (const auto& a : j["anchors"]) {
            if (!a.contains("year") || !a["year"].is_number_integer() ||
                !a.contains("position") || !a["position"].is_number()) {
                log->warn("anchor needs integer 'year' and numeric 'position': {}", a.dump());
                return std::nullopt;
            }
            out.anchors.push_back({ a["year"].get<int>(), a["position"].get<double>() });
        }
    }

    if (j.contains("corridors")) {
        if (!j["corridors"].is_object()) {
            log->warn("'corridors' must be an object keyed by line name");
            return std::nullopt;
        }
        for (auto it = j["corridors"].begin(); it != j["corridors"].end(); ++it) {
            auto line = metro_model::line_from_string(it.key());
            if (!line || !it.value().is_object()) {
                log->warn("unknown corridor '{}'", it.key());
                return std::nullopt;
            }
            auto& slot = out.corridors[metro_model::line_index(*line)];
            slot = parse_corridor(it.value(), slot);
        }
    }

    if (j.contains("convergence") && j["convergence"].is_object()) {
        const auto& c = j["convergence"];
        out.convergence.year = int_or(c, "year", out.convergence.year);
        out.convergence.y_fraction = number_or(c, "y_fraction", out.convergence.y_fraction);
        out.convergence.approach_run = number_or(c, "approach_run", out.convergence.approach_run);
        out.convergence.extension = number_or(c, "extension", out.convergence.extension);
    }

    if (j.contains("placement") && j["placement"].is_object()) {
        const auto& p = j["placement"];
        out.placement.collision_threshold = number_or(p, "collision_threshold", out.placement.collision_threshold);
        out.placement.offset_step = number_or(p, "offset_step", out.placement.offset_step);
        out.placement.max_attempts = int_or(p, "max_attempts", out.placement.max_attempts);
    }

    if (j.contains("labels") && j["labels"].is_object()) {
        const auto& l = j["labels"];
        out.labels.horizontal_window = number_or(l, "horizontal_window", out.labels.horizontal_window);
        out.labels.label_height = number_or(l, "label_height", out.labels.label_height);
        out.labels.min_gap = number_or(l, "min_gap", out.labels.min_gap);
        out.labels.default_priority = number_or(l, "default_priority", out.labels.default_priority);
        out.labels.hovered_priority = number_or(l, "hovered_priority", out.labels.hovered_priority);
        out.labels.selected_priority = number_or(l, "selected_priority", out.labels.selected_priority);
    }

    if (j.contains("braided_line")) {
        auto line = j["braided_line"].is_string()
            ? metro_model::line_from_string(j["braided_line"].get<std::string>())
            : std::nullopt;
        if (!line) {
            log->warn("unknown braided_line {}", j["braided_line"].dump());
            return std::nullopt;
        }
        out.braided_line = *line;
    }
    out.braid_offset = number_or(j, "braid_offset", out.braid_offset);
    out.tangent_ratio = number_or(j, "tangent_ratio", out.tangent_ratio);

    if (j.contains("journey") && j["journey"].is_array()) {
        out.journey_station_ids.clear();
        for (const auto& id : j["journey"])
            if (id.is_string()) out.journey_station_ids.push_back(id.get<std::string>());
    }

    if (j.contains("eras") && j["eras"].is_array()) {
        out.eras.clear();
        for (const auto& e : j["eras"]) {
            if (!e.contains("id") || !e["id"].is_string() ||
                !e.contains("start_year") || !e["start_year"].is_number_integer() ||
                !e.contains("end_year") || !e["end_year"].is_number_integer()) {
                log->warn("era needs 'id', 'start_year' and 'end_year': {}", e.dump());
                return std::nullopt;
            }
            metro_model::Era era;
            era.id = e["id"].get<std::string>();
            era.label = string_or(e, "label", era.id);
            era.start_year = e["start_year"].get<int>();
            era.end_year = e["end_year"].get<int>();
            out.eras.push_back(std::move(era));
        }
    }

    return out;
}

} // namespace

std::optional<metro_model::StationSet> load_stations_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_station_set(j);
    } catch (const nlohmann::json::exception& e) {
        metro_logging::get_logger("loaders")->warn("station catalog: {}", e.what());
        return std::nullopt;
    }
}

std::optional<metro_model::StationSet> load_stations_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        metro_logging::get_logger("loaders")->warn("cannot open station catalog '{}'", path);
        return std::nullopt;
    }
    return load_stations_from_json(f);
}

std::optional<metro_model::TimelineConfig> load_timeline_config_from_json(std::istream& in,
    const metro_model::TimelineConfig& base) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_timeline_config(j, base);
    } catch (const nlohmann::json::exception& e) {
        metro_logging::get_logger("loaders")->warn("timeline config: {}", e.what());
        return std::nullopt;
    }
}

std::optional<metro_model::TimelineConfig> load_timeline_config_from_json_file(const std::string& path,
    const metro_model::TimelineConfig& base) {
    std::ifstream f(path);
    if (!f) {
        metro_logging::get_logger("loaders")->warn("cannot open timeline config '{}'", path);
        return std::nullopt;
    }
    return load_timeline_config_from_json(f, base);
}

} // namespace metro_loaders
