#include <algorithm>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

#include <metro_layout/layout_cache.hpp>
#include <metro_layout/timeline_config.hpp>
#include <metro_loaders/demo_catalog.hpp>
#include <metro_loaders/json_loader.hpp>
#include <metro_logging/logging.hpp>

#ifndef METRO_DATA_DIR
#define METRO_DATA_DIR "data"
#endif

namespace {

using metro_model::LineId;
using metro_model::Significance;

struct TestCase {
    const char* name;
    const char* intent;
    std::function<bool(void)> run;
};

std::optional<metro_model::StationSet> stations_from(const std::string& text) {
    std::istringstream in(text);
    return metro_loaders::load_stations_from_json(in);
}

std::optional<metro_model::TimelineConfig> config_from(const std::string& text) {
    std::istringstream in(text);
    return metro_loaders::load_timeline_config_from_json(in, metro_layout::default_timeline_config());
}

std::string data_path(const char* file) {
    return std::string(METRO_DATA_DIR) + "/" + file;
}

// Intent: a well-formed catalog loads with lines, significance and labels.
bool test_load_valid_catalog() {
    const auto set = stations_from(R"({
        "name": "Sample",
        "stations": [
            { "id": "rome", "name": "Founding of Rome", "year": -753, "year_label": "753 BCE",
              "lines": ["Empire", "philosophy", "Empire"], "significance": "hub" },
            { "id": "printing", "year": 1440, "lines": ["Tech"] }
        ]
    })");
    if (!set || set->name != "Sample" || set->stations.size() != 2) {
        return false;
    }
    const auto& rome = set->stations[0];
    const auto& printing = set->stations[1];
    return rome.lines.size() == 2 && rome.primary_line() == LineId::Empire &&
           rome.has_line(LineId::Philosophy) && rome.significance == Significance::Hub &&
           rome.year_label == "753 BCE" &&
           printing.name == "printing" && printing.year_label == "1440" &&
           printing.significance == Significance::Normal;
}

// Intent: the camelCase year label key is still accepted.
bool test_year_label_camel_case() {
    const auto set = stations_from(R"({ "stations": [
        { "id": "zero", "year": 0, "yearLabel": "Year zero", "lines": ["War"] } ] })");
    return set && set->stations[0].year_label == "Year zero";
}

// Intent: bad station records reject the whole catalog.
bool test_reject_bad_catalogs() {
    return !stations_from(R"({ "stations": [ { "id": "a", "year": 1, "lines": ["Railways"] } ] })") &&
           !stations_from(R"({ "stations": [ { "id": "a", "year": 1, "lines": [] } ] })") &&
           !stations_from(R"({ "stations": [ { "id": "a", "year": 1 } ] })") &&
           !stations_from(R"({ "stations": [ { "id": "a", "year": "1", "lines": ["Tech"] } ] })") &&
           !stations_from(R"({ "stations": [ { "id": "a", "year": 1, "lines": ["Tech"], "significance": "epic" } ] })") &&
           !stations_from(R"({ "stations": [ { "id": "a", "year": 1, "lines": ["Tech"] },
                                             { "id": "a", "year": 2, "lines": ["War"] } ] })") &&
           !stations_from(R"({ "catalog": [] })") &&
           !stations_from(R"({ "stations": [ { "id": "a", )");
}

// Intent: a missing file is reported as no catalog.
bool test_missing_file() {
    return !metro_loaders::load_stations_from_json_file(data_path("does_not_exist.json")) &&
           !metro_loaders::load_timeline_config_from_json_file(data_path("does_not_exist.json"),
               metro_layout::default_timeline_config());
}

// Intent: a partial override changes only the sections it names.
bool test_config_partial_override() {
    const auto base = metro_layout::default_timeline_config();
    const auto config = config_from(R"({
        "corridors": { "war": { "y_fraction": 0.4 } },
        "placement": { "offset_step": 90 },
        "braided_line": "Tech",
        "journey": ["rome", "printing"]
    })");
    if (!config) {
        return false;
    }
    const auto& war = config->corridor(LineId::War);
    return war.y_fraction == 0.4 && war.convergence_offset == base.corridor(LineId::War).convergence_offset &&
           config->corridor(LineId::Tech).y_fraction == base.corridor(LineId::Tech).y_fraction &&
           config->placement.offset_step == 90.0 &&
           config->placement.collision_threshold == base.placement.collision_threshold &&
           config->braided_line == LineId::Tech &&
           config->journey_station_ids.size() == 2 &&
           config->anchors.size() == base.anchors.size() &&
           config->eras.size() == base.eras.size();
}

// Intent: replaced anchors and eras come through, and validation sees them.
bool test_config_anchor_and_era_override() {
    const auto config = config_from(R"({
        "anchors": [ { "year": 0, "position": 0 }, { "year": 2000, "position": 1 } ],
        "eras": [ { "id": "all", "start_year": 0, "end_year": 2000 } ]
    })");
    if (!config || config->anchors.size() != 2 || config->eras.size() != 1 || config->eras[0].label != "all") {
        return false;
    }
    if (!metro_layout::validate_timeline_config(*config).empty()) {
        return false;
    }
    const auto broken = config_from(R"({ "anchors": [ { "year": 0, "position": 0 } ] })");
    return broken && !metro_layout::validate_timeline_config(*broken).empty();
}

// Intent: unknown names and malformed sections reject the override.
bool test_config_rejects_bad_overrides() {
    return !config_from(R"({ "corridors": { "Railways": { "y_fraction": 0.2 } } })") &&
           !config_from(R"({ "braided_line": "Railways" })") &&
           !config_from(R"({ "anchors": { "year": 0 } })") &&
           !config_from(R"({ "anchors": [ { "year": 0.5, "position": 0 } ] })") &&
           !config_from(R"({ "eras": [ { "id": "x", "start_year": 0 } ] })") &&
           !config_from(R"([1, 2, 3])") &&
           !config_from(R"({ "canvas": )");
}

// Intent: the shipped catalog loads completely with unique ids.
bool test_shipped_catalog() {
    const auto set = metro_loaders::load_stations_from_json_file(data_path("stations.json"));
    if (!set || set->stations.size() != 71) {
        return false;
    }
    std::unordered_set<std::string> ids;
    for (const auto& s : set->stations) {
        if (s.lines.empty() || !ids.insert(s.id).second) {
            return false;
        }
    }
    return true;
}

// Intent: the shipped config reproduces the built-in tables and validates clean.
bool test_shipped_config() {
    const auto base = metro_layout::default_timeline_config();
    const auto config = metro_loaders::load_timeline_config_from_json_file(data_path("timeline_config.json"), base);
    if (!config || !metro_layout::validate_timeline_config(*config).empty()) {
        return false;
    }
    if (config->anchors.size() != base.anchors.size() || config->eras.size() != base.eras.size() ||
        config->journey_station_ids != base.journey_station_ids || config->braided_line != base.braided_line) {
        return false;
    }
    for (std::size_t i = 0; i < base.anchors.size(); ++i) {
        if (config->anchors[i].year != base.anchors[i].year ||
            config->anchors[i].position != base.anchors[i].position) {
            return false;
        }
    }
    for (auto line : metro_model::all_lines) {
        if (config->corridor(line).y_fraction != base.corridor(line).y_fraction ||
            config->corridor(line).convergence_offset != base.corridor(line).convergence_offset) {
            return false;
        }
    }
    return true;
}

// Intent: the built-in catalog matches the shipped one and covers every tour stop.
bool test_demo_catalog() {
    const auto demo = metro_loaders::generate_demo_stations();
    const auto shipped = metro_loaders::load_stations_from_json_file(data_path("stations.json"));
    if (demo.stations.size() != 71 || !shipped) {
        return false;
    }
    std::unordered_set<std::string> ids;
    for (const auto& s : demo.stations) {
        if (s.lines.empty() || !ids.insert(s.id).second) {
            return false;
        }
    }
    for (const auto& s : shipped->stations) {
        if (ids.count(s.id) == 0) {
            return false;
        }
    }
    const auto config = metro_layout::default_timeline_config();
    return std::all_of(config.journey_station_ids.begin(), config.journey_station_ids.end(),
        [&](const std::string& id) { return ids.count(id) > 0; });
}

// Intent: the full catalog lays out with every station inside the canvas.
bool test_demo_catalog_layout() {
    const auto config = metro_layout::default_timeline_config();
    const auto demo = metro_loaders::generate_demo_stations();
    const auto layout = metro_layout::compute_layout(demo.stations, config);
    if (layout.stations.size() != demo.stations.size()) {
        return false;
    }
    for (const auto& ps : layout.stations) {
        if (ps.coords.x < 0.0 || ps.coords.x > config.canvas.width ||
            ps.coords.y != config.corridor_y(ps.station.primary_line())) {
            return false;
        }
    }
    return std::all_of(layout.paths.begin(), layout.paths.end(),
        [](const metro_layout::MetroLinePath& lp) { return !lp.main.empty(); });
}

} // namespace

int main() {
    metro_logging::set_level(spdlog::level::err);

    const std::vector<TestCase> tests = {
        {"Stations_LoadValid", "Well-formed catalog loads with defaults filled", test_load_valid_catalog},
        {"Stations_YearLabelCamelCase", "yearLabel key is accepted", test_year_label_camel_case},
        {"Stations_RejectBad", "Bad records reject the catalog", test_reject_bad_catalogs},
        {"Files_Missing", "Missing files load as nothing", test_missing_file},
        {"Config_PartialOverride", "Absent sections keep the base values", test_config_partial_override},
        {"Config_AnchorEraOverride", "Anchors and eras are replaced wholesale", test_config_anchor_and_era_override},
        {"Config_RejectBad", "Unknown names and malformed sections reject", test_config_rejects_bad_overrides},
        {"Data_ShippedCatalog", "data/stations.json loads all 71 stations", test_shipped_catalog},
        {"Data_ShippedConfig", "data/timeline_config.json matches the built-in tables", test_shipped_config},
        {"Demo_Catalog", "Built-in catalog covers shipped ids and tour stops", test_demo_catalog},
        {"Demo_Layout", "Built-in catalog lays out inside the canvas", test_demo_catalog_layout},
    };

    bool all_passed = true;
    for (const TestCase& test : tests) {
        const bool passed = test.run();
        std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
        all_passed = all_passed && passed;
    }

    if (!all_passed) {
        std::cerr << "loader tests failed\n";
        return 1;
    }

    std::cout << "loader tests passed (" << tests.size() << " cases)\n";
    return 0;
}
