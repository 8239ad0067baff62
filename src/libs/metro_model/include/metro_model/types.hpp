#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metro_model {

// The five thematic lines. Order is the top-to-bottom corridor order and
// the index into every per-line table.
enum class LineId {
    Tech,
    War,
    Population,
    Philosophy,
    Empire
};

constexpr std::size_t line_count = 5;

constexpr std::array<LineId, line_count> all_lines = {
    LineId::Tech, LineId::War, LineId::Population, LineId::Philosophy, LineId::Empire
};

constexpr std::size_t line_index(LineId line) {
    return static_cast<std::size_t>(line);
}

const char* line_name(LineId line);
std::optional<LineId> line_from_string(std::string_view name);

enum class Significance {
    Normal,
    Minor,
    Major,
    Hub,
    Crisis,
    Current
};

const char* significance_name(Significance significance);
std::optional<Significance> significance_from_string(std::string_view name);

struct Point {
    double x = 0;
    double y = 0;
};

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

struct Station {
    std::string id;
    int year = 0;
    // [0] = primary line (defines the station's y); never empty once loaded.
    std::vector<LineId> lines;
    Significance significance = Significance::Normal;
    // Content fields; geometry never reads them.
    std::string name;
    std::string year_label;

    bool has_line(LineId line) const;
    LineId primary_line() const { return lines.front(); }
};

struct StationSet {
    std::string name;
    std::vector<Station> stations;
};

struct PlacedStation {
    Station station;
    Point coords;
    bool was_offset = false;
    // Collision search ran out of attempts; coords are the last attempt.
    bool placement_exhausted = false;
};

} // namespace metro_model
