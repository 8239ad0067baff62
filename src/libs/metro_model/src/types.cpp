#include <metro_model/types.hpp>
#include <algorithm>
#include <cctype>

namespace metro_model {

namespace {

// Lower-case comparison so both "Tech" (catalog style) and "tech" (config style) resolve.
bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) return false;
    }
    return true;
}

} // namespace

const char* line_name(LineId line) {
    switch (line) {
    case LineId::Tech: return "Tech";
    case LineId::War: return "War";
    case LineId::Population: return "Population";
    case LineId::Philosophy: return "Philosophy";
    case LineId::Empire: return "Empire";
    }
    return "Tech";
}

std::optional<LineId> line_from_string(std::string_view name) {
    for (LineId line : all_lines) {
        if (iequals(name, line_name(line))) return line;
    }
    return std::nullopt;
}

const char* significance_name(Significance significance) {
    switch (significance) {
    case Significance::Normal: return "normal";
    case Significance::Minor: return "minor";
    case Significance::Major: return "major";
    case Significance::Hub: return "hub";
    case Significance::Crisis: return "crisis";
    case Significance::Current: return "current";
    }
    return "normal";
}

std::optional<Significance> significance_from_string(std::string_view name) {
    constexpr Significance all[] = {
        Significance::Normal, Significance::Minor, Significance::Major,
        Significance::Hub, Significance::Crisis, Significance::Current
    };
    for (Significance s : all) {
        if (iequals(name, significance_name(s))) return s;
    }
    return std::nullopt;
}

bool Station::has_line(LineId line) const {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

} // namespace metro_model
