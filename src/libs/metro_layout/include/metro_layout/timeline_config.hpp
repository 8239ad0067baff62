#pragma once

#include <metro_model/timeline_config.hpp>
#include <string>
#include <vector>

namespace metro_layout {

struct ConfigIssue {
    std::string code;
    std::string message;
};

// Built-in tables: canvas 8000x4000, the hand-tuned density anchors, the
// five corridors, convergence at 2025, journey stops and eras.
metro_model::TimelineConfig default_timeline_config();

// Checks every table invariant the geometry relies on. An empty result means
// the configuration is usable; callers report issues once at startup.
std::vector<ConfigIssue> validate_timeline_config(const metro_model::TimelineConfig& config);

} // namespace metro_layout
