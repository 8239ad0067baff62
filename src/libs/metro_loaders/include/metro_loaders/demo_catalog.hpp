#pragma once

#include <metro_model/types.hpp>

namespace metro_loaders {

// Built-in catalog used when no --stations file is given.
metro_model::StationSet generate_demo_stations();

} // namespace metro_loaders
