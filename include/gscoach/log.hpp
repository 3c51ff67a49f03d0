#pragma once
#include <spdlog/spdlog.h>

namespace gscoach {

// Project logger ("gscoach", stderr colour sink). Created on first use.
spdlog::logger& logger();

// Set the level once at program start; warnings and errors flush immediately.
void init_logging(spdlog::level::level_enum level);

} // namespace gscoach
