#pragma once

#include "Logger/Logger.hpp"

namespace turnkit::console {

struct AppConfig;

//! Set up logging from the given settings. Only the first call takes effect.
//! Logger() falls back to the process settings if this was never called.
void InitializeLogging(const AppConfig& settings);

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace turnkit::console
