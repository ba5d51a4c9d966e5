#pragma once

#include "Logger/Logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace turnkit::console {

//! Console application settings. Read once from the environment.
struct AppConfig {
	std::filesystem::path logDir;                     //!< TURNKIT_LOG_DIR
	Logging::LogLevel minLogLevel{Logging::LogLevel::Any}; //!< TURNKIT_LOG_LEVEL
	std::optional<std::filesystem::path> journalPath; //!< TURNKIT_JOURNAL. Finished games are appended here.

	std::vector<std::string> warnings; //!< Problems found while reading the settings. Logged once logging is up.
};

//! Parse a log level name. Case insensitive. Returns empty for unknown names.
std::optional<Logging::LogLevel> parseLogLevel(const std::string& name);

//! Build the settings from environment variables, using defaults where a variable is not set.
AppConfig loadConfig();

//! Settings of this process. Loaded on first use.
const AppConfig& appConfig();

} // namespace turnkit::console
