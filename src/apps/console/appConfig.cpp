#include "appConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>

namespace turnkit::console {

static constexpr char ENV_LOG_DIR[]   = "TURNKIT_LOG_DIR";
static constexpr char ENV_LOG_LEVEL[] = "TURNKIT_LOG_LEVEL";
static constexpr char ENV_JOURNAL[]   = "TURNKIT_JOURNAL";

std::optional<Logging::LogLevel> parseLogLevel(const std::string& name) {
	std::string lower = name;
	std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (lower == "any") {
		return Logging::LogLevel::Any;
	}
	if (lower == "debug") {
		return Logging::LogLevel::Debug;
	}
	if (lower == "info") {
		return Logging::LogLevel::Info;
	}
	if (lower == "warning") {
		return Logging::LogLevel::Warning;
	}
	if (lower == "error") {
		return Logging::LogLevel::Error;
	}
	return {};
}

AppConfig loadConfig() {
	AppConfig config{};

	if (const char* dir = std::getenv(ENV_LOG_DIR); dir && *dir) {
		config.logDir = dir;
	} else {
		config.logDir = Logging::GetDefaultLogDir("Turnkit/Console");
	}

	if (const char* level = std::getenv(ENV_LOG_LEVEL); level && *level) {
		if (const auto parsed = parseLogLevel(level)) {
			config.minLogLevel = *parsed;
		} else {
			config.warnings.push_back(std::format("[Config] Unknown log level '{}' in {}. Logging everything.", level, ENV_LOG_LEVEL));
		}
	}

	if (const char* journal = std::getenv(ENV_JOURNAL); journal && *journal) {
		config.journalPath = std::filesystem::path{journal};
	}

	return config;
}

const AppConfig& appConfig() {
	static const AppConfig config = loadConfig();
	return config;
}

} // namespace turnkit::console
