#include "Logging.hpp"
#include "appConfig.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>

namespace turnkit::console {

static Logging::LogConfig config;
static std::once_flag logInitFlag;

//! Enable logging to an output file + console(for debug builds).
static void InitializeLogger(const AppConfig& settings) {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(settings.minLogLevel);

	std::error_code ec{};
	std::filesystem::create_directories(settings.logDir, ec);
	if (!ec) {
		config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(settings.logDir / "log.txt"));
	} else {
		std::cerr << std::format("[Logger] Could not create directory: {}\nApplication will not log to file.\n", settings.logDir.string());
	}

#ifndef NDEBUG
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif
}

void InitializeLogging(const AppConfig& settings) {
	std::call_once(logInitFlag, InitializeLogger, std::cref(settings));
}

Logging::Logger Logger() {
	InitializeLogging(appConfig());
	return Logging::Logger(config);
}

} // namespace turnkit::console
