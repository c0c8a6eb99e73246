#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace minigam::app {

namespace {

Logging::LogConfig& engineLogConfig() {
	static Logging::LogConfig config;
	return config;
}

//! Game log file under the user log dir. Debug builds log everything and echo to the console.
void setupEngineLog(Logging::LogConfig& config) {
	config.SetLogEnabled(true);
#ifdef NDEBUG
	config.SetMinLogLevel(Logging::LogLevel::Info);
#else
	config.SetMinLogLevel(Logging::LogLevel::Any);
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif

	const auto logDir = Logging::GetDefaultLogDir("Minigam/App");

	std::error_code ec{};
	std::filesystem::create_directories(logDir, ec);
	if (ec) {
		std::cerr << std::format("[Logger] Cannot create {}: {}\nGame log is not written to file.\n", logDir.string(), ec.message());
		return;
	}
	config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logDir / "log.txt"));
}

} // namespace

Logging::Logger Logger() {
	static std::once_flag setupFlag;
	std::call_once(setupFlag, [] { setupEngineLog(engineLogConfig()); });

	return Logging::Logger(engineLogConfig());
}

} // namespace minigam::app
