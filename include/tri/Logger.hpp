#ifndef TRIANGLEFRAME_LOGGER_HPP
#define TRIANGLEFRAME_LOGGER_HPP
#include <filesystem>
#include <source_location>
#include <string_view>
#include <vector>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

/**
 * Process wide spdlog logger writing to stdout and LOG_FILE.
 * Every call to instance() stamps the caller's file and line into the pattern.
 */
class Logger : public spdlog::logger
{
	static std::vector<spdlog::sink_ptr> make_sinks()
	{
		auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
		auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(LOG_FILE, true);
		file->set_level(spdlog::level::trace);
#ifdef NDEBUG
		console->set_level(spdlog::level::warn);
#else
		console->set_level(spdlog::level::trace);
#endif
		return {console, file};
	}

	explicit Logger(const std::vector<spdlog::sink_ptr>& sinks)
		: logger("TriangleFrame", sinks.begin(), sinks.end())
	{
#ifdef NDEBUG
		set_level(spdlog::level::debug);
#else
		set_level(spdlog::level::trace);
#endif
	}

public:
	/// Tag shown in the location column, e.g. "[Window.cpp:42]" or "[VulkanDebug]".
	void use_origin(std::string_view origin)
	{
		set_pattern(fmt::format("[TriangleFrame]{:<30}[%^%5l%$] %v", origin));
	}

	static Logger& instance(std::source_location loc = std::source_location::current())
	{
		static Logger logger{make_sinks()};
		auto file = std::filesystem::path{loc.file_name()}.filename().string();
		logger.use_origin(fmt::format("[{}:{}]", file, loc.line()));
		return logger;
	}
};

#endif // TRIANGLEFRAME_LOGGER_HPP
