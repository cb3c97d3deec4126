#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace seriesfeat::utils {

/**
 * @class Logging
 * @brief Process-wide "seriesfeat" logger shared by every validator.
 *
 * The logger is created on first use under a mutex. If a logger named
 * "seriesfeat" is already registered with spdlog it is reused instead of
 * registering a second sink.
 */
class Logging {
public:
	/**
	 * @brief Returns the shared logger, creating it at info level on first call.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Creates or reuses the logger and sets its threshold.
	 *
	 * Calling it again only changes the level. Messages at warn and above are
	 * flushed immediately.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace seriesfeat::utils

#define SERIESFEAT_TRACE(...)    seriesfeat::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define SERIESFEAT_DEBUG(...)    seriesfeat::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define SERIESFEAT_INFO(...)     seriesfeat::utils::Logging::getLogger()->info(__VA_ARGS__)
#define SERIESFEAT_WARN(...)     seriesfeat::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define SERIESFEAT_ERROR(...)    seriesfeat::utils::Logging::getLogger()->error(__VA_ARGS__)
#define SERIESFEAT_CRITICAL(...) seriesfeat::utils::Logging::getLogger()->critical(__VA_ARGS__)
