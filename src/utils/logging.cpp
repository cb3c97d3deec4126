#include "seriesfeat/utils/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace seriesfeat::utils {

namespace {

std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}

} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		// Another component may already have registered the name.
		logger_ = spdlog::get("seriesfeat");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("seriesfeat");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	{
		std::lock_guard<std::mutex> lock(loggerMutex());
		if (logger_) {
			return logger_;
		}
	}
	init();
	return logger_;
}

} // namespace seriesfeat::utils
