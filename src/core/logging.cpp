#include "rpl/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace rpl::core {

Result<void> configure_logging(const LoggingConfig& config) {
    const auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        return Err<void>(ErrorKind::InvalidConfig, "Unknown log level: " + config.level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                *config.file, config.max_file_size, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            return Err<void>(ErrorKind::Io, std::string("Cannot open log file: ") + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("rpl", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::set_pattern(config.pattern);
    spdlog::flush_on(spdlog::level::warn);
    return Ok();
}

} // namespace rpl::core
