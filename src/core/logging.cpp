#include "logging.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace recycling::core {

void configure_logging(const SystemConfig& config) {
    config.validate();

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file));
        } catch (const spdlog::spdlog_ex& e) {
            throw std::runtime_error("Cannot open log file " + config.log_file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("recycling", sinks.begin(), sinks.end());
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_default_logger(std::move(logger));
}

}  // namespace recycling::core
