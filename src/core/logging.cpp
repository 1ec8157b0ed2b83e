#include "toolroute/core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace toolroute::core {

namespace {

constexpr size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

}  // namespace

void init_logging(const ObservabilityConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.log_path.empty()) {
        fs::path file = config.log_path;
        if (fs::is_directory(file) || !file.has_extension()) {
            file /= "toolroute.log";
        }
        std::error_code ec;
        fs::create_directories(file.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file.string(), kMaxLogFileSize, kMaxLogFiles));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", file.string(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("toolroute", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

}  // namespace toolroute::core
