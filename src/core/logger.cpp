/// @file logger.cpp
/// @brief Console and rotating-file sinks shared by the LATENTSKY and APP loggers.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

namespace latentsky::core
{

namespace
{

constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";
constexpr std::size_t kMaxFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxFiles = 3;

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            const std::vector<spdlog::sink_ptr>& sinks,
                                            spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(const LoggerConfig& config)
{
    if (is_initialized())
    {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    if (config.write_file)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path.string(), kMaxFileBytes, kMaxFiles));
    }
    for (auto& sink : sinks)
    {
        sink->set_pattern(kPattern);
    }

    s_core_logger = make_logger("LATENTSKY", sinks, config.level);
    s_app_logger = make_logger("APP", sinks, config.level);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

bool Logger::is_initialized()
{
    return s_core_logger != nullptr && s_app_logger != nullptr;
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace latentsky::core
