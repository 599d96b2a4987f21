#pragma once

/// @file logger.hpp
/// @brief spdlog loggers for LatentSky and the LSKY_ logging macros.

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace latentsky::core
{
    struct LoggerConfig
    {
        spdlog::level::level_enum level = spdlog::level::trace;

        /// @brief Also write to a rotating file (5 MB x 3) at @ref file_path.
        bool write_file = true;
        std::filesystem::path file_path = "latentsky.log";
    };

    /// @brief Two named loggers sharing one set of sinks.
    ///
    /// "LATENTSKY" carries rendering, Vulkan and dataset messages (LSKY_CORE_*);
    /// "APP" carries lifecycle and animation messages (LSKY_*). Both flush on warn.
    /// The macros require init() to have run.
    class Logger
    {
    public:
        /// @brief Create both loggers. Later calls keep the existing loggers.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and drop both loggers; init() may be called again afterwards.
        static void shutdown();

        [[nodiscard]] static bool is_initialized();

        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace latentsky::core

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define LSKY_CORE_TRACE(...)    ::latentsky::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define LSKY_CORE_INFO(...)     ::latentsky::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define LSKY_CORE_WARN(...)     ::latentsky::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define LSKY_CORE_ERROR(...)    ::latentsky::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define LSKY_CORE_CRITICAL(...) ::latentsky::core::Logger::get_core_logger()->critical(__VA_ARGS__)

#define LSKY_TRACE(...)         ::latentsky::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define LSKY_INFO(...)          ::latentsky::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define LSKY_WARN(...)          ::latentsky::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define LSKY_ERROR(...)         ::latentsky::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define LSKY_CRITICAL(...)      ::latentsky::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
