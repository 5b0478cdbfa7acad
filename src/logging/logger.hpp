//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// logging/logger.hpp
//
// Process-wide spdlog logger. Every line is tagged with the component that
// wrote it ("[handler] ...") and the writing thread id.
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace sqlbridge {

struct LogOptions {
    std::string file;  // empty = console only
    std::string level = "info";
    size_t max_file_size = 100 * 1024 * 1024;  // rotate past this many bytes
    size_t max_files = 3;                      // rotated files kept
};

class Logger {
public:
    // First call wins; later calls are ignored until Shutdown(). An unknown
    // level name falls back to info with a warning.
    static void Initialize(const LogOptions& options = LogOptions());

    static void Shutdown();

    // Initializes with default options on first use
    static std::shared_ptr<spdlog::logger>& Get();

    static void Flush();

    // Level for a case-insensitive name (trace, debug, info, warn, error,
    // fatal, off and the spdlog aliases). False for an unknown name.
    static bool ParseLevel(const std::string& name, spdlog::level::level_enum& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::mutex init_mutex_;
    static std::atomic<bool> initialized_;
};

} // namespace sqlbridge

// LOG_INFO("component", "message " + std::to_string(x))

#define LOG_TRACE(component, message) \
    do { \
        if (sqlbridge::Logger::Get()->should_log(spdlog::level::trace)) \
            sqlbridge::Logger::Get()->trace("[{}] {}", component, message); \
    } while(0)

#define LOG_DEBUG(component, message) \
    do { \
        if (sqlbridge::Logger::Get()->should_log(spdlog::level::debug)) \
            sqlbridge::Logger::Get()->debug("[{}] {}", component, message); \
    } while(0)

#define LOG_INFO(component, message) \
    do { \
        if (sqlbridge::Logger::Get()->should_log(spdlog::level::info)) \
            sqlbridge::Logger::Get()->info("[{}] {}", component, message); \
    } while(0)

#define LOG_WARN(component, message) \
    do { \
        if (sqlbridge::Logger::Get()->should_log(spdlog::level::warn)) \
            sqlbridge::Logger::Get()->warn("[{}] {}", component, message); \
    } while(0)

#define LOG_ERROR(component, message) \
    do { \
        if (sqlbridge::Logger::Get()->should_log(spdlog::level::err)) \
            sqlbridge::Logger::Get()->error("[{}] {}", component, message); \
    } while(0)

#define LOG_FATAL(component, message) \
    do { \
        if (sqlbridge::Logger::Get()->should_log(spdlog::level::critical)) \
            sqlbridge::Logger::Get()->critical("[{}] {}", component, message); \
    } while(0)

// fmt-style variants: DLOG_INFO("component", "query {} closed", id)
#define DLOG_TRACE(component, fmt, ...) \
    sqlbridge::Logger::Get()->trace("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_DEBUG(component, fmt, ...) \
    sqlbridge::Logger::Get()->debug("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_INFO(component, fmt, ...) \
    sqlbridge::Logger::Get()->info("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_WARN(component, fmt, ...) \
    sqlbridge::Logger::Get()->warn("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_ERROR(component, fmt, ...) \
    sqlbridge::Logger::Get()->error("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_FATAL(component, fmt, ...) \
    sqlbridge::Logger::Get()->critical("[{}] " fmt, component, ##__VA_ARGS__)
