//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// logging/logger.cpp
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace sqlbridge {

namespace {

constexpr const char* LOGGER_NAME = "sqlbridge";

// Same layout on both sinks, only the console colors the level
constexpr const char* CONSOLE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v";

struct LevelName {
    const char* name;
    spdlog::level::level_enum level;
};

constexpr LevelName LEVEL_NAMES[] = {
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"err", spdlog::level::err},
    {"fatal", spdlog::level::critical},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
};

std::vector<spdlog::sink_ptr> MakeSinks(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(std::move(console));

    if (!options.file.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file, options.max_file_size, options.max_files);
        file->set_pattern(FILE_PATTERN);
        sinks.push_back(std::move(file));
    }
    return sinks;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> Logger::logger_;
std::mutex Logger::init_mutex_;
std::atomic<bool> Logger::initialized_{false};

bool Logger::ParseLevel(const std::string& name, spdlog::level::level_enum& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : LEVEL_NAMES) {
        if (lower == entry.name) {
            level = entry.level;
            return true;
        }
    }
    return false;
}

void Logger::Initialize(const LogOptions& options) {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_) {
        return;
    }

    auto level = spdlog::level::info;
    bool known_level = ParseLevel(options.level, level);

    auto sinks = MakeSinks(options);
    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger_->set_level(level);
    logger_->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger_);
    initialized_ = true;

    if (!known_level) {
        logger_->warn("[logger] Unknown log level '{}', using info", options.level);
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (logger_) {
        logger_->flush();
    }
    spdlog::shutdown();
    logger_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!initialized_) {
        Initialize();
    }
    return logger_;
}

void Logger::Flush() {
    if (logger_) {
        logger_->flush();
    }
}

} // namespace sqlbridge
