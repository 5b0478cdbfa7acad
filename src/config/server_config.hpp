//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// config/server_config.hpp
//
// Server configuration
//===----------------------------------------------------------------------===//

#pragma once

#include "config/config_source.hpp"
#include "config/handler_config.hpp"
#include "logging/logger.hpp"
#include <string>
#include <iostream>
#include <cstdlib>
#include <algorithm>

namespace sqlbridge {

struct ServerConfig {
    // Database
    std::string database_path = ":memory:";

    // Logging
    std::string log_file;
    std::string log_level = "info";
    int64_t log_max_file_size_mb = 100;
    int32_t log_max_files = 3;

    // Process
    std::string config_file;

    // Handler (session) settings
    bool distributed_joins = false;
    bool enforce_join_order = false;
    bool collocated = false;
    bool replicated_only = false;
    bool lazy = false;
    bool auto_close_cursors = false;
    int64_t max_open_cursors = DEFAULT_MAX_OPEN_CURSORS;

    // Console
    int32_t page_size = DEFAULT_PAGE_SIZE;

    bool Validate(std::string& error) const {
        if (max_open_cursors < 0) {
            error = "Max open cursors must not be negative";
            return false;
        }
        if (max_open_cursors > static_cast<int64_t>(UINT32_MAX)) {
            error = "Max open cursors is too large";
            return false;
        }
        if (log_max_file_size_mb <= 0) {
            error = "Log file size must be greater than 0";
            return false;
        }
        if (log_max_files <= 0) {
            error = "Log file count must be greater than 0";
            return false;
        }
        if (page_size <= 0) {
            error = "Page size must be greater than 0";
            return false;
        }
        return true;
    }

    HandlerConfig ToHandlerConfig() const {
        HandlerConfig handler;
        handler.distributed_joins = distributed_joins;
        handler.enforce_join_order = enforce_join_order;
        handler.collocated = collocated;
        handler.replicated_only = replicated_only;
        handler.lazy = lazy;
        handler.auto_close_cursors = auto_close_cursors;
        handler.max_open_cursors = static_cast<uint32_t>(max_open_cursors);
        return handler;
    }

    LogOptions ToLogOptions() const {
        LogOptions options;
        options.file = log_file;
        options.level = log_level;
        options.max_file_size = static_cast<size_t>(log_max_file_size_mb) * 1024 * 1024;
        options.max_files = static_cast<size_t>(log_max_files);
        return options;
    }

    // Load from config file (auto-detects format by extension)
    bool LoadFromFile(const std::string& path, std::string& error) {
        std::string ext;
        auto dot_pos = path.rfind('.');
        if (dot_pos != std::string::npos) {
            ext = path.substr(dot_pos);
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        }

        if (ext == ".yaml" || ext == ".yml") {
            return LoadFromYaml(path, error);
        }
        return LoadFromIni(path, error);
    }

    // INI files use [section] headers with the same names as the YAML maps
    bool LoadFromIni(const std::string& path, std::string& error) {
        ConfigSource cfg;
        if (!cfg.LoadIni(path)) {
            error = cfg.GetError();
            return false;
        }
        return Apply(cfg, path, error);
    }

    bool LoadFromYaml(const std::string& path, std::string& error) {
        ConfigSource cfg;
        if (!cfg.LoadYaml(path)) {
            error = cfg.GetError();
            return false;
        }
        return Apply(cfg, path, error);
    }

private:
    // All or nothing: a value that does not parse leaves the config unchanged
    bool Apply(ConfigSource& cfg, const std::string& path, std::string& error) {
        ServerConfig loaded = *this;
        bool ok =
            cfg.ReadString("database.path", loaded.database_path) &&
            cfg.ReadString("logging.file", loaded.log_file) &&
            cfg.ReadString("logging.level", loaded.log_level) &&
            cfg.ReadInt64("logging.max_file_size_mb", loaded.log_max_file_size_mb) &&
            cfg.ReadInt32("logging.max_files", loaded.log_max_files) &&
            cfg.ReadBool("handler.distributed_joins", loaded.distributed_joins) &&
            cfg.ReadBool("handler.enforce_join_order", loaded.enforce_join_order) &&
            cfg.ReadBool("handler.collocated", loaded.collocated) &&
            cfg.ReadBool("handler.replicated_only", loaded.replicated_only) &&
            cfg.ReadBool("handler.lazy", loaded.lazy) &&
            cfg.ReadBool("handler.auto_close_cursors", loaded.auto_close_cursors) &&
            cfg.ReadInt64("handler.max_open_cursors", loaded.max_open_cursors) &&
            cfg.ReadInt32("console.page_size", loaded.page_size);
        if (!ok) {
            error = cfg.GetError();
            return false;
        }

        loaded.config_file = path;
        *this = std::move(loaded);
        return true;
    }
};

inline void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>         Config file path (.ini/.conf or .yaml)\n"
              << "  -d, --database <path>       Database path (default: :memory:)\n"
              << "  --log-file <path>           Log file path\n"
              << "  --log-level <level>         Log level (trace, debug, info, warn, error)\n"
              << "  --max-open-cursors <n>      Max open cursors, 0 = unlimited (default: 128)\n"
              << "  --page-size <n>             Rows per fetched page (default: 1024)\n"
              << "  --lazy                      Stream results instead of materializing\n"
              << "  --auto-close-cursors        Close cursors after their last page\n"
              << "  --enforce-join-order        Keep joins in the written order\n"
              << "  --version                   Show version info\n"
              << "  --help                      Show this help\n";
}

inline ServerConfig ParseCommandLine(int argc, char* argv[], bool& show_version) {
    ServerConfig config;
    show_version = false;
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        std::string error;
        if (!config.LoadFromFile(config_file_path, error)) {
            std::cerr << "Error loading config file: " << error << std::endl;
            std::exit(1);
        }
    }

    // Second pass: command line overrides config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;  // Already processed
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            config.database_path = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--max-open-cursors" && i + 1 < argc) {
            config.max_open_cursors = std::stoll(argv[++i]);
        } else if (arg == "--page-size" && i + 1 < argc) {
            config.page_size = static_cast<int32_t>(std::stoi(argv[++i]));
        } else if (arg == "--lazy") {
            config.lazy = true;
        } else if (arg == "--auto-close-cursors") {
            config.auto_close_cursors = true;
        } else if (arg == "--enforce-join-order") {
            config.enforce_join_order = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            PrintUsage(argv[0]);
            std::exit(1);
        }
    }

    return config;
}

} // namespace sqlbridge
