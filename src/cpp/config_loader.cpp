#include "config_loader.hpp"
#include "debug.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

// PathValidator implementation
std::string PathValidator::get_home_directory() {
    const char* home = std::getenv("HOME");
    return home ? home : "/";
}

std::string PathValidator::normalize_path(const std::string& path) {
    std::error_code ec;
    std::filesystem::path canonical = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return path;
    }
    return canonical.string();
}

bool PathValidator::is_in_directory(const std::string& path, const std::string& directory) {
    std::string path_str = normalize_path(path);
    std::string dir_str = normalize_path(directory);

    // Ensure directory ends with separator for proper matching
    if (!dir_str.empty() && dir_str.back() != '/') {
        dir_str += '/';
    }

    return path_str.rfind(dir_str, 0) == 0;
}

bool PathValidator::is_config_path_allowed(const std::string& filepath) {
    std::string normalized = normalize_path(filepath);

    // Allow paths in ~/.config/pandia/
    std::string config_dir = get_home_directory() + "/.config/pandia";
    if (is_in_directory(normalized, config_dir)) {
        return true;
    }

    // Allow paths relative to current working directory (./)
    std::error_code ec;
    std::string cwd = std::filesystem::current_path(ec).string();
    if (!ec && is_in_directory(normalized, cwd)) {
        return true;
    }

    ERROR_LOG("Config file path not allowed: " << filepath
              << " (config files must be in ~/.config/pandia/ or the current directory)");
    return false;
}

std::string AppConfig::find_config_file() {
    std::string primary_config = PathValidator::get_home_directory() + "/.config/pandia/config.yaml";
    std::ifstream f(primary_config);
    if (f.good()) {
        return primary_config;
    }

    std::ifstream f2("config.yaml");
    if (f2.good()) {
        return "config.yaml";
    }

    return "";
}

AppConfig AppConfig::from_yaml(const std::string& filepath) {
    AppConfig config;

    if (!PathValidator::is_config_path_allowed(filepath)) {
        ERROR_LOG("Refusing to load config from disallowed path, using defaults");
        return config;
    }

    // Check file size before parsing
    std::error_code ec;
    std::filesystem::path file_path(filepath);
    if (!std::filesystem::exists(file_path, ec)) {
        ERROR_LOG("Config file does not exist: " << filepath);
        return config;
    }
    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        ERROR_LOG("Error accessing config file: " << ec.message());
        return config;
    }
    if (file_size > SecurityLimits::MAX_CONFIG_FILE_SIZE) {
        ERROR_LOG("Config file too large (" << file_size << " bytes, maximum "
                  << SecurityLimits::MAX_CONFIG_FILE_SIZE << ")");
        return config;
    }

    try {
        YAML::Node yaml_config = YAML::LoadFile(filepath);

        if (yaml_config["ui-url"]) {
            config.ui_url = yaml_config["ui-url"].as<std::string>();
        }

        if (yaml_config["window-title"]) {
            config.window_title = yaml_config["window-title"].as<std::string>();
        }

        // Window geometry with bounds checking
        if (yaml_config["window-width"]) {
            config.window_width = std::clamp(yaml_config["window-width"].as<int>(), 400, 7680);
        }
        if (yaml_config["window-height"]) {
            config.window_height = std::clamp(yaml_config["window-height"].as<int>(), 300, 4320);
        }

        if (yaml_config["worker-threads"]) {
            config.worker_threads = std::clamp(yaml_config["worker-threads"].as<int>(), 1, 16);
        }

        if (yaml_config["debug"]) {
            config.debug = yaml_config["debug"].as<bool>();
        }
        if (yaml_config["devtools"]) {
            config.devtools = yaml_config["devtools"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        ERROR_LOG("Error loading YAML: " << e.what());
        return AppConfig();
    }

    return config;
}

bool AppConfig::validate() const {
    if (ui_url.empty()) {
        ERROR_LOG("Invalid configuration: ui-url is empty");
        return false;
    }

    if (worker_threads < 1) {
        ERROR_LOG("Invalid worker thread count: " << worker_threads);
        return false;
    }

    return true;
}
