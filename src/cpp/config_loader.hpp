#pragma once

#include <string>

// Security limits for YAML parsing
namespace SecurityLimits {
    constexpr size_t MAX_CONFIG_FILE_SIZE = 1024 * 1024;  // 1MB
}

#ifndef PANDIA_UI_DIR
#define PANDIA_UI_DIR "/usr/share/pandia/ui"
#endif

// Path validation utilities
class PathValidator {
public:
    // Allowed paths: ~/.config/pandia/ and ./ (relative to cwd)
    static bool is_config_path_allowed(const std::string& filepath);

    // Normalize a path (resolve . and ..)
    static std::string normalize_path(const std::string& path);

    static std::string get_home_directory();

private:
    static bool is_in_directory(const std::string& path, const std::string& directory);
};

class AppConfig {
public:
    // Page loaded into the webview
    std::string ui_url = std::string("file://") + PANDIA_UI_DIR + "/index.html";

    // Main window
    std::string window_title = "Pandia";
    int window_width = 1280;
    int window_height = 800;

    // Threads serving file and JSON requests
    int worker_threads = 2;

    bool debug = false;
    bool devtools = false;

    // Load from YAML file. Problems are logged and defaults kept.
    static AppConfig from_yaml(const std::string& filepath);

    // ~/.config/pandia/config.yaml, then ./config.yaml. Empty if neither exists.
    static std::string find_config_file();

    bool validate() const;
};
