#include "extension_filter.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

bool is_supported_file(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext.size() < 2) {
        return false;  // No extension, or a bare trailing dot
    }

    // Drop the leading '.'
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const char* supported : SUPPORTED_EXTENSIONS) {
        if (ext == supported) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> filter_supported(const std::vector<std::string>& paths) {
    std::vector<std::string> result;
    for (const auto& path : paths) {
        if (is_supported_file(path)) {
            result.push_back(path);
        }
    }
    return result;
}
