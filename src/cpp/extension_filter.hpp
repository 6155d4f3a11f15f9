#pragma once

#include <string>
#include <vector>

// Document types the editor opens from the command line and from the desktop
inline constexpr const char* SUPPORTED_EXTENSIONS[] = {
    "json", "jsonc", "json5", "geojson", "jsonl", "ndjson"
};

// True if the path's extension (case-insensitive) is a supported document type.
// Paths without an extension are unsupported.
bool is_supported_file(const std::string& path);

// Keep only supported paths, preserving order
std::vector<std::string> filter_supported(const std::vector<std::string>& paths);
