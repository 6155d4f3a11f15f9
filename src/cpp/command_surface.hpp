#pragma once

#include <cstddef>
#include <string>
#include "errors.hpp"

struct SizeEstimate {
    size_t raw = 0;
    size_t gzip_estimate = 0;
    size_t brotli_estimate = 0;
};

// Stateless file and JSON operations requested by the UI.
// Every function is safe to call concurrently with any other.
namespace CommandSurface {
    constexpr int DEFAULT_INDENT = 2;
    constexpr int MAX_INDENT = 16;

    // Fixed ratios, not a measurement
    constexpr double GZIP_RATIO = 0.70;
    constexpr double BROTLI_RATIO = 0.60;

    // Throws FileError
    std::string read_file(const std::string& path);

    // Truncates and overwrites. Throws FileError.
    void write_file(const std::string& path, const std::string& content);

    // Returns true or throws ParseError
    bool validate(const std::string& content);

    // Canonical pretty-print with `indent` spaces per level. Throws ParseError.
    std::string format(const std::string& content, int indent = DEFAULT_INDENT);

    // Canonical minimal serialization. Throws ParseError.
    std::string compress(const std::string& content);

    SizeEstimate estimate_size(const std::string& content);
}
