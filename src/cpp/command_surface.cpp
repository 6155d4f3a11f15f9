#include "command_surface.hpp"
#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string system_message(int err) {
    if (err == 0) {
        return "Input/output error";
    }
    return std::error_code(err, std::generic_category()).message();
}

json parse_or_throw(const std::string& content) {
    try {
        return json::parse(content);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("Invalid JSON: ") + e.what());
    }
}

// Serialization only fails on strings that are not valid UTF-8
std::string dump_or_throw(const json& value, int indent, const char* what) {
    try {
        return value.dump(indent);
    } catch (const json::type_error& e) {
        throw ParseError(std::string("Failed to ") + what + " JSON: " + e.what());
    }
}

} // namespace

namespace CommandSurface {

std::string read_file(const std::string& path) {
    // Directories open fine on Linux and only fail on read
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw FileError("Failed to read file: " + system_message(EISDIR));
    }

    errno = 0;
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw FileError("Failed to read file: " + system_message(errno));
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw FileError("Failed to read file: " + system_message(errno));
    }
    return buffer.str();
}

void write_file(const std::string& path, const std::string& content) {
    errno = 0;
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw FileError("Failed to write file: " + system_message(errno));
    }

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        throw FileError("Failed to write file: " + system_message(errno));
    }
}

bool validate(const std::string& content) {
    parse_or_throw(content);
    return true;
}

std::string format(const std::string& content, int indent) {
    json value = parse_or_throw(content);
    return dump_or_throw(value, std::clamp(indent, 0, MAX_INDENT), "format");
}

std::string compress(const std::string& content) {
    json value = parse_or_throw(content);
    return dump_or_throw(value, -1, "compress");
}

SizeEstimate estimate_size(const std::string& content) {
    SizeEstimate estimate;
    estimate.raw = content.size();
    estimate.gzip_estimate = static_cast<size_t>(static_cast<double>(estimate.raw) * GZIP_RATIO);
    estimate.brotli_estimate = static_cast<size_t>(static_cast<double>(estimate.raw) * BROTLI_RATIO);
    return estimate;
}

} // namespace CommandSurface
