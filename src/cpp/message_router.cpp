#include "message_router.hpp"
#include "command_surface.hpp"
#include "debug.hpp"
#include <algorithm>
#include <cstdint>

using json = nlohmann::json;

namespace {

std::string string_arg(const json& args, const char* name) {
    return args.at(name).get<std::string>();
}

// Any JSON number, clamped before narrowing to int
int indent_arg(const json& value) {
    if (value.is_number_unsigned()) {
        return static_cast<int>(std::min<std::uint64_t>(value.get<std::uint64_t>(),
                                                        CommandSurface::MAX_INDENT));
    }
    if (value.is_number_integer()) {
        return static_cast<int>(std::clamp<std::int64_t>(value.get<std::int64_t>(),
                                                         0, CommandSurface::MAX_INDENT));
    }
    if (value.is_number_float()) {
        return static_cast<int>(std::clamp(value.get<double>(),
                                           0.0, static_cast<double>(CommandSurface::MAX_INDENT)));
    }
    // Throws json::type_error for non-numbers
    return value.get<int>();
}

std::vector<RecentFile> recent_files_arg(const json& args) {
    // camelCase first, snake_case accepted too
    const json& list = args.contains("recentFiles") ? args.at("recentFiles") : args.at("recent_files");

    std::vector<RecentFile> files;
    for (const auto& entry : list) {
        files.push_back({entry.at("path").get<std::string>(), entry.at("name").get<std::string>()});
    }
    return files;
}

} // namespace

MessageRouter::MessageRouter(EventBridge& bridge, MenuRegistry& menus, WorkerPool& workers)
    : bridge_(bridge)
    , menus_(menus)
    , workers_(workers)
{
    register_commands();
}

void MessageRouter::register_commands() {
    worker_commands_["read_file_content"] = [](const json& args) -> json {
        return CommandSurface::read_file(string_arg(args, "path"));
    };

    worker_commands_["write_file_content"] = [](const json& args) -> json {
        CommandSurface::write_file(string_arg(args, "path"), string_arg(args, "content"));
        return nullptr;
    };

    worker_commands_["validate_json"] = [](const json& args) -> json {
        return CommandSurface::validate(string_arg(args, "content"));
    };

    worker_commands_["format_json"] = [](const json& args) -> json {
        int indent = CommandSurface::DEFAULT_INDENT;
        if (args.contains("indent") && !args.at("indent").is_null()) {
            indent = indent_arg(args.at("indent"));
        }
        return CommandSurface::format(string_arg(args, "content"), indent);
    };

    worker_commands_["compress_json"] = [](const json& args) -> json {
        return CommandSurface::compress(string_arg(args, "content"));
    };

    worker_commands_["calculate_json_size"] = [](const json& args) -> json {
        SizeEstimate size = CommandSurface::estimate_size(string_arg(args, "content"));
        return {{"raw", size.raw}, {"gzip", size.gzip_estimate}, {"brotli", size.brotli_estimate}};
    };

    inline_commands_["get_pending_files"] = [this](const json&) -> json {
        return bridge_.drain_pending();
    };

    inline_commands_["update_recent_files_menu"] = [this](const json& args) -> json {
        menus_.replace_recent(recent_files_arg(args));
        return nullptr;
    };
}

bool MessageRouter::has_command(const std::string& name) const {
    return worker_commands_.count(name) > 0 || inline_commands_.count(name) > 0;
}

json MessageRouter::success(std::int64_t id, json result) {
    return {{"id", id}, {"ok", true}, {"result", std::move(result)}};
}

json MessageRouter::failure(std::int64_t id, const std::string& error) {
    return {{"id", id}, {"ok", false}, {"error", error}};
}

json MessageRouter::run(const std::string& name, const Handler& handler,
                        std::int64_t id, const json& args) {
    try {
        return success(id, handler(args));
    } catch (const FileError& e) {
        return failure(id, e.what());
    } catch (const ParseError& e) {
        return failure(id, e.what());
    } catch (const json::exception& e) {
        return failure(id, "Invalid arguments for " + name + ": " + e.what());
    } catch (const std::exception& e) {
        ERROR_LOG("Command " << name << " failed: " << e.what());
        return failure(id, e.what());
    }
}

bool MessageRouter::handle(const std::string& message, Reply reply) {
    json request;
    try {
        request = json::parse(message);
    } catch (const json::parse_error& e) {
        ERROR_LOG("MessageRouter: dropping malformed message: " << e.what());
        return false;
    }

    if (!request.is_object() || !request.contains("id") || !request.at("id").is_number_integer()) {
        ERROR_LOG("MessageRouter: dropping message without an integer id");
        return false;
    }

    std::int64_t id = request.at("id").get<std::int64_t>();

    if (!request.contains("cmd") || !request.at("cmd").is_string()) {
        reply(failure(id, "Missing command name"));
        return true;
    }
    std::string name = request.at("cmd").get<std::string>();

    json args = request.contains("args") ? request.at("args") : json::object();
    if (args.is_null()) {
        args = json::object();
    }
    if (!args.is_object()) {
        reply(failure(id, "Arguments for " + name + " must be an object"));
        return true;
    }

    DEBUG_LOGLN << "MessageRouter: #" << id << " " << name;

    auto inline_it = inline_commands_.find(name);
    if (inline_it != inline_commands_.end()) {
        reply(run(name, inline_it->second, id, args));
        return true;
    }

    auto worker_it = worker_commands_.find(name);
    if (worker_it == worker_commands_.end()) {
        reply(failure(id, "Unknown command: " + name));
        return true;
    }

    Handler handler = worker_it->second;
    bool queued = workers_.enqueue([name, handler, id, args, reply] {
        reply(run(name, handler, id, args));
    });
    if (!queued) {
        reply(failure(id, "Shell is shutting down"));
    }
    return true;
}
