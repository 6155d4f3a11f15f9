#include "event_bridge.hpp"
#include "extension_filter.hpp"
#include "debug.hpp"
#include <glibmm/convert.h>
#include <glib.h>

EventBridge::EventBridge(AppContext& context)
    : context_(context)
{
}

void EventBridge::seed_from_args(const std::vector<std::string>& args) {
    std::vector<std::string> paths;

    // Skip args[0], the executable path
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.empty() || arg[0] == '-') {
            continue;
        }
        if (is_supported_file(arg)) {
            paths.push_back(arg);
        } else {
            DEBUG_LOGLN << "EventBridge: ignoring unsupported argument '" << arg << "'";
        }
    }

    context_.pending.enqueue(paths);
}

void EventBridge::seed_from_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 0; i < argc; ++i) {
        args.emplace_back(argv[i] ? argv[i] : "");
    }
    seed_from_args(args);
}

std::optional<std::string> EventBridge::resolve_file_uri(const std::string& uri) {
    gchar* scheme = g_uri_parse_scheme(uri.c_str());
    bool is_file = scheme && g_ascii_strcasecmp(scheme, "file") == 0;
    g_free(scheme);
    if (!is_file) {
        return std::nullopt;
    }

    try {
        Glib::ustring hostname;
        std::string path = Glib::filename_from_uri(uri, hostname);
        if (!hostname.empty() && hostname != "localhost") {
            DEBUG_LOGLN << "EventBridge: dropping remote file URI " << uri;
            return std::nullopt;
        }
        return path;
    } catch (const Glib::ConvertError& e) {
        DEBUG_LOGLN << "EventBridge: could not resolve '" << uri << "': " << e.what();
        return std::nullopt;
    }
}

size_t EventBridge::on_opened(const std::vector<std::string>& uris) {
    std::vector<std::string> paths;
    for (const auto& uri : uris) {
        auto path = resolve_file_uri(uri);
        if (path && is_supported_file(*path)) {
            paths.push_back(*path);
        }
    }

    if (paths.empty()) {
        return 0;
    }

    // Queue under the slot lock so an attach + drain cannot slip in between
    auto surface = context_.surface.current_or([&] {
        context_.pending.enqueue(paths);
    });

    if (surface) {
        DEBUG_LOGLN << "EventBridge: forwarding " << paths.size() << " path(s) live";
        surface->emit(EVENT_FILE_OPEN, paths);
    }
    return paths.size();
}

std::vector<std::string> EventBridge::drain_pending() {
    std::vector<std::string> drained = context_.pending.drain_all();
    DEBUG_LOGLN << "EventBridge: UI drained " << drained.size() << " pending path(s)";
    return drained;
}

void EventBridge::attach_surface(std::shared_ptr<UiSurface> surface) {
    context_.surface.attach(std::move(surface));
}

void EventBridge::detach_surface() {
    context_.surface.detach();
}

bool EventBridge::has_surface() const {
    return context_.surface.current() != nullptr;
}
