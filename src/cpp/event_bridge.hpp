#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "app_context.hpp"

// Decides, for every discovered file-open intent, whether it goes to the
// attached UI right away or waits in the pending queue until the UI drains it.
class EventBridge {
public:
    explicit EventBridge(AppContext& context);

    // Startup: argv minus the executable path and anything flag-like.
    // No surface can exist yet, so these are always queued.
    void seed_from_args(const std::vector<std::string>& args);
    void seed_from_args(int argc, char** argv);

    // OS "open these" notification, may arrive any number of times.
    // Returns the number of intents that survived filtering.
    size_t on_opened(const std::vector<std::string>& uris);

    // Called once by the UI during its own initialization
    std::vector<std::string> drain_pending();

    void attach_surface(std::shared_ptr<UiSurface> surface);
    void detach_surface();
    bool has_surface() const;

    // file:// URI -> local path. Other schemes, remote hosts and
    // malformed URIs yield nothing.
    static std::optional<std::string> resolve_file_uri(const std::string& uri);

private:
    AppContext& context_;
};
