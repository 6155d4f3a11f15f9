#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <webkit/webkit.h>
#include "ui_surface.hpp"

// The loaded page, seen from the shell. emit() and reply() may be called
// from any thread; the script is always evaluated on the GLib main loop.
class WebviewSurface : public UiSurface, public std::enable_shared_from_this<WebviewSurface> {
public:
    explicit WebviewSurface(WebKitWebView* view);

    void emit(const std::string& event, const nlohmann::json& payload) override;

    // Deliver a router response to the pending invoke() promise
    void reply(const nlohmann::json& response);

    // The view is going away; later posts are dropped
    void release();

private:
    void post_script(std::string script);
    void evaluate(const std::string& script);

    std::mutex mutex_;
    WebKitWebView* view_;
};
