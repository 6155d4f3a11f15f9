#include "webview_surface.hpp"
#include "debug.hpp"
#include <glibmm/main.h>

using json = nlohmann::json;

namespace {

// Paths are not guaranteed to be UTF-8
std::string to_js(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

WebviewSurface::WebviewSurface(WebKitWebView* view)
    : view_(view)
{
}

void WebviewSurface::emit(const std::string& event, const json& payload) {
    // Queued on the page itself so nothing is lost if the bridge script
    // has not run yet; the bridge flushes the queue when it installs.
    post_script("(window.__pandiaQueue = window.__pandiaQueue || []).push(["
                + to_js(event) + ", " + to_js(payload) + "]);"
                + " if (window.__pandia) window.__pandia.__flush();");
}

void WebviewSurface::reply(const json& response) {
    post_script("if (window.__pandia) window.__pandia.__resolve(" + to_js(response) + ");");
}

void WebviewSurface::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    view_ = nullptr;
}

void WebviewSurface::post_script(std::string script) {
    std::weak_ptr<WebviewSurface> weak = weak_from_this();
    Glib::MainContext::get_default()->invoke([weak, script = std::move(script)]() -> bool {
        if (auto self = weak.lock()) {
            self->evaluate(script);
        }
        return false;
    });
}

void WebviewSurface::evaluate(const std::string& script) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!view_) {
        DEBUG_LOGLN << "WebviewSurface: view released, dropping script";
        return;
    }
    webkit_web_view_evaluate_javascript(view_, script.c_str(), -1,
                                        nullptr, nullptr, nullptr, nullptr, nullptr);
}
