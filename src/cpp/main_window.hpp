#pragma once

#include <memory>
#include <string>
#include <gtkmm.h>
#include <webkit/webkit.h>
#include "config_loader.hpp"
#include "event_bridge.hpp"
#include "message_router.hpp"
#include "webview_surface.hpp"

// Top-level window hosting the UI webview. Wires the page's message channel
// to the router and attaches the page to the event bridge while a document
// is loaded.
class MainWindow : public Gtk::ApplicationWindow {
public:
    MainWindow(const AppConfig& config, EventBridge& bridge, MessageRouter& router);
    ~MainWindow() override;

    // Menu items the shell handles itself: cut, copy, paste, select_all,
    // toggle_fullscreen. Quit is handled by the application.
    void run_native_command(const std::string& id);

    void show_devtools();

protected:
    bool on_close_request() override;

private:
    void setup_window();
    void setup_webview();
    void setup_controllers();

    void handle_message(const std::string& message);
    bool on_key_press(guint keyval, guint keycode, Gdk::ModifierType state);

    static void on_script_message(WebKitUserContentManager* manager, JSCValue* value, gpointer data);
    static void on_load_changed(WebKitWebView* view, WebKitLoadEvent event, gpointer data);

    const AppConfig& config_;
    EventBridge& bridge_;
    MessageRouter& router_;

    // view_ is owned by the window once set as its child
    WebKitUserContentManager* content_manager_ = nullptr;
    WebKitWebView* view_ = nullptr;
    gulong message_handler_id_ = 0;
    gulong load_handler_id_ = 0;

    std::shared_ptr<WebviewSurface> surface_;
};
