#include "main_window.hpp"
#include "debug.hpp"
#include "preload_script.hpp"

static const char* MESSAGE_HANDLER = "pandia";

MainWindow::MainWindow(const AppConfig& config, EventBridge& bridge, MessageRouter& router)
    : config_(config)
    , bridge_(bridge)
    , router_(router)
{
    setup_window();
    setup_webview();
    setup_controllers();

    DEBUG_LOGLN << "MainWindow: loading " << config_.ui_url;
    webkit_web_view_load_uri(view_, config_.ui_url.c_str());
}

MainWindow::~MainWindow() {
    bridge_.detach_surface();
    if (surface_) {
        surface_->release();
    }

    if (view_ && load_handler_id_ != 0) {
        g_signal_handler_disconnect(view_, load_handler_id_);
    }
    if (content_manager_) {
        if (message_handler_id_ != 0) {
            g_signal_handler_disconnect(content_manager_, message_handler_id_);
        }
        g_object_unref(content_manager_);
    }
}

void MainWindow::setup_window() {
    set_title(config_.window_title);
    set_default_size(config_.window_width, config_.window_height);
    set_show_menubar(true);
}

void MainWindow::setup_webview() {
    content_manager_ = webkit_user_content_manager_new();

    WebKitUserScript* preload = webkit_user_script_new(
        PRELOAD_SCRIPT,
        WEBKIT_USER_CONTENT_INJECT_TOP_FRAME,
        WEBKIT_USER_SCRIPT_INJECT_AT_DOCUMENT_START,
        nullptr, nullptr);
    webkit_user_content_manager_add_script(content_manager_, preload);
    webkit_user_script_unref(preload);

    message_handler_id_ = g_signal_connect(content_manager_,
                                           "script-message-received::pandia",
                                           G_CALLBACK(&MainWindow::on_script_message), this);
    webkit_user_content_manager_register_script_message_handler(content_manager_, MESSAGE_HANDLER, nullptr);

    WebKitSettings* settings = webkit_settings_new();
    webkit_settings_set_enable_developer_extras(settings, config_.devtools ? TRUE : FALSE);
    webkit_settings_set_javascript_can_access_clipboard(settings, TRUE);

    view_ = WEBKIT_WEB_VIEW(g_object_new(WEBKIT_TYPE_WEB_VIEW,
                                         "user-content-manager", content_manager_,
                                         "settings", settings,
                                         nullptr));
    g_object_unref(settings);

    load_handler_id_ = g_signal_connect(view_, "load-changed",
                                        G_CALLBACK(&MainWindow::on_load_changed), this);

    surface_ = std::make_shared<WebviewSurface>(view_);

    gtk_widget_set_hexpand(GTK_WIDGET(view_), TRUE);
    gtk_widget_set_vexpand(GTK_WIDGET(view_), TRUE);
    gtk_window_set_child(GTK_WINDOW(gobj()), GTK_WIDGET(view_));
}

void MainWindow::setup_controllers() {
    // Inspector shortcut, only when devtools are enabled
    auto key = Gtk::EventControllerKey::create();
    key->signal_key_pressed().connect(sigc::mem_fun(*this, &MainWindow::on_key_press), false);
    add_controller(key);
}

bool MainWindow::on_key_press(guint keyval, guint, Gdk::ModifierType state) {
    if (!config_.devtools) {
        return false;
    }

    bool ctrl_shift = (state & Gdk::ModifierType::CONTROL_MASK) == Gdk::ModifierType::CONTROL_MASK
                   && (state & Gdk::ModifierType::SHIFT_MASK) == Gdk::ModifierType::SHIFT_MASK;
    if (keyval == GDK_KEY_F12 || (ctrl_shift && (keyval == GDK_KEY_I || keyval == GDK_KEY_i))) {
        show_devtools();
        return true;
    }
    return false;
}

void MainWindow::show_devtools() {
    if (!config_.devtools || !view_) {
        return;
    }
    webkit_web_inspector_show(webkit_web_view_get_inspector(view_));
}

void MainWindow::run_native_command(const std::string& id) {
    if (id == "toggle_fullscreen") {
        if (is_fullscreen()) {
            unfullscreen();
        } else {
            fullscreen();
        }
        return;
    }

    if (!view_) {
        return;
    }

    if (id == "cut") {
        webkit_web_view_execute_editing_command(view_, WEBKIT_EDITING_COMMAND_CUT);
    } else if (id == "copy") {
        webkit_web_view_execute_editing_command(view_, WEBKIT_EDITING_COMMAND_COPY);
    } else if (id == "paste") {
        webkit_web_view_execute_editing_command(view_, WEBKIT_EDITING_COMMAND_PASTE);
    } else if (id == "select_all") {
        webkit_web_view_execute_editing_command(view_, WEBKIT_EDITING_COMMAND_SELECT_ALL);
    } else {
        WARN_LOG("MainWindow: no native handler for " << id);
    }
}

bool MainWindow::on_close_request() {
    // Later intents wait in the queue for the next page
    bridge_.detach_surface();
    return Gtk::ApplicationWindow::on_close_request();
}

void MainWindow::handle_message(const std::string& message) {
    std::weak_ptr<WebviewSurface> weak = surface_;
    router_.handle(message, [weak](const nlohmann::json& response) {
        if (auto surface = weak.lock()) {
            surface->reply(response);
        }
    });
}

void MainWindow::on_script_message(WebKitUserContentManager*, JSCValue* value, gpointer data) {
    auto* self = static_cast<MainWindow*>(data);
    if (!jsc_value_is_string(value)) {
        ERROR_LOG("MainWindow: ignoring non-string message from page");
        return;
    }

    char* text = jsc_value_to_string(value);
    std::string message = text ? text : "";
    g_free(text);

    self->handle_message(message);
}

// A document is live from commit until the next load starts
void MainWindow::on_load_changed(WebKitWebView*, WebKitLoadEvent event, gpointer data) {
    auto* self = static_cast<MainWindow*>(data);
    switch (event) {
    case WEBKIT_LOAD_STARTED:
        self->bridge_.detach_surface();
        break;
    case WEBKIT_LOAD_COMMITTED:
        DEBUG_LOGLN << "MainWindow: page committed, attaching surface";
        self->bridge_.attach_surface(self->surface_);
        break;
    default:
        break;
    }
}
