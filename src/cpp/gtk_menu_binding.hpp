#pragma once

#include <functional>
#include <string>
#include <vector>
#include <gtkmm.h>
#include "menu_registry.hpp"

// Renders the registry's menu tree as the application's Gio menubar.
// Every leaf activates the single "app.menu" action with its identifier as
// the string target; native items go to the native handler, everything else
// to MenuRegistry::on_click().
class GtkMenuBinding : public MenuRenderer {
public:
    using NativeHandler = std::function<void(const std::string& id)>;

    GtkMenuBinding(Gtk::Application& app, MenuRegistry& registry);
    ~GtkMenuBinding() override;

    GtkMenuBinding(const GtkMenuBinding&) = delete;
    GtkMenuBinding& operator=(const GtkMenuBinding&) = delete;

    // Install actions, accelerators and the menubar. Throws MenuBuildError.
    void install();

    void set_native_handler(NativeHandler handler) { native_handler_ = std::move(handler); }

    void render_recent(const std::vector<RegionItem>& items) override;

private:
    Glib::RefPtr<Gio::Menu> build_menu(const std::vector<MenuItem>& items);
    Glib::RefPtr<Gio::MenuItem> make_leaf(const std::string& id, const std::string& label, bool enabled);
    void register_accelerators(const std::vector<MenuItem>& items);
    void on_menu_action(const Glib::VariantBase& parameter);

    Gtk::Application& app_;
    MenuRegistry& registry_;
    NativeHandler native_handler_;

    // The "Open Recent" submenu is two sections: entries (or placeholder), then clear
    Glib::RefPtr<Gio::Menu> recent_entries_;
    Glib::RefPtr<Gio::Menu> recent_footer_;
};
