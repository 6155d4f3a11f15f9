#include "gtk_menu_binding.hpp"
#include "accelerator.hpp"
#include "debug.hpp"
#include <typeinfo>

static const char* MENU_ACTION = "menu";
static const char* DISABLED_ACTION = "disabled-item";

GtkMenuBinding::GtkMenuBinding(Gtk::Application& app, MenuRegistry& registry)
    : app_(app)
    , registry_(registry)
{
}

GtkMenuBinding::~GtkMenuBinding() {
    registry_.set_renderer(nullptr);
}

void GtkMenuBinding::install() {
    if (!registry_.is_built()) {
        throw MenuBuildError("Menu registry has not been built");
    }

    app_.add_action_with_parameter(MENU_ACTION, Glib::VARIANT_TYPE_STRING,
                                   sigc::mem_fun(*this, &GtkMenuBinding::on_menu_action));

    // Never enabled; leaves bound to it render greyed out
    auto disabled = app_.add_action(DISABLED_ACTION);
    disabled->set_enabled(false);

    Glib::RefPtr<Gio::Menu> menubar = Gio::Menu::create();
    for (const auto& top : registry_.tree()) {
        menubar->append_submenu(escape_mnemonic(top.label), build_menu(top.submenu));
    }

    if (!recent_entries_ || !recent_footer_) {
        throw MenuBuildError("Recent files region was not rendered");
    }

    register_accelerators(registry_.tree());
    app_.set_menubar(menubar);

    // Renders the current region immediately
    registry_.set_renderer(this);

    DEBUG_LOGLN << "GtkMenuBinding: menubar installed";
}

Glib::RefPtr<Gio::MenuItem> GtkMenuBinding::make_leaf(const std::string& id,
                                                      const std::string& label,
                                                      bool enabled) {
    // "app.menu::<id>" carries the identifier as the string target
    std::string action = enabled ? std::string("app.") + MENU_ACTION + "::" + id
                                 : std::string("app.") + DISABLED_ACTION;
    return Gio::MenuItem::create(escape_mnemonic(label), action);
}

// Separators become section boundaries, which is how Gio draws them
Glib::RefPtr<Gio::Menu> GtkMenuBinding::build_menu(const std::vector<MenuItem>& items) {
    auto menu = Gio::Menu::create();
    auto section = Gio::Menu::create();

    for (const auto& item : items) {
        switch (item.role) {
        case MenuRole::Separator:
            if (section->get_n_items() > 0) {
                menu->append_section(section);
                section = Gio::Menu::create();
            }
            break;

        case MenuRole::Submenu:
            section->append_submenu(escape_mnemonic(item.label), build_menu(item.submenu));
            break;

        case MenuRole::RecentFiles: {
            auto recent = Gio::Menu::create();
            recent_entries_ = Gio::Menu::create();
            recent_footer_ = Gio::Menu::create();
            recent->append_section(recent_entries_);
            recent->append_section(recent_footer_);
            section->append_submenu(escape_mnemonic(item.label), recent);
            break;
        }

        case MenuRole::Command:
        case MenuRole::Native:
            section->append_item(make_leaf(item.id, item.label, item.enabled));
            break;
        }
    }

    if (section->get_n_items() > 0) {
        menu->append_section(section);
    }
    return menu;
}

void GtkMenuBinding::register_accelerators(const std::vector<MenuItem>& items) {
    for (const auto& item : items) {
        if (item.has_submenu()) {
            register_accelerators(item.submenu);
            continue;
        }
        if (!item.accelerator) {
            continue;
        }

        auto accel = to_gtk_accelerator(*item.accelerator);
        if (!accel) {
            throw MenuBuildError("Invalid accelerator '" + *item.accelerator + "'");
        }
        app_.set_accels_for_action(std::string("app.") + MENU_ACTION + "::" + item.id, {*accel});
    }
}

void GtkMenuBinding::render_recent(const std::vector<RegionItem>& items) {
    if (!recent_entries_ || !recent_footer_) {
        return;
    }

    recent_entries_->remove_all();
    recent_footer_->remove_all();

    bool past_separator = false;
    for (const auto& item : items) {
        if (item.kind == RegionItem::Kind::Separator) {
            past_separator = true;
            continue;
        }
        auto target = past_separator ? recent_footer_ : recent_entries_;
        target->append_item(make_leaf(item.id, item.label, item.enabled));
    }
}

void GtkMenuBinding::on_menu_action(const Glib::VariantBase& parameter) {
    std::string id;
    try {
        id = Glib::VariantBase::cast_dynamic<Glib::Variant<Glib::ustring>>(parameter).get();
    } catch (const std::bad_cast&) {
        ERROR_LOG("Menu action activated without a string target");
        return;
    }

    auto role = registry_.role_of(id);
    if (role == MenuRole::Native) {
        if (native_handler_) {
            native_handler_(id);
        }
        return;
    }

    registry_.on_click(id);
}
