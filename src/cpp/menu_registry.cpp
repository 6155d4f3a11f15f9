#include "menu_registry.hpp"
#include "accelerator.hpp"
#include "debug.hpp"

MenuRegistry::MenuRegistry(AppContext& context)
    : context_(context)
{
}

std::vector<MenuItem> MenuRegistry::default_definition() {
    return {
        MenuItem::menu("Pandia", {
            MenuItem::command("about", "About Pandia"),
            MenuItem::command("check_for_updates", "Check for Updates..."),
            MenuItem::separator(),
            MenuItem::native("quit", "Quit Pandia", "CmdOrCtrl+Q"),
        }),
        MenuItem::menu("File", {
            MenuItem::command("new_file", "New File", "CmdOrCtrl+N"),
            MenuItem::command("open_file", "Open File...", "CmdOrCtrl+O"),
            MenuItem::recent_files("Open Recent"),
            MenuItem::separator(),
            MenuItem::command("save_file", "Save", "CmdOrCtrl+S"),
            MenuItem::command("save_as", "Save As...", "CmdOrCtrl+Shift+S"),
            MenuItem::separator(),
            MenuItem::command("close_tab", "Close Tab", "CmdOrCtrl+W"),
        }),
        MenuItem::menu("Edit", {
            MenuItem::command("undo", "Undo", "CmdOrCtrl+Z"),
            MenuItem::command("redo", "Redo", "CmdOrCtrl+Shift+Z"),
            MenuItem::separator(),
            MenuItem::native("cut", "Cut"),
            MenuItem::native("copy", "Copy"),
            MenuItem::native("paste", "Paste"),
            MenuItem::native("select_all", "Select All"),
            MenuItem::separator(),
            MenuItem::command("find", "Find...", "CmdOrCtrl+F"),
            MenuItem::command("find_replace", "Find and Replace...", "CmdOrCtrl+H"),
            MenuItem::separator(),
            MenuItem::command("format_document", "Format Document", "CmdOrCtrl+Shift+F"),
        }),
        MenuItem::menu("View", {
            MenuItem::command("toggle_sidebar", "Toggle Sidebar", "CmdOrCtrl+B"),
            MenuItem::separator(),
            MenuItem::command("toggle_tree_view", "Tree View", "CmdOrCtrl+1"),
            MenuItem::command("toggle_code_view", "Code View", "CmdOrCtrl+2"),
            MenuItem::command("toggle_form_view", "Grid View", "CmdOrCtrl+3"),
            MenuItem::separator(),
            MenuItem::native("toggle_fullscreen", "Toggle Fullscreen", "F11"),
        }),
        MenuItem::menu("Tools", {
            MenuItem::command("validate_json", "Validate JSON", "CmdOrCtrl+Shift+V"),
            MenuItem::command("repair_json", "Repair JSON"),
            MenuItem::separator(),
            MenuItem::command("compare_files", "Compare Files"),
            MenuItem::command("graph_visualizer", "Graph Visualizer"),
        }),
        MenuItem::menu("Help", {
            MenuItem::command("keyboard_shortcuts", "Keyboard Shortcuts", "CmdOrCtrl+/"),
            MenuItem::command("view_modes_help", "View Modes"),
            MenuItem::separator(),
            MenuItem::command("documentation", "Documentation"),
        }),
    };
}

void MenuRegistry::collect_ids(const MenuItem& item,
                               std::unordered_map<std::string, MenuRole>& ids,
                               int& region_count) const {
    switch (item.role) {
    case MenuRole::Separator:
        return;

    case MenuRole::Submenu:
        if (item.label.empty()) {
            throw MenuBuildError("Submenu without a label");
        }
        if (item.submenu.empty()) {
            throw MenuBuildError("Submenu '" + item.label + "' has no items");
        }
        for (const auto& child : item.submenu) {
            collect_ids(child, ids, region_count);
        }
        return;

    case MenuRole::RecentFiles:
        if (item.label.empty()) {
            throw MenuBuildError("Recent files region without a label");
        }
        region_count++;
        for (const auto& id : RecentFilesRegion::reserved_ids()) {
            if (!ids.emplace(id, MenuRole::Command).second) {
                throw MenuBuildError("Duplicate menu identifier '" + id + "'");
            }
        }
        return;

    case MenuRole::Command:
    case MenuRole::Native:
        if (item.label.empty()) {
            throw MenuBuildError("Menu item '" + item.id + "' has no label");
        }
        if (item.id.empty()) {
            throw MenuBuildError("Menu item '" + item.label + "' has no identifier");
        }
        if (item.accelerator && !to_gtk_accelerator(*item.accelerator)) {
            throw MenuBuildError("Invalid accelerator '" + *item.accelerator +
                                 "' for menu item '" + item.id + "'");
        }
        if (!ids.emplace(item.id, item.role).second) {
            throw MenuBuildError("Duplicate menu identifier '" + item.id + "'");
        }
        return;
    }
}

const std::vector<MenuItem>& MenuRegistry::build(std::vector<MenuItem> definition) {
    if (definition.empty()) {
        throw MenuBuildError("Menu definition is empty");
    }

    std::unordered_map<std::string, MenuRole> ids;
    int region_count = 0;
    for (const auto& item : definition) {
        if (!item.has_submenu()) {
            throw MenuBuildError("Top-level menu entries must be submenus");
        }
        collect_ids(item, ids, region_count);
    }

    if (region_count != 1) {
        throw MenuBuildError("Menu must contain exactly one recent files region, found " +
                             std::to_string(region_count));
    }

    tree_ = std::move(definition);
    roles_ = std::move(ids);
    built_ = true;

    DEBUG_LOGLN << "MenuRegistry: built " << tree_.size() << " menus, "
                << roles_.size() << " identifiers";
    return tree_;
}

std::optional<MenuRole> MenuRegistry::role_of(const std::string& id) const {
    auto it = roles_.find(id);
    if (it == roles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MenuRegistry::set_renderer(MenuRenderer* renderer) {
    std::lock_guard<std::mutex> lock(mutex_);
    renderer_ = renderer;
    if (renderer_) {
        renderer_->render_recent(region_.items());
    }
}

void MenuRegistry::replace_recent(const std::vector<RecentFile>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    region_.replace(entries);
    if (renderer_) {
        renderer_->render_recent(region_.items());
    }

    if (entries.size() > RecentFilesRegion::CAPACITY) {
        DEBUG_LOGLN << "MenuRegistry: kept " << RecentFilesRegion::CAPACITY
                    << " of " << entries.size() << " recent files";
    }
}

std::vector<RegionItem> MenuRegistry::recent_items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return region_.items();
}

std::vector<RecentFile> MenuRegistry::recent_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return region_.entries();
}

bool MenuRegistry::on_click(const std::string& id) {
    auto surface = context_.surface.current();
    if (!surface) {
        DEBUG_LOGLN << "MenuRegistry: no UI attached, dropping '" << id << "'";
        return false;
    }

    DEBUG_LOGLN << "MenuRegistry: menu-event '" << id << "'";
    surface->emit(EVENT_MENU, id);
    return true;
}
