#pragma once

#include <optional>
#include <string>
#include <vector>

enum class MenuRole {
    Command,      // Forwarded to the UI as an opaque command token
    Native,       // Handled by the shell itself (quit, clipboard, fullscreen)
    Submenu,
    Separator,
    RecentFiles   // Where the dynamic "Open Recent" region is rendered
};

struct MenuItem {
    std::string label;
    std::string id;                            // Unique across the whole tree
    MenuRole role = MenuRole::Command;
    std::vector<MenuItem> submenu;
    std::optional<std::string> accelerator;    // e.g. "CmdOrCtrl+Shift+S"
    bool enabled = true;

    MenuItem() = default;

    // Leaf that is forwarded to the UI
    static MenuItem command(const std::string& id,
                            const std::string& label,
                            std::optional<std::string> accelerator = std::nullopt) {
        MenuItem item;
        item.id = id;
        item.label = label;
        item.accelerator = std::move(accelerator);
        return item;
    }

    // Leaf the shell handles without involving the UI
    static MenuItem native(const std::string& id,
                           const std::string& label,
                           std::optional<std::string> accelerator = std::nullopt) {
        MenuItem item = command(id, label, std::move(accelerator));
        item.role = MenuRole::Native;
        return item;
    }

    static MenuItem menu(const std::string& label, std::vector<MenuItem> children) {
        MenuItem item;
        item.label = label;
        item.role = MenuRole::Submenu;
        item.submenu = std::move(children);
        return item;
    }

    static MenuItem separator() {
        MenuItem item;
        item.role = MenuRole::Separator;
        return item;
    }

    static MenuItem recent_files(const std::string& label) {
        MenuItem item;
        item.label = label;
        item.role = MenuRole::RecentFiles;
        return item;
    }

    bool has_submenu() const {
        return role == MenuRole::Submenu;
    }

    bool is_leaf() const {
        return role == MenuRole::Command || role == MenuRole::Native;
    }
};
