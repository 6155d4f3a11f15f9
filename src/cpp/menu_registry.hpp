#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "app_context.hpp"
#include "errors.hpp"
#include "menu_item.hpp"
#include "recent_files_region.hpp"

// Native side of the "Open Recent" region (the Gio menu binding)
class MenuRenderer {
public:
    virtual ~MenuRenderer() = default;

    // Replace every rendered child of the region with `items`
    virtual void render_recent(const std::vector<RegionItem>& items) = 0;
};

// Owns the static menu tree and the Recent-Files region, and turns clicks
// into command tokens for the UI. It does not know what a command means.
class MenuRegistry {
public:
    explicit MenuRegistry(AppContext& context);

    // The application menu: Pandia, File, Edit, View, Tools, Help
    static std::vector<MenuItem> default_definition();

    // Validate and keep the tree. Throws MenuBuildError; there is no
    // degraded mode.
    const std::vector<MenuItem>& build(std::vector<MenuItem> definition);

    bool is_built() const { return built_; }
    const std::vector<MenuItem>& tree() const { return tree_; }

    // Role of a known identifier, region identifiers included
    std::optional<MenuRole> role_of(const std::string& id) const;

    // Attach the native renderer and push the current region to it.
    // Pass nullptr to detach.
    void set_renderer(MenuRenderer* renderer);

    // Clear then rebuild the region (replace, never patch)
    void replace_recent(const std::vector<RecentFile>& entries);

    std::vector<RegionItem> recent_items() const;
    std::vector<RecentFile> recent_entries() const;

    // Forward the identifier to the attached UI. Returns false when no
    // surface is attached and the click is dropped.
    bool on_click(const std::string& id);

private:
    void collect_ids(const MenuItem& item,
                     std::unordered_map<std::string, MenuRole>& ids,
                     int& region_count) const;

    AppContext& context_;
    std::vector<MenuItem> tree_;
    std::unordered_map<std::string, MenuRole> roles_;
    bool built_ = false;

    // Guards region_ and renderer_
    mutable std::mutex mutex_;
    RecentFilesRegion region_;
    MenuRenderer* renderer_ = nullptr;
};
