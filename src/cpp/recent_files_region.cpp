#include "recent_files_region.hpp"
#include <algorithm>
#include <cstddef>

RecentFilesRegion::RecentFilesRegion() {
    replace({});
}

std::string RecentFilesRegion::entry_id(size_t index) {
    return ENTRY_ID_PREFIX + std::to_string(index);
}

std::vector<std::string> RecentFilesRegion::reserved_ids() {
    std::vector<std::string> ids = {PLACEHOLDER_ID, CLEAR_ID};
    for (size_t i = 0; i < CAPACITY; ++i) {
        ids.push_back(entry_id(i));
    }
    return ids;
}

void RecentFilesRegion::replace(const std::vector<RecentFile>& entries) {
    entries_.clear();
    items_.clear();

    size_t count = std::min(entries.size(), CAPACITY);
    entries_.assign(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(count));

    if (entries_.empty()) {
        items_.push_back({RegionItem::Kind::Placeholder, PLACEHOLDER_ID, PLACEHOLDER_LABEL, false});
    } else {
        for (size_t i = 0; i < entries_.size(); ++i) {
            items_.push_back({RegionItem::Kind::Entry, entry_id(i), entries_[i].name, true});
        }
    }

    items_.push_back({RegionItem::Kind::Separator, "", "", true});
    items_.push_back({RegionItem::Kind::Clear, CLEAR_ID, CLEAR_LABEL, true});
}
