#pragma once

#include <string>
#include <vector>

// Entry as supplied by the UI, which owns the actual recency list
struct RecentFile {
    std::string path;
    std::string name;
};

struct RegionItem {
    enum class Kind { Placeholder, Entry, Separator, Clear };

    Kind kind;
    std::string id;      // Empty for the separator
    std::string label;
    bool enabled = true;
};

// The mutable "Open Recent" part of the menu. Always one of two shapes:
//   placeholder-shape: [no_recent (disabled)] [separator] [clear_recent_files]
//   entries-shape:     [recent_file_0 .. recent_file_N-1] [separator] [clear_recent_files]
class RecentFilesRegion {
public:
    static constexpr size_t CAPACITY = 10;
    static constexpr const char* PLACEHOLDER_ID = "no_recent";
    static constexpr const char* PLACEHOLDER_LABEL = "No Recent Files";
    static constexpr const char* CLEAR_ID = "clear_recent_files";
    static constexpr const char* CLEAR_LABEL = "Clear Recent Files";
    static constexpr const char* ENTRY_ID_PREFIX = "recent_file_";

    RecentFilesRegion();

    // Clear, then rebuild from the first CAPACITY entries
    void replace(const std::vector<RecentFile>& entries);

    const std::vector<RegionItem>& items() const { return items_; }
    const std::vector<RecentFile>& entries() const { return entries_; }
    bool is_placeholder() const { return entries_.empty(); }

    static std::string entry_id(size_t index);

    // Every identifier this region can ever render
    static std::vector<std::string> reserved_ids();

private:
    std::vector<RecentFile> entries_;
    std::vector<RegionItem> items_;
};
