#include <gtest/gtest.h>

#include "extension_filter.hpp"

#include <string>
#include <vector>

TEST(ExtensionFilter, AcceptsEveryJsonFamilyExtension) {
    for (const char* ext : SUPPORTED_EXTENSIONS) {
        EXPECT_TRUE(is_supported_file(std::string("/tmp/doc.") + ext)) << ext;
    }
}

TEST(ExtensionFilter, CaseInsensitive) {
    EXPECT_TRUE(is_supported_file("Config.JSON"));
    EXPECT_TRUE(is_supported_file("notes.Json5"));
    EXPECT_TRUE(is_supported_file("/data/world.GeoJson"));
}

TEST(ExtensionFilter, RejectsOtherExtensions) {
    EXPECT_FALSE(is_supported_file("image.png"));
    EXPECT_FALSE(is_supported_file("readme.txt"));
    EXPECT_FALSE(is_supported_file("archive.json.gz"));
    EXPECT_FALSE(is_supported_file("data.jsonx"));
    EXPECT_FALSE(is_supported_file("b.txt"));
}

TEST(ExtensionFilter, RejectsPathsWithoutExtension) {
    EXPECT_FALSE(is_supported_file(""));
    EXPECT_FALSE(is_supported_file("Makefile"));
    EXPECT_FALSE(is_supported_file("trailing."));
    EXPECT_FALSE(is_supported_file("/home/user/json"));
    EXPECT_FALSE(is_supported_file(".json"));
}

TEST(ExtensionFilter, ExtensionOfFileNotDirectory) {
    EXPECT_FALSE(is_supported_file("/projects/app.json/notes"));
    EXPECT_TRUE(is_supported_file("/projects/v1.2/settings.jsonc"));
}

TEST(ExtensionFilter, FilterKeepsOrder) {
    std::vector<std::string> input = {"b.json", "skip.png", "a.ndjson", "c.jsonl", "noext"};
    std::vector<std::string> expected = {"b.json", "a.ndjson", "c.jsonl"};
    EXPECT_EQ(filter_supported(input), expected);
}

TEST(ExtensionFilter, FilterEmpty) {
    EXPECT_TRUE(filter_supported({}).empty());
}
