#include <gtest/gtest.h>

#include "config_loader.hpp"
#include "temp_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

// Config files are only accepted from the working directory or
// ~/.config/pandia, so each test runs inside its own temp directory.
class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = std::filesystem::current_path();
        std::filesystem::current_path(dir_.path());

        // Keep the developer's own ~/.config/pandia out of the way
        const char* home = std::getenv("HOME");
        had_home_ = home != nullptr;
        if (had_home_) {
            previous_home_ = home;
        }
        ::setenv("HOME", home_.path().c_str(), 1);
    }

    void TearDown() override {
        if (had_home_) {
            ::setenv("HOME", previous_home_.c_str(), 1);
        } else {
            ::unsetenv("HOME");
        }
        std::filesystem::current_path(previous_);
    }

    std::string write_config(const std::string& name, const std::string& yaml) {
        std::string path = dir_.file(name);
        std::ofstream out(path);
        out << yaml;
        return path;
    }

    TempDir dir_;
    TempDir home_;
    std::filesystem::path previous_;
    std::string previous_home_;
    bool had_home_ = false;
};

TEST_F(ConfigLoaderTest, DefaultsWithoutFile) {
    AppConfig config;
    EXPECT_EQ(config.window_title, "Pandia");
    EXPECT_EQ(config.window_width, 1280);
    EXPECT_EQ(config.window_height, 800);
    EXPECT_EQ(config.worker_threads, 2);
    EXPECT_FALSE(config.debug);
    EXPECT_FALSE(config.devtools);
    EXPECT_EQ(config.ui_url.rfind("file://", 0), 0u);
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigLoaderTest, LoadsEveryKey) {
    std::string path = write_config("config.yaml",
        "ui-url: http://localhost:1420\n"
        "window-title: JSON Lab\n"
        "window-width: 1600\n"
        "window-height: 900\n"
        "worker-threads: 4\n"
        "debug: true\n"
        "devtools: true\n");

    AppConfig config = AppConfig::from_yaml(path);
    EXPECT_EQ(config.ui_url, "http://localhost:1420");
    EXPECT_EQ(config.window_title, "JSON Lab");
    EXPECT_EQ(config.window_width, 1600);
    EXPECT_EQ(config.window_height, 900);
    EXPECT_EQ(config.worker_threads, 4);
    EXPECT_TRUE(config.debug);
    EXPECT_TRUE(config.devtools);
}

TEST_F(ConfigLoaderTest, ClampsOutOfRangeValues) {
    std::string path = write_config("config.yaml",
        "window-width: 10\n"
        "window-height: 100000\n"
        "worker-threads: 64\n");

    AppConfig config = AppConfig::from_yaml(path);
    EXPECT_EQ(config.window_width, 400);
    EXPECT_EQ(config.window_height, 4320);
    EXPECT_EQ(config.worker_threads, 16);
}

TEST_F(ConfigLoaderTest, MalformedYamlFallsBackToDefaults) {
    std::string path = write_config("config.yaml",
        "window-width: 1600\n"
        "worker-threads: [not, a, number\n");

    AppConfig config = AppConfig::from_yaml(path);
    EXPECT_EQ(config.window_width, 1280);
    EXPECT_EQ(config.worker_threads, 2);
}

TEST_F(ConfigLoaderTest, WrongValueTypeFallsBackToDefaults) {
    std::string path = write_config("config.yaml", "worker-threads: many\n");
    AppConfig config = AppConfig::from_yaml(path);
    EXPECT_EQ(config.worker_threads, 2);
}

TEST_F(ConfigLoaderTest, MissingFileKeepsDefaults) {
    AppConfig config = AppConfig::from_yaml(dir_.file("absent.yaml"));
    EXPECT_EQ(config.window_width, 1280);
}

TEST_F(ConfigLoaderTest, RejectsPathsOutsideAllowedDirectories) {
    EXPECT_FALSE(PathValidator::is_config_path_allowed("/etc/passwd"));
    EXPECT_FALSE(PathValidator::is_config_path_allowed("../../outside.yaml"));
    EXPECT_TRUE(PathValidator::is_config_path_allowed("config.yaml"));
    EXPECT_TRUE(PathValidator::is_config_path_allowed(
        PathValidator::get_home_directory() + "/.config/pandia/config.yaml"));
}

TEST_F(ConfigLoaderTest, RefusesOversizedFile) {
    std::string big = "window-width: 1600\n# " + std::string(SecurityLimits::MAX_CONFIG_FILE_SIZE, 'x') + "\n";
    std::string path = write_config("config.yaml", big);

    AppConfig config = AppConfig::from_yaml(path);
    EXPECT_EQ(config.window_width, 1280);
}

TEST_F(ConfigLoaderTest, FindsConfigInWorkingDirectory) {
    EXPECT_EQ(AppConfig::find_config_file(), "");
    write_config("config.yaml", "debug: false\n");
    EXPECT_EQ(AppConfig::find_config_file(), "config.yaml");
}

TEST_F(ConfigLoaderTest, UserConfigTakesPrecedence) {
    write_config("config.yaml", "debug: false\n");

    std::filesystem::path user_dir = home_.path() / ".config" / "pandia";
    std::filesystem::create_directories(user_dir);
    std::string user_config = (user_dir / "config.yaml").string();
    {
        std::ofstream out(user_config);
        out << "window-width: 1500\n";
    }

    EXPECT_EQ(AppConfig::find_config_file(), user_config);
    EXPECT_EQ(AppConfig::from_yaml(user_config).window_width, 1500);
}

TEST_F(ConfigLoaderTest, EmptyUiUrlIsInvalid) {
    AppConfig config;
    config.ui_url.clear();
    EXPECT_FALSE(config.validate());
}
