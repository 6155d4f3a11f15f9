#include <gtest/gtest.h>

#include "fake_surface.hpp"
#include "command_surface.hpp"
#include "message_router.hpp"
#include "temp_dir.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <string>

using json = nlohmann::json;

class MessageRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        menus_.build(MenuRegistry::default_definition());
    }

    // Send one request and wait for its single reply
    json call(const json& request) {
        auto promise = std::make_shared<std::promise<json>>();
        std::future<json> future = promise->get_future();
        bool accepted = router_.handle(request.dump(), [promise](const json& response) {
            promise->set_value(response);
        });
        EXPECT_TRUE(accepted);
        if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            ADD_FAILURE() << "no reply for " << request.dump();
            return json();
        }
        return future.get();
    }

    AppContext context_;
    EventBridge bridge_{context_};
    MenuRegistry menus_{context_};
    WorkerPool workers_{2};
    MessageRouter router_{bridge_, menus_, workers_};
};

// ─── Files ──────────────────────────────────────────────────────────────────

TEST_F(MessageRouterTest, WriteThenReadFile) {
    TempDir dir;
    std::string path = dir.file("doc.json");

    json written = call({{"id", 1}, {"cmd", "write_file_content"},
                         {"args", {{"path", path}, {"content", "{\"a\":1}"}}}});
    EXPECT_EQ(written["id"], 1);
    EXPECT_TRUE(written["ok"].get<bool>());
    EXPECT_TRUE(written["result"].is_null());

    json read = call({{"id", 2}, {"cmd", "read_file_content"}, {"args", {{"path", path}}}});
    EXPECT_TRUE(read["ok"].get<bool>());
    EXPECT_EQ(read["result"].get<std::string>(), "{\"a\":1}");
}

TEST_F(MessageRouterTest, MissingFileIsAFailureReply) {
    TempDir dir;
    json reply = call({{"id", 3}, {"cmd", "read_file_content"},
                       {"args", {{"path", dir.file("missing.json")}}}});
    EXPECT_EQ(reply["id"], 3);
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_NE(reply["error"].get<std::string>().find("Failed to read file"), std::string::npos);
}

// ─── JSON ───────────────────────────────────────────────────────────────────

TEST_F(MessageRouterTest, ValidateReportsParseErrors) {
    json good = call({{"id", 4}, {"cmd", "validate_json"}, {"args", {{"content", "{}"}}}});
    EXPECT_TRUE(good["ok"].get<bool>());
    EXPECT_TRUE(good["result"].get<bool>());

    json bad = call({{"id", 5}, {"cmd", "validate_json"}, {"args", {{"content", "{not json"}}}});
    EXPECT_FALSE(bad["ok"].get<bool>());
    EXPECT_EQ(bad["error"].get<std::string>().rfind("Invalid JSON: ", 0), 0u);
}

TEST_F(MessageRouterTest, FormatHonoursIndent) {
    json reply = call({{"id", 6}, {"cmd", "format_json"},
                       {"args", {{"content", "{\"a\":[1]}"}, {"indent", 4}}}});
    ASSERT_TRUE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["result"].get<std::string>(), "{\n    \"a\": [\n        1\n    ]\n}");

    json fallback = call({{"id", 7}, {"cmd", "format_json"}, {"args", {{"content", "[1]"}}}});
    EXPECT_EQ(fallback["result"].get<std::string>(), "[\n  1\n]");
}

TEST_F(MessageRouterTest, IndentOutOfRangeIsClamped) {
    std::string wide = "[\n" + std::string(CommandSurface::MAX_INDENT, ' ') + "1\n]";

    json huge_float = call({{"id", 20}, {"cmd", "format_json"},
                            {"args", {{"content", "[1]"}, {"indent", 1e20}}}});
    ASSERT_TRUE(huge_float["ok"].get<bool>());
    EXPECT_EQ(huge_float["result"].get<std::string>(), wide);

    json huge_unsigned = call({{"id", 21}, {"cmd", "format_json"},
                               {"args", {{"content", "[1]"}, {"indent", 18446744073709551615ull}}}});
    ASSERT_TRUE(huge_unsigned["ok"].get<bool>());
    EXPECT_EQ(huge_unsigned["result"].get<std::string>(), wide);

    json negative = call({{"id", 22}, {"cmd", "format_json"},
                          {"args", {{"content", "[1]"}, {"indent", -1e20}}}});
    ASSERT_TRUE(negative["ok"].get<bool>());
    EXPECT_EQ(negative["result"].get<std::string>(), "[\n1\n]");

    json fractional = call({{"id", 23}, {"cmd", "format_json"},
                            {"args", {{"content", "[1]"}, {"indent", 3.9}}}});
    EXPECT_EQ(fractional["result"].get<std::string>(), "[\n   1\n]");
}

TEST_F(MessageRouterTest, CompressAndSize) {
    json compressed = call({{"id", 8}, {"cmd", "compress_json"},
                            {"args", {{"content", "{ \"a\" : 1 }"}}}});
    EXPECT_EQ(compressed["result"].get<std::string>(), "{\"a\":1}");

    json size = call({{"id", 9}, {"cmd", "calculate_json_size"},
                      {"args", {{"content", std::string(100, ' ')}}}});
    ASSERT_TRUE(size["ok"].get<bool>());
    EXPECT_EQ(size["result"]["raw"], 100);
    EXPECT_EQ(size["result"]["gzip"], 70);
    EXPECT_EQ(size["result"]["brotli"], 60);
}

// ─── Shell state ────────────────────────────────────────────────────────────

TEST_F(MessageRouterTest, GetPendingFilesDrainsOnce) {
    bridge_.seed_from_args({"pandia", "notes.json5", "--flag", "image.png"});

    json first = call({{"id", 10}, {"cmd", "get_pending_files"}});
    EXPECT_EQ(first["result"], json::array({"notes.json5"}));

    json second = call({{"id", 11}, {"cmd", "get_pending_files"}, {"args", json::object()}});
    EXPECT_EQ(second["result"], json::array());
}

TEST_F(MessageRouterTest, UpdateRecentFilesMenu) {
    json reply = call({{"id", 12}, {"cmd", "update_recent_files_menu"},
                       {"args", {{"recentFiles", {{{"path", "/d/a.json"}, {"name", "a.json"}},
                                                  {{"path", "/d/b.json"}, {"name", "b.json"}}}}}}});
    EXPECT_TRUE(reply["ok"].get<bool>());

    auto entries = menus_.recent_entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].path, "/d/b.json");

    call({{"id", 13}, {"cmd", "update_recent_files_menu"}, {"args", {{"recentFiles", json::array()}}}});
    EXPECT_TRUE(menus_.recent_entries().empty());
    EXPECT_EQ(menus_.recent_items().front().id, "no_recent");
}

// ─── Errors ─────────────────────────────────────────────────────────────────

TEST_F(MessageRouterTest, UnknownCommand) {
    json reply = call({{"id", 14}, {"cmd", "format_disk"}});
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["error"].get<std::string>(), "Unknown command: format_disk");
}

TEST_F(MessageRouterTest, MissingOrMistypedArguments) {
    json missing = call({{"id", 15}, {"cmd", "read_file_content"}});
    EXPECT_FALSE(missing["ok"].get<bool>());
    EXPECT_EQ(missing["error"].get<std::string>().rfind("Invalid arguments for read_file_content", 0), 0u);

    json wrong_type = call({{"id", 16}, {"cmd", "format_json"},
                            {"args", {{"content", "[]"}, {"indent", "wide"}}}});
    EXPECT_FALSE(wrong_type["ok"].get<bool>());

    json not_object = call({{"id", 17}, {"cmd", "validate_json"}, {"args", json::array({1})}});
    EXPECT_FALSE(not_object["ok"].get<bool>());

    json no_cmd = call({{"id", 18}});
    EXPECT_EQ(no_cmd["error"].get<std::string>(), "Missing command name");
}

TEST_F(MessageRouterTest, UnusableMessagesAreDropped) {
    bool replied = false;
    auto reply = [&replied](const json&) { replied = true; };

    EXPECT_FALSE(router_.handle("{not json", reply));
    EXPECT_FALSE(router_.handle("[1, 2]", reply));
    EXPECT_FALSE(router_.handle("{\"cmd\": \"validate_json\"}", reply));
    EXPECT_FALSE(router_.handle("{\"id\": \"seven\", \"cmd\": \"validate_json\"}", reply));
    EXPECT_FALSE(replied);
}

TEST_F(MessageRouterTest, KnowsItsCommands) {
    for (const char* name : {"read_file_content", "write_file_content", "validate_json", "format_json",
                             "compress_json", "calculate_json_size", "get_pending_files",
                             "update_recent_files_menu"}) {
        EXPECT_TRUE(router_.has_command(name)) << name;
    }
    EXPECT_FALSE(router_.has_command("open_devtools"));
}
