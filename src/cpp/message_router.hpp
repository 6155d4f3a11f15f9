#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "event_bridge.hpp"
#include "menu_registry.hpp"
#include "worker_pool.hpp"

// Decodes UI requests posted through the webview message channel:
//   {"id": 7, "cmd": "format_json", "args": {"content": "...", "indent": 4}}
// and answers each one exactly once:
//   {"id": 7, "ok": true, "result": ...}  or  {"id": 7, "ok": false, "error": "..."}
// File and JSON work runs on the worker pool; queue and menu requests run on
// the calling thread (the GLib main loop).
class MessageRouter {
public:
    using Reply = std::function<void(const nlohmann::json&)>;

    MessageRouter(EventBridge& bridge, MenuRegistry& menus, WorkerPool& workers);

    // Returns false when the message has no usable id and was dropped.
    // `reply` may be invoked from a worker thread.
    bool handle(const std::string& message, Reply reply);

    bool has_command(const std::string& name) const;

    static nlohmann::json success(std::int64_t id, nlohmann::json result);
    static nlohmann::json failure(std::int64_t id, const std::string& error);

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json& args)>;

    void register_commands();
    static nlohmann::json run(const std::string& name, const Handler& handler,
                              std::int64_t id, const nlohmann::json& args);

    EventBridge& bridge_;
    MenuRegistry& menus_;
    WorkerPool& workers_;

    std::unordered_map<std::string, Handler> worker_commands_;
    std::unordered_map<std::string, Handler> inline_commands_;
};
