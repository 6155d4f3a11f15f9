#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Shell -> UI notification names
inline constexpr const char* EVENT_FILE_OPEN = "file-open";
inline constexpr const char* EVENT_MENU = "menu-event";

// An attached UI able to receive live notifications.
// Implementations must accept emit() from any thread.
class UiSurface {
public:
    virtual ~UiSurface() = default;

    virtual void emit(const std::string& event, const nlohmann::json& payload) = 0;
};
