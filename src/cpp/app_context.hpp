#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include "pending_intents.hpp"
#include "ui_surface.hpp"

// Holds the currently attached UI surface, if any
class SurfaceSlot {
public:
    void attach(std::shared_ptr<UiSurface> surface) {
        std::lock_guard<std::mutex> lock(mutex_);
        surface_ = std::move(surface);
    }

    void detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        surface_.reset();
    }

    std::shared_ptr<UiSurface> current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return surface_;
    }

    // Returns the attached surface, or runs on_detached under the slot lock
    // and returns null. Lets a caller queue work that an attach cannot race past.
    std::shared_ptr<UiSurface> current_or(const std::function<void()>& on_detached) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!surface_) {
            on_detached();
        }
        return surface_;
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<UiSurface> surface_;
};

// Process-wide shell state, created in main() before any event can arrive
// and handed by reference to the components that share it.
struct AppContext {
    PendingIntentQueue pending;
    SurfaceSlot surface;
};
