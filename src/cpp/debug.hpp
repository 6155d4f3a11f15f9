#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// Debug logging utilities
// Only logs debug messages if debug mode is enabled (--debug or `debug: true`)
class DebugLog {
public:
    static void set_enabled(bool enabled) {
        enabled_.store(enabled);
    }

    static bool is_enabled() {
        return enabled_.load();
    }

    // Workers log concurrently with the main loop
    static void write(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << text << std::flush;
    }

    // Stream-based debug logger, buffers one statement and writes it at once
    class Logger {
    public:
        Logger(bool newline = false) : newline_(newline) {}

        ~Logger() {
            if (DebugLog::is_enabled()) {
                if (newline_) {
                    buffer_ << "\n";
                }
                DebugLog::write(buffer_.str());
            }
        }

        template<typename T>
        Logger& operator<<(const T& val) {
            if (DebugLog::is_enabled()) {
                buffer_ << val;
            }
            return *this;
        }

    private:
        bool newline_;
        std::ostringstream buffer_;
    };

private:
    static std::atomic<bool> enabled_;
    static std::mutex mutex_;
};

inline std::atomic<bool> DebugLog::enabled_{false};
inline std::mutex DebugLog::mutex_;

// Convenience macros for debug logging with stream syntax
#define DEBUG_LOG DebugLog::Logger(false)
#define DEBUG_LOGLN DebugLog::Logger(true)

// Always log errors and warnings regardless of debug mode
#define ERROR_LOG(msg) \
    do { std::ostringstream log_ss_; log_ss_ << "ERROR: " << msg << "\n"; DebugLog::write(log_ss_.str()); } while (0)
#define WARN_LOG(msg) \
    do { std::ostringstream log_ss_; log_ss_ << "WARNING: " << msg << "\n"; DebugLog::write(log_ss_.str()); } while (0)
