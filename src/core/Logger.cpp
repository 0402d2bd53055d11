/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only - debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <string_view>

namespace Ragfall {
namespace {

constexpr size_t FLUSH_EVERY = 50;

// One file per run under the SDL preference path, overwritten on start.
// Lines are stamped with seconds since SDL initialised its tick counter.
class FileLogger {
public:
    static FileLogger& Instance() {
        static FileLogger instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        const Uint64 ticks = SDL_GetTicks();
        m_stream << std::format("[{:>6}.{:03}] [{}] [{}] {}\n", ticks / 1000, ticks % 1000,
                                level, system, message);

        const bool critical = std::string_view(level) == "CRITICAL";
        if (critical || ++m_unflushed >= FLUSH_EVERY) {
            m_stream.flush();
            m_unflushed = 0;
        }
    }

private:
    FileLogger() = default;
    ~FileLogger() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }
    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    void open() {
        m_opened = true;

        // RAGFALL_APP_NAME comes from CMake's ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("HammerForged", RAGFALL_APP_NAME);
        if (!prefPath) {
            return;
        }
        const std::filesystem::path path = std::filesystem::path(prefPath) / "ragfall.log";
        SDL_free(prefPath);

        m_stream.open(path, std::ios::out | std::ios::trunc);
        if (m_stream.is_open()) {
            m_stream << "=== " << RAGFALL_APP_NAME << " log ===\n";
        }
    }

    std::mutex m_mutex;
    std::ofstream m_stream;
    bool m_opened{false};
    size_t m_unflushed{0};
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    FileLogger::Instance().write(level, system, message);
}

} // namespace Ragfall

#endif // ifndef DEBUG
