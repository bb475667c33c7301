/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Debug builds log to the console from the header; only release builds need this
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace Bulwark {
namespace {

constexpr size_t KEPT_LOG_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;

std::tm localTime(std::time_t t) {
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &t);
#else
    localtime_r(&t, &timeinfo);
#endif
    return timeinfo;
}

// Appends release-build errors to <pref path>/logs/bulwark_<timestamp>.log
class ErrorLogFile {
public:
    static ErrorLogFile& Instance() {
        static ErrorLogFile instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(Logger::s_logMutex);

        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
        std::tm timeinfo = localTime(std::chrono::system_clock::to_time_t(now));

        m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_EVERY) {
            m_stream.flush();
            m_pending = 0;
        }
    }

private:
    ErrorLogFile() = default;

    ~ErrorLogFile() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }

    ErrorLogFile(const ErrorLogFile&) = delete;
    ErrorLogFile& operator=(const ErrorLogFile&) = delete;

    void open() {
        m_opened = true;

        // BULWARK_APP_NAME comes from CMake's PROJECT_NAME
        char* prefPath = SDL_GetPrefPath("HammerForged", BULWARK_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }

        namespace fs = std::filesystem;
        fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }
        pruneOldLogs(logDir);

        std::tm timeinfo = localTime(std::chrono::system_clock::to_time_t(
            std::chrono::system_clock::now()));
        std::ostringstream filename;
        filename << "bulwark_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S") << ".log";

        m_stream.open(logDir / filename.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << BULWARK_APP_NAME << " Log ===\n"
                     << "Started: " << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S")
                     << "\n\n";
            m_stream.flush();
        }
    }

    // Keeps the newest KEPT_LOG_FILES - 1 so the file about to be opened makes KEPT_LOG_FILES
    static void pruneOldLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> logFiles;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with("bulwark_")) {
                logFiles.push_back(entry);
            }
        }
        if (logFiles.size() < KEPT_LOG_FILES) {
            return;
        }

        std::sort(logFiles.begin(), logFiles.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.path().filename() < b.path().filename();
                  });

        size_t toRemove = logFiles.size() - (KEPT_LOG_FILES - 1);
        for (size_t i = 0; i < toRemove; ++i) {
            fs::remove(logFiles[i].path(), ec);
        }
    }

    std::ofstream m_stream;
    bool m_opened{false};
    size_t m_pending{0};
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    ErrorLogFile::Instance().write(level, system, message);
}

} // namespace Bulwark

#endif // ifndef DEBUG
