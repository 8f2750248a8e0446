/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only. Debug builds log to stdout from the header.
#ifndef DEBUG

#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Kickoff {
namespace {

constexpr size_t KEEP_LOG_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;

std::tm toLocalTime(std::time_t t) {
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &t);
#else
    localtime_r(&t, &timeinfo);
#endif
    return timeinfo;
}

// Appends CRITICAL and ERROR lines to logs/kickoff_<timestamp>.log under the
// working directory
class MatchLogFile {
public:
    static MatchLogFile& Instance() {
        static MatchLogFile instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);

        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
        std::tm timeinfo = toLocalTime(std::chrono::system_clock::to_time_t(now));

        m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_EVERY) {
            m_stream.flush();
            m_pending = 0;
        }
    }

private:
    MatchLogFile() = default;
    ~MatchLogFile() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }

    MatchLogFile(const MatchLogFile&) = delete;
    MatchLogFile& operator=(const MatchLogFile&) = delete;

    void open() {
        namespace fs = std::filesystem;
        m_opened = true;

        fs::path logDir = fs::current_path() / "logs";
        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }

        pruneOldLogs(logDir);

        std::tm timeinfo = toLocalTime(
            std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
        std::ostringstream name;
        name << "kickoff_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S") << ".log";

        m_stream.open(logDir / name.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << KICKOFF_APP_NAME << " Log ===\n"
                     << "Started: " << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S")
                     << "\n\n";
        }
    }

    void pruneOldLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;
        std::vector<fs::directory_entry> logs;

        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with("kickoff_")) {
                logs.push_back(entry);
            }
        }
        if (logs.size() < KEEP_LOG_FILES) {
            return;
        }

        // Oldest first, leave room for the file about to be created
        std::sort(logs.begin(), logs.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.last_write_time() < b.last_write_time();
                  });
        size_t excess = logs.size() - (KEEP_LOG_FILES - 1);
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(logs[i].path(), ec);
        }
    }

    std::mutex m_fileMutex;
    std::ofstream m_stream;
    bool m_opened{false};
    size_t m_pending{0};
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
    MatchLogFile::Instance().write(level, system, message);
}

} // namespace Kickoff

#endif // ifndef DEBUG
