#pragma once
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace ry {
namespace core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    // Compiled out unless RY_DEBUG is defined.
    template<typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
#ifdef RY_DEBUG
        LogFormatted(LogLevel::Debug, format, std::forward<Args>(args)...);
#else
        (void)format;
        (void)sizeof...(Args);
        (void)std::initializer_list<int>{((void)args, 0)...};
#endif
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        LogFormatted(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        LogFormatted(LogLevel::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        LogFormatted(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    static void SetMinimumLevel(LogLevel level) {
        s_minimumLevel.store(level, std::memory_order_release);
        s_configured.store(true, std::memory_order_release);
    }

    static LogLevel GetMinimumLevel() {
        EnsureConfigured();
        return s_minimumLevel.load(std::memory_order_acquire);
    }

    static bool IsEnabled(LogLevel level) {
#ifndef RY_DEBUG
        if (level == LogLevel::Debug) {
            return false;
        }
#endif
        return static_cast<int>(level) >= static_cast<int>(GetMinimumLevel());
    }

    /// Reads RY_LOG_LEVEL (debug, info, warning, error).
    static void ConfigureFromEnvironment() {
        ConfigureFromEnvironmentInternal();
        s_configured.store(true, std::memory_order_release);
    }

    static std::optional<LogLevel> ParseLevel(std::string_view text) {
        std::string value(text);
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "debug") {
            return LogLevel::Debug;
        }
        if (value == "info") {
            return LogLevel::Info;
        }
        if (value == "warning" || value == "warn") {
            return LogLevel::Warning;
        }
        if (value == "error") {
            return LogLevel::Error;
        }
        return std::nullopt;
    }

    static void SetConsoleOutput(bool enabled) {
        s_consoleOutput.store(enabled, std::memory_order_release);
    }

    static void SetLogFile(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(s_logMutex);
        s_logFilePath = path;
        if (s_logStream.is_open()) {
            s_logStream.close();
        }
        s_logStreamOpen = false;
        EnsureLogStreamLocked();
    }

    static size_t RegisterListener(LogCallback callback) {
        if (!callback) {
            return 0;
        }
        std::lock_guard<std::mutex> lock(s_logMutex);
        const size_t token = s_listenerCounter.fetch_add(1, std::memory_order_relaxed);
        s_listeners.emplace_back(token, std::move(callback));
        return token;
    }

    static void UnregisterListener(size_t token) {
        if (token == 0) {
            return;
        }
        std::lock_guard<std::mutex> lock(s_logMutex);
        auto it = std::remove_if(s_listeners.begin(), s_listeners.end(),
                                 [token](const auto& entry) { return entry.first == token; });
        s_listeners.erase(it, s_listeners.end());
    }

private:
    template<typename... Args>
    static void LogFormatted(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        if (!IsEnabled(level)) {
            return;
        }
        Write(level, fmt::format(format, std::forward<Args>(args)...));
    }

    static void Write(LogLevel level, const std::string& message) {
        const std::string line = fmt::format("[{}] {}{}", FormatTimestamp(), LogLevelPrefix(level), message);

        if (s_consoleOutput.load(std::memory_order_acquire)) {
            fmt::print(stderr, "{}\n", line);
        }

        std::vector<LogCallback> listenersCopy;
        {
            std::lock_guard<std::mutex> lock(s_logMutex);
            if (s_logStreamOpen && s_logStream.is_open()) {
                s_logStream << line << '\n';
                s_logStream.flush();
            }
            listenersCopy.reserve(s_listeners.size());
            for (const auto& [token, callback] : s_listeners) {
                if (callback) {
                    listenersCopy.push_back(callback);
                }
            }
        }

        for (auto& callback : listenersCopy) {
            callback(level, line);
        }
    }

    static constexpr const char* LogLevelPrefix(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "[Debug] ";
            case LogLevel::Info:    return "[Info] ";
            case LogLevel::Warning: return "[Warning] ";
            case LogLevel::Error:   return "[Error] ";
        }
        return "";
    }

    static std::string FormatTimestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto timeT = system_clock::to_time_t(now);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &timeT);
#else
        localtime_r(&timeT, &tm);
#endif
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
        return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
                           tm.tm_year + 1900,
                           tm.tm_mon + 1,
                           tm.tm_mday,
                           tm.tm_hour,
                           tm.tm_min,
                           tm.tm_sec,
                           ms.count());
    }

    static void EnsureLogStreamLocked() {
        if (s_logStreamOpen || s_logFilePath.empty()) {
            return;
        }
        std::error_code ec;
        if (s_logFilePath.has_parent_path()) {
            std::filesystem::create_directories(s_logFilePath.parent_path(), ec);
        }
        s_logStream.open(s_logFilePath, std::ios::out | std::ios::app);
        s_logStreamOpen = s_logStream.is_open();
    }

    static void EnsureConfigured() {
        if (!s_configured.load(std::memory_order_acquire)) {
            bool expected = false;
            if (s_configured.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
                ConfigureFromEnvironmentInternal();
            }
        }
    }

    static void ConfigureFromEnvironmentInternal() {
        const char* env = std::getenv("RY_LOG_LEVEL");
        if (!env) {
            return;
        }
        if (auto level = ParseLevel(env)) {
            s_minimumLevel.store(*level, std::memory_order_release);
        }
    }

    static inline std::atomic<LogLevel> s_minimumLevel{LogLevel::Info};
    static inline std::atomic<bool> s_configured{false};
    static inline std::atomic<bool> s_consoleOutput{true};

    static inline std::mutex s_logMutex{};
    static inline std::filesystem::path s_logFilePath{};
    static inline std::ofstream s_logStream{};
    static inline bool s_logStreamOpen = false;
    static inline std::vector<std::pair<size_t, LogCallback>> s_listeners{};
    static inline std::atomic<size_t> s_listenerCounter{1};
};

}} // namespace ry::core
