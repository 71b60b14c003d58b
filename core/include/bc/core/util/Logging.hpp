#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// Process-wide logger with "{}" placeholder formatting.
// Messages go to stderr and to every file added with AddLogFile().
class SimpleLogger {
public:
    enum class Level {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical
    };

    SimpleLogger();
    ~SimpleLogger();

    void setLevel(Level level) { currentLevel_ = level; }
    [[nodiscard]] Level level() const { return currentLevel_; }
    void addFile(const std::filesystem::path& path);

    template<typename... Args>
    void trace(const std::string& fmt, Args&&... args) {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args) {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args) {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args) {
        log(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args) {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(const std::string& fmt, Args&&... args) {
        log(Level::Critical, fmt, std::forward<Args>(args)...);
    }

    // Context tag prepended to messages logged from the calling thread,
    // e.g. "plate1.lif #3 LNG_01". Managed by ScopedLogContext.
    static std::string& threadContext();

private:
    template<typename... Args>
    void log(Level level, const std::string& fmt, Args&&... args) {
        if (level < currentLevel_) return;

        std::string msg = formatMessage(fmt, std::forward<Args>(args)...);
        const std::string& ctx = threadContext();
        std::string line = levelPrefix(level) + (ctx.empty() ? "" : "[" + ctx + "] ") + msg;

        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << line << std::endl;

        for (auto& file : files_) {
            if (file.is_open()) {
                file << line << std::endl;
            }
        }
    }

    template<typename T>
    static std::string toString(T&& val) {
        std::ostringstream oss;
        oss << std::forward<T>(val);
        return oss.str();
    }

    template<typename T, typename... Args>
    static std::string formatMessage(const std::string& fmt, T&& first, Args&&... rest) {
        std::string result = fmt;
        size_t pos = result.find("{}");
        if (pos == std::string::npos) {
            return result;
        }
        std::string head = result.substr(0, pos) + toString(std::forward<T>(first));
        if constexpr (sizeof...(rest) > 0) {
            return head + formatMessage(result.substr(pos + 2), std::forward<Args>(rest)...);
        }
        return head + result.substr(pos + 2);
    }

    static std::string formatMessage(const std::string& fmt) {
        return fmt;
    }

    static std::string levelPrefix(Level level);

    Level currentLevel_ = Level::Info;
    std::mutex mutex_;
    std::vector<std::ofstream> files_;
};

// Sets the calling thread's log context for the lifetime of the object.
class ScopedLogContext {
public:
    explicit ScopedLogContext(std::string context);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
    std::string previous_;
};

void AddLogFile(const std::filesystem::path& path);
// Returns false (and leaves the level unchanged) for an unknown name.
bool SetLogLevel(const std::string& s);
std::optional<SimpleLogger::Level> ParseLogLevel(const std::string& s);
std::shared_ptr<SimpleLogger> Logger();
