#include "bc/core/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>

SimpleLogger::SimpleLogger() = default;

SimpleLogger::~SimpleLogger()
{
    for (auto& file : files_) {
        if (file.is_open()) {
            file.close();
        }
    }
}

void SimpleLogger::addFile(const std::filesystem::path& path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open log file: " + path.string());
    }
    files_.push_back(std::move(file));
}

std::string& SimpleLogger::threadContext()
{
    thread_local std::string context;
    return context;
}

std::string SimpleLogger::levelPrefix(Level level)
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

    switch (level) {
        case Level::Trace:    oss << "[TRACE] "; break;
        case Level::Debug:    oss << "[DEBUG] "; break;
        case Level::Info:     oss << "[INFO] "; break;
        case Level::Warn:     oss << "[WARN] "; break;
        case Level::Error:    oss << "[ERROR] "; break;
        case Level::Critical: oss << "[CRITICAL] "; break;
    }

    return oss.str();
}

ScopedLogContext::ScopedLogContext(std::string context)
    : previous_(SimpleLogger::threadContext())
{
    SimpleLogger::threadContext() = std::move(context);
}

ScopedLogContext::~ScopedLogContext()
{
    SimpleLogger::threadContext() = std::move(previous_);
}

std::shared_ptr<SimpleLogger> Logger()
{
    static auto logger = std::make_shared<SimpleLogger>();
    return logger;
}

void AddLogFile(const std::filesystem::path& path)
{
    Logger()->addFile(path);
}

std::optional<SimpleLogger::Level> ParseLogLevel(const std::string& s)
{
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return SimpleLogger::Level::Trace;
    if (lower == "debug") return SimpleLogger::Level::Debug;
    if (lower == "info") return SimpleLogger::Level::Info;
    if (lower == "warn" || lower == "warning") return SimpleLogger::Level::Warn;
    if (lower == "error" || lower == "err") return SimpleLogger::Level::Error;
    if (lower == "critical" || lower == "crit") return SimpleLogger::Level::Critical;
    return std::nullopt;
}

bool SetLogLevel(const std::string& s)
{
    auto level = ParseLogLevel(s);
    if (!level) {
        return false;
    }
    Logger()->setLevel(*level);
    return true;
}
