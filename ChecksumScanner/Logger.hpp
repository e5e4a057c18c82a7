#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error };

class Logger
{
public:
    static Logger& instance()
    {
        static Logger inst;
        return inst;
    }

    // false when the log file cannot be opened, console output still works
    bool init(const std::string& filename, LogLevel minLevel)
    {
        std::lock_guard<std::mutex> lk(mutex_);
        minLevel_ = minLevel;
        if (file_.is_open())
        {
            file_.close();
        }
        if (filename.empty())
        {
            return true;
        }
        file_.open(filename, std::ios::out | std::ios::app);
        return file_.is_open();
    }

    // Accepts the full names and the three letter tags, any case.
    static std::optional<LogLevel> parseLevel(const std::string& name)
    {
        std::string key;
        for (char c : name)
        {
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if ("debug" == key || "dbg" == key) return LogLevel::Debug;
        if ("info" == key || "inf" == key) return LogLevel::Info;
        if ("warn" == key || "warning" == key || "wrn" == key) return LogLevel::Warn;
        if ("error" == key || "err" == key) return LogLevel::Error;
        return std::nullopt;
    }

    bool enabled(LogLevel lvl)
    {
        std::lock_guard<std::mutex> lk(mutex_);
        return lvl >= minLevel_;
    }

    void log(LogLevel lvl, const char* file, int line, const char* func, const char* fmt, ...)
    {
        if (!enabled(lvl)) return;

        char buffer[1024];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        std::ostringstream oss;
        oss << nowString() << " [" << levelToString(lvl) << "] "
            << file << ":" << line << " (" << func << ") - " << buffer << "\n";

        std::string out = oss.str();

        // stdout carries the digest listing, diagnostics go to stderr
        std::lock_guard<std::mutex> lk(mutex_);
        std::fwrite(out.data(), 1, out.size(), stderr);
        fflush(stderr);

        if (file_.is_open())
        {
            file_ << out;
            file_.flush();
        }
    }

private:
    Logger() : minLevel_(LogLevel::Debug) {}
    ~Logger()
    {
        if (file_.is_open()) file_.close();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string nowString() const
    {
        using namespace std::chrono;
        auto t = system_clock::now();
        auto tt = system_clock::to_time_t(t);
        auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

        std::tm tm_buf;
#if defined(_WIN32)
        localtime_s(&tm_buf, &tt);
#else
        localtime_r(&tt, &tm_buf);
#endif
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));
        return std::string(buf);
    }

    const char* levelToString(LogLevel l) const
    {
        switch (l) {
        case LogLevel::Debug: return "DBG";
        case LogLevel::Info:  return "INF";
        case LogLevel::Warn:  return "WRN";
        case LogLevel::Error: return "ERR";
        default: return "UNK";
        }
    }

    std::mutex mutex_;
    std::ofstream file_;
    LogLevel minLevel_;
};

#ifdef _DEBUG
#define LOG(level, fmt, ...) \
        do { Logger::instance().log(LogLevel::level, __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); } while(0)
#else
#define LOG(level, fmt, ...) do {} while(0)
#endif
