#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

// Levels in increasing order of severity.
enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

class MyLogger
{
public:
    static void setLevel(LogLevel level) { minLevel() = level; }
    static LogLevel level() { return minLevel(); }

    // Accepts "debug", "info", "warning" or "error"; anything else keeps the
    // current level and returns false.
    static bool setLevel(const std::string &name)
    {
        if (name == "debug")
            setLevel(LogLevel::Debug);
        else if (name == "info")
            setLevel(LogLevel::Info);
        else if (name == "warning")
            setLevel(LogLevel::Warning);
        else if (name == "error")
            setLevel(LogLevel::Error);
        else
            return false;
        return true;
    }

    static void debug(const std::string &msg)
    {
        write(LogLevel::Debug, std::cout, "\033[1;36m[DEBUG] ", msg); // Cyan
    }
    static void info(const std::string &msg)
    {
        write(LogLevel::Info, std::cout, "\033[1;32m[INFO] ", msg); // Light green
    }
    static void warning(const std::string &msg)
    {
        write(LogLevel::Warning, std::cerr, "\033[1;33m[WARNING] ", msg); // Yellow
    }
    static void error(const std::string &msg)
    {
        write(LogLevel::Error, std::cerr, "\033[1;35m[ERROR] ", msg); // Magenta
    }

private:
    static std::atomic<LogLevel> &minLevel()
    {
        static std::atomic<LogLevel> lvl{LogLevel::Info};
        return lvl;
    }

    static void write(LogLevel lvl, std::ostream &out, const char *prefix, const std::string &msg)
    {
        if (lvl < minLevel())
            return;
        static std::mutex mtx;
        std::lock_guard<std::mutex> lock(mtx);
        out << prefix << msg << "\033[0m" << std::endl;
    }
};
