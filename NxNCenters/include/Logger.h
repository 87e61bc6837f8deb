#pragma once

#include <iostream>
#include <string>

enum class LogLevel : int { Debug, Info, Warn, Error, Off };

// Leveled diagnostic sink. Messages are written by a callable taking the
// stream, which is only invoked when the level is enabled.
class Logger {
public:
    Logger() = default;
    Logger(std::ostream& out, LogLevel level) : out(&out), level(level) {}

    bool enabled(LogLevel l) const { return out != nullptr && l >= level && l != LogLevel::Off; }
    void setLevel(LogLevel l) { level = l; }
    LogLevel getLevel() const { return level; }

    template <typename Fn>
    void debug(const std::string& tag, Fn&& fn) const { write(LogLevel::Debug, tag, fn); }

    template <typename Fn>
    void info(const std::string& tag, Fn&& fn) const { write(LogLevel::Info, tag, fn); }

    template <typename Fn>
    void warn(const std::string& tag, Fn&& fn) const { write(LogLevel::Warn, tag, fn); }

    template <typename Fn>
    void error(const std::string& tag, Fn&& fn) const { write(LogLevel::Error, tag, fn); }

    static const char* levelName(LogLevel l);

private:
    template <typename Fn>
    void write(LogLevel l, const std::string& tag, Fn& fn) const {
        if (!enabled(l)) {
            return;
        }
        *out << "[" << levelName(l) << "] " << tag << ": ";
        fn(*out);
        *out << '\n';
    }

    std::ostream* out = nullptr;
    LogLevel level = LogLevel::Off;
};
