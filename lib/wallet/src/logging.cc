#include "wallet/logging.hpp"

#include <iostream>

namespace Tessera::Log {

std::string_view level_string(Level level) noexcept
{
    switch (level) {
    case Level::TRACE:
        return "TRACE";
    case Level::DEBUG:
        return "DEBUG";
    case Level::INFO:
        return "INFO";
    case Level::WARN:
        return "WARN";
    case Level::ERR:
        return "ERROR";
    case Level::OFF:
        return "OFF";
    }
    return "UNKNOWN";
}

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(Level level)
{
    level_.store(static_cast<int>(level), std::memory_order_release);
}

Level Logger::level() const noexcept
{
    return static_cast<Level>(level_.load(std::memory_order_acquire));
}

void Logger::set_sink(Sink sink)
{
    std::lock_guard lock(sink_mutex_);
    sink_ = std::move(sink);
}

bool Logger::will_log(Level level) const noexcept
{
    if (level == Level::OFF)
        return false;
    return static_cast<int>(level) >= level_.load(std::memory_order_acquire);
}

void Logger::write(Level level, std::string_view component, std::string_view message)
{
    std::unique_lock lock(sink_mutex_);
    if (sink_) {
        // Called unlocked so a sink may log or swap the sink itself.
        Sink sink = sink_;
        lock.unlock();
        sink(level, component, message);
        return;
    }
    std::clog << '[' << level_string(level) << "] " << component << ": " << message << '\n';
}

} // namespace Tessera::Log
