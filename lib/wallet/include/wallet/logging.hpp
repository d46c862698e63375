#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace Tessera::Log {

enum class Level : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    OFF = 5,
};

[[nodiscard]] std::string_view level_string(Level level) noexcept;

using Sink = std::function<void(Level, std::string_view component, std::string_view message)>;

/**
 * @class Logger
 * @brief Process-wide levelled logger with one replaceable sink.
 *
 * The default sink writes "[LEVEL] component: message" lines to std::clog.
 */
class Logger {
public:
    static Logger& instance();

    void set_level(Level level);
    [[nodiscard]] Level level() const noexcept;

    // An empty sink restores the default.
    void set_sink(Sink sink);

    [[nodiscard]] bool will_log(Level level) const noexcept;

    void write(Level level, std::string_view component, std::string_view message);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    std::atomic<int> level_ { static_cast<int>(Level::INFO) };
    std::mutex sink_mutex_;
    Sink sink_;
};

} // namespace Tessera::Log

// The message is a stream expression: TESSERA_LOG_INFO("ledger", "nonce " << n);
// it is only formatted when the level is enabled.
#define TESSERA_LOG(lvl, component, expr)                                          \
    do {                                                                           \
        if (::Tessera::Log::Logger::instance().will_log(lvl)) {                    \
            std::ostringstream tessera_log_os_;                                    \
            tessera_log_os_ << expr;                                               \
            ::Tessera::Log::Logger::instance().write(lvl, component,               \
                tessera_log_os_.str());                                            \
        }                                                                          \
    } while (0)

#define TESSERA_LOG_TRACE(component, expr) TESSERA_LOG(::Tessera::Log::Level::TRACE, component, expr)
#define TESSERA_LOG_DEBUG(component, expr) TESSERA_LOG(::Tessera::Log::Level::DEBUG, component, expr)
#define TESSERA_LOG_INFO(component, expr) TESSERA_LOG(::Tessera::Log::Level::INFO, component, expr)
#define TESSERA_LOG_WARN(component, expr) TESSERA_LOG(::Tessera::Log::Level::WARN, component, expr)
#define TESSERA_LOG_ERROR(component, expr) TESSERA_LOG(::Tessera::Log::Level::ERR, component, expr)
