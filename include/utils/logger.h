#pragma once

// Windows compatibility - undef macros that conflict with Logger::Level
#ifdef ERROR
#undef ERROR
#endif

#include <string>
#include <memory>

namespace spdlog { class logger; }

namespace quanta {
namespace utils {

/// Process-wide logging facade over a single spdlog logger named "quanta".
/// Until init() is called every log call is a no-op, so library code can log
/// unconditionally and tests need no setup.
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    // stderr + file sinks (stdout belongs to the shell's responses).
    // An empty log_file means stderr only.
    static void init(const std::string& log_file = "quanta.log", Level level = Level::INFO);
    static void shutdown();
    static bool isInitialized();

    static void setLevel(Level level);
    // Case-insensitive; INFO on unknown input
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace quanta

#include "utils/logger_impl.h"

#define QUANTA_TRACE(...) ::quanta::utils::Logger::trace(__VA_ARGS__)
#define QUANTA_DEBUG(...) ::quanta::utils::Logger::debug(__VA_ARGS__)
#define QUANTA_INFO(...) ::quanta::utils::Logger::info(__VA_ARGS__)
#define QUANTA_WARN(...) ::quanta::utils::Logger::warn(__VA_ARGS__)
#define QUANTA_ERROR(...) ::quanta::utils::Logger::error(__VA_ARGS__)
#define QUANTA_CRITICAL(...) ::quanta::utils::Logger::critical(__VA_ARGS__)
