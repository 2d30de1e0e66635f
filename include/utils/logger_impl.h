#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace quanta {
namespace utils {

namespace detail {

// Arguments are only formatted when the level passes the logger's filter
template<typename FormatString, typename... Args>
void emit(spdlog::logger* logger, spdlog::level::level_enum lvl, FormatString&& fmt, Args&&... args) {
    if (!logger || !logger->should_log(lvl)) return;
    logger->log(lvl, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
}

} // namespace detail

#define QUANTA_LOGGER_LEVEL_FN(name, spd_level)                                              \
    template<typename FormatString, typename... Args>                                        \
    void Logger::name(FormatString&& fmt, Args&&... args) {                                  \
        detail::emit(logger_.get(), spdlog::level::spd_level,                                \
                     std::forward<FormatString>(fmt), std::forward<Args>(args)...);          \
    }

QUANTA_LOGGER_LEVEL_FN(trace, trace)
QUANTA_LOGGER_LEVEL_FN(debug, debug)
QUANTA_LOGGER_LEVEL_FN(info, info)
QUANTA_LOGGER_LEVEL_FN(warn, warn)
QUANTA_LOGGER_LEVEL_FN(error, err)
QUANTA_LOGGER_LEVEL_FN(critical, critical)

#undef QUANTA_LOGGER_LEVEL_FN

} // namespace utils
} // namespace quanta
