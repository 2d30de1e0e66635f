#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <array>
#include <cctype>
#include <iostream>
#include <utility>
#include <vector>

#ifdef ERROR
#undef ERROR
#endif

namespace quanta {
namespace utils {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";

struct LevelName {
    Logger::Level level;
    const char* name;
    spdlog::level::level_enum spd;
};

constexpr std::array<LevelName, 6> kLevels = {{
    {Logger::Level::TRACE, "trace", spdlog::level::trace},
    {Logger::Level::DEBUG, "debug", spdlog::level::debug},
    {Logger::Level::INFO, "info", spdlog::level::info},
    {Logger::Level::WARN, "warn", spdlog::level::warn},
    {Logger::Level::ERROR, "error", spdlog::level::err},
    {Logger::Level::CRITICAL, "critical", spdlog::level::critical},
}};

const LevelName& entry(Logger::Level level) {
    for (const auto& l : kLevels) {
        if (l.level == level) return l;
    }
    return kLevels[2];
}

} // namespace

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::init(const std::string& log_file, Level level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
        }

        auto logger = std::make_shared<spdlog::logger>("quanta", sinks.begin(), sinks.end());
        logger->set_level(entry(level).spd);
        logger->set_pattern(kPattern);
        // decision-log failures and in-doubt reports must reach the file before a crash
        logger->flush_on(spdlog::level::warn);
        logger_ = std::move(logger);

        logger_->info("Logger initialized (level: {}, file: {})", levelToString(level),
                      log_file.empty() ? "<none>" : log_file);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        logger_.reset();
    }
}

void Logger::shutdown() {
    if (!logger_) return;
    logger_->flush();
    logger_.reset();
}

bool Logger::isInitialized() {
    return logger_ != nullptr;
}

void Logger::setLevel(Level level) {
    if (logger_) logger_->set_level(entry(level).spd);
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s;
    for (char c : lvl) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (s == "warning") return Level::WARN;
    if (s == "err") return Level::ERROR;
    if (s == "crit") return Level::CRITICAL;
    for (const auto& l : kLevels) {
        if (s == l.name) return l.level;
    }
    return Level::INFO;
}

const char* Logger::levelToString(Level lvl) {
    return entry(lvl).name;
}

} // namespace utils
} // namespace quanta
