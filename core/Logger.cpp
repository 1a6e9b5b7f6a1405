#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>

namespace homescout {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

namespace {

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARN:     return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

void Logger::Initialize(const std::string& log_file_path, size_t max_file_size, size_t max_files) {
    try {
        std::filesystem::path log_path(log_file_path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file_path, max_file_size, max_files);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");

        if (logger_) {
            spdlog::drop(logger_->name());
        }

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        logger_ = std::make_shared<spdlog::logger>("HomeScout", sinks.begin(), sinks.end());
        logger_->set_level(spdlog::level::trace);
        logger_->flush_on(spdlog::level::err);

        spdlog::register_logger(logger_);

        logger_->info("Logger initialized: {}", log_file_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to initialize logger: %s\n", ex.what());
        throw;
    }
}

void Logger::InitializeConsoleOnly(LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    if (logger_) {
        spdlog::drop(logger_->name());
    }

    logger_ = std::make_shared<spdlog::logger>("HomeScout", console_sink);
    logger_->set_level(ToSpdlogLevel(level));
    spdlog::register_logger(logger_);
}

void Logger::SetLevel(LogLevel level) {
    if (!logger_) return;
    logger_->set_level(ToSpdlogLevel(level));
}

bool Logger::ParseLevel(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")         out = LogLevel::TRACE;
    else if (lower == "debug")    out = LogLevel::DEBUG;
    else if (lower == "info")     out = LogLevel::INFO;
    else if (lower == "warn" || lower == "warning") out = LogLevel::WARN;
    else if (lower == "error")    out = LogLevel::ERROR;
    else if (lower == "critical") out = LogLevel::CRITICAL;
    else if (lower == "off")      out = LogLevel::OFF;
    else return false;
    return true;
}

void Logger::Shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        logger_ = nullptr;
    }
}

std::shared_ptr<spdlog::logger> Logger::Get() {
    if (!logger_) {
        InitializeConsoleOnly(LogLevel::INFO);
    }
    return logger_;
}

} // namespace homescout
