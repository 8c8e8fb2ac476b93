#include "playback_monitor/utils/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <iostream>

#include <unistd.h>

namespace playback_monitor {
namespace utils {

namespace {

constexpr std::string_view ANSI_RESET = "\033[0m";

std::string_view level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "-";
    }
}

std::string_view level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warning: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default: return {};
    }
}

// "HH:MM:SS.mmm", or "YYYY-MM-DD HH:MM:SS.mmm" with the date
std::string format_time(std::chrono::system_clock::time_point tp, bool with_date) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[32];
    const auto written = std::strftime(buffer, sizeof(buffer), with_date ? "%Y-%m-%d %H:%M:%S" : "%H:%M:%S", &local);
    char result[40];
    std::snprintf(result, sizeof(result), "%.*s.%03d", static_cast<int>(written), buffer, static_cast<int>(millis));
    return result;
}

std::string format_line(const LogMessage& message, bool with_date) {
    std::string line;
    line.reserve(message.m_message.size() + message.m_component.size() + 40);
    line += '[';
    line += format_time(message.m_timestamp, with_date);
    line += "] [";
    line += level_tag(message.m_level);
    line += "] [";
    line += message.m_component;
    line += "] ";
    line += message.m_message;
    return line;
}

bool is_error_level(LogLevel level) {
    return level == LogLevel::Warning || level == LogLevel::Error;
}

} // namespace

Logger::Logger(LogLevel min_level) : m_min_level(min_level) {}

void Logger::set_level(LogLevel level) {
    std::lock_guard lock(m_mutex);
    m_min_level = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard lock(m_mutex);
    return m_min_level;
}

void Logger::add_sink(SinkPtr sink) {
    std::lock_guard lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(m_mutex);
    m_sinks.clear();
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::Debug, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::Info, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::Warning, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::Error, component, message);
}

void Logger::flush() {
    std::lock_guard lock(m_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    // Worker threads log concurrently; sinks see one message at a time
    std::lock_guard lock(m_mutex);
    if (level < m_min_level || m_sinks.empty()) {
        return;
    }

    const LogMessage entry{
        .m_level = level,
        .m_timestamp = std::chrono::system_clock::now(),
        .m_component = std::string(component),
        .m_message = std::string(message)
    };
    for (auto& sink : m_sinks) {
        sink->write(entry);
    }
}

// Warnings and errors go to stderr so a supervisor can separate them
ConsoleSink::ConsoleSink(bool use_colors)
    : m_use_colors(use_colors && isatty(fileno(stdout)) && isatty(fileno(stderr))) {}

void ConsoleSink::write(const LogMessage& message) {
    auto& stream = is_error_level(message.m_level) ? std::cerr : std::cout;
    stream << colorize(format_line(message, false), message.m_level) << '\n';
}

void ConsoleSink::flush() {
    std::cout.flush();
    std::cerr.flush();
}

std::string ConsoleSink::colorize(std::string_view text, LogLevel level) const {
    const auto color = level_color(level);
    if (!m_use_colors || color.empty()) {
        return std::string(text);
    }
    std::string result;
    result.reserve(text.size() + color.size() + ANSI_RESET.size());
    result.append(color).append(text).append(ANSI_RESET);
    return result;
}

FileSink::FileSink(const std::filesystem::path& path, bool truncate) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    m_file.open(path, truncate ? (std::ios::out | std::ios::trunc) : (std::ios::out | std::ios::app));
    if (m_file.is_open() && !truncate) {
        // Separates daemon runs in an appended log
        m_file << "\n=== playback-monitor started " << format_time(std::chrono::system_clock::now(), true)
               << " ===\n";
        m_file.flush();
    }
}

FileSink::~FileSink() {
    if (m_file.is_open()) {
        m_file.flush();
    }
}

void FileSink::write(const LogMessage& message) {
    if (!m_file.is_open()) {
        return;
    }
    m_file << format_line(message, true) << '\n';
    if (is_error_level(message.m_level)) {
        m_file.flush();
    }
}

void FileSink::flush() {
    if (m_file.is_open()) {
        m_file.flush();
    }
}

bool FileSink::is_open() const {
    return m_file.is_open();
}

void MemorySink::write(const LogMessage& message) {
    std::lock_guard lock(m_mutex);
    m_messages.push_back(message);
}

std::vector<LogMessage> MemorySink::messages() const {
    std::lock_guard lock(m_mutex);
    return m_messages;
}

std::size_t MemorySink::count_containing(std::string_view needle) const {
    std::lock_guard lock(m_mutex);
    return static_cast<std::size_t>(std::count_if(m_messages.begin(), m_messages.end(),
        [needle](const LogMessage& m) { return m.m_message.find(needle) != std::string::npos; }));
}

std::unique_ptr<Logger> LoggerManager::s_logger;
std::mutex LoggerManager::s_init_mutex;

Logger& LoggerManager::get_instance() {
    std::lock_guard lock(s_init_mutex);
    if (!s_logger) {
        s_logger = create_default_logger();
    }
    return *s_logger;
}

void LoggerManager::set_instance(std::unique_ptr<Logger> logger) {
    std::lock_guard lock(s_init_mutex);
    s_logger = std::move(logger);
}

std::unique_ptr<Logger> LoggerManager::create_default_logger() {
    auto logger = std::make_unique<Logger>(LogLevel::Info);
    logger->add_sink(std::make_unique<ConsoleSink>(true));
    return logger;
}

} // namespace utils
} // namespace playback_monitor
