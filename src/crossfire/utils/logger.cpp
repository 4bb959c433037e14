#include <crossfire/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace crossfire::utils {

std::mutex Logger::sink_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;
std::ostream* Logger::output_ = nullptr;

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::LOG_ERROR:
            return "ERROR";
    }
    return "INFO";
}

Logger::Logger(LogLevel level) : level_(level) {}

// The per-thread instances are reused, so formatting set by the last message is dropped too
void Logger::reset() {
    stream_.str("");
    stream_.clear();
    stream_.flags(std::ios_base::dec | std::ios_base::skipws);
    stream_.precision(6);
}

Logger& Logger::debug() {
    static thread_local Logger instance(LogLevel::DEBUG);
    instance.reset();
    return instance;
}

Logger& Logger::info() {
    static thread_local Logger instance(LogLevel::INFO);
    instance.reset();
    return instance;
}

Logger& Logger::warn() {
    static thread_local Logger instance(LogLevel::WARN);
    instance.reset();
    return instance;
}

Logger& Logger::error() {
    static thread_local Logger instance(LogLevel::LOG_ERROR);
    instance.reset();
    return instance;
}

Logger& Logger::operator<<(const EndlType&) {
    if (level_ < current_level_) {
        stream_.str("");
        return *this;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count() % 1000;

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::stringstream line;
    line << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
         << '.' << std::setfill('0') << std::setw(3) << ms << "] "
         << "[" << to_string(level_) << "] "
         << stream_.str();

    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        std::ostream& out = output_ ? *output_ : std::cout;
        out << line.str() << std::endl;
    }

    stream_.str("");
    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
}

LogLevel Logger::level() {
    return current_level_;
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::LOG_ERROR;
    return fallback;
}

void Logger::set_output(std::ostream* out) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    output_ = out;
}

} // namespace crossfire::utils
