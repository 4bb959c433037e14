#pragma once
#include <string>
#include <sstream>
#include <ostream>
#include <mutex>

namespace crossfire::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};

const char* to_string(LogLevel level);

class Logger {
public:
    struct EndlType {};
    inline static constexpr EndlType endl{};

    static Logger& debug();
    static Logger& info();
    static Logger& warn();
    static Logger& error();

    template<typename T>
    Logger& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

    // Flushes the buffered message as one line
    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();

    // Accepts DEBUG, INFO, WARN/WARNING, ERROR (any case); falls back otherwise
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

    // nullptr restores std::cout
    static void set_output(std::ostream* out);

private:
    explicit Logger(LogLevel level);
    void reset();

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex sink_mutex_;
    static LogLevel current_level_;
    static std::ostream* output_;
};

} // namespace crossfire::utils
