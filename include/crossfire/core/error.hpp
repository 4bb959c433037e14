#pragma once
#include <string>
#include <utility>

namespace crossfire::core {

enum class ErrorCode {
    DATA_UNAVAILABLE,       // empty or unreadable input table
    INDICATOR_COMPUTATION,  // malformed series inside RSI/EMA
    ALIGNMENT,              // volume and volume MA could not be joined
    UNEXPECTED
};

struct Error {
    ErrorCode code = ErrorCode::UNEXPECTED;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

const char* to_string(ErrorCode code);

} // namespace crossfire::core
