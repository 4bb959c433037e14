#include <crossfire/core/error.hpp>

namespace crossfire::core {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::DATA_UNAVAILABLE:
            return "DataUnavailable";
        case ErrorCode::INDICATOR_COMPUTATION:
            return "IndicatorComputationError";
        case ErrorCode::ALIGNMENT:
            return "AlignmentError";
        case ErrorCode::UNEXPECTED:
            return "UnexpectedError";
    }
    return "UnexpectedError";
}

} // namespace crossfire::core
