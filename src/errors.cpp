#include "errors.h"

namespace parley {

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::TransientProvider: return "TransientProviderError";
        case ErrorType::UnsupportedCapability: return "UnsupportedCapabilityError";
        case ErrorType::Provider: return "ProviderError";
        case ErrorType::ToolExecution: return "ToolExecutionError";
        case ErrorType::Validation: return "ValidationError";
        case ErrorType::IndexUnavailable: return "IndexUnavailableError";
        case ErrorType::LoopBoundExceeded: return "LoopBoundExceededError";
        case ErrorType::Cancelled: return "Cancelled";
        case ErrorType::Busy: return "Busy";
        case ErrorType::Timeout: return "Timeout";
        case ErrorType::IOError: return "IOError";
        case ErrorType::ParseError: return "ParseError";
        case ErrorType::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

std::string Error::describe() const {
    return std::string(error_type_name(type)) + ": " + message;
}

} // namespace parley
