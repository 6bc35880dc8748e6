#include "error_handling.h"
#include <ctime>

namespace avatarcli {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::NETWORK_ERROR: return "Network error";
        case ErrorCode::TIMEOUT: return "Timeout";
        case ErrorCode::HTTP_ERROR: return "HTTP error";
        case ErrorCode::PARSE_ERROR: return "Parse error";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::ACCESS_DENIED: return "Access denied";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

std::string describeError(const Error& error) {
    std::string msg = error.message.empty() ? errorToString(error.code) : error.message;
    if (!error.context.empty()) {
        msg += " [" + error.context + "]";
    }
    return msg;
}

}
