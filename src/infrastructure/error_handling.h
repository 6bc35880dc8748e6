#pragma once

#include <string>
#include <cstdint>

namespace avatarcli {

enum class ErrorCode {
    OK = 0,
    NETWORK_ERROR,
    TIMEOUT,
    HTTP_ERROR,
    PARSE_ERROR,
    INVALID_ARGUMENT,
    ACCESS_DENIED,
    NOT_FOUND,
    FILE_NOT_FOUND,
    INVALID_STATE,
    INTERNAL_ERROR,
    UNKNOWN
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    std::string file;
    int line;
    uint64_t timestamp;
    
    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), line(0), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), severity(ErrorSeverity::ERROR), message(msg), line(0), timestamp(0) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}
    
    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }
    
    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }
    
private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}
    
    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }
    
private:
    Error error_;
    bool hasValue_;
};

const char* errorToString(ErrorCode code);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

// One-line rendering used for operator-facing messages: "<message> [<context>]".
std::string describeError(const Error& error);

}
