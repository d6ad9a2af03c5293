#pragma once

// Explicit success/failure values for pipeline stages.
// Every stage returns a Result and the job runner propagates it; exceptions
// from third-party code are converted where they are caught.

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace LabPBR {

enum class ErrorKind {
    UploadError,        // Missing or empty input, rejected before a job exists
    SettingsError,      // Settings schema violation, rejected before a job exists
    DepthUnavailable,   // Depth estimator exhausted retries or returned a non-image
    DecodeError,        // Corrupt or unsupported image data
    InvalidDimensions,  // Decoded image has no width or height
    ProcessingError,    // Anything else that goes wrong inside a job
    Cancelled
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UploadError:       return "UploadError";
        case ErrorKind::SettingsError:     return "SettingsError";
        case ErrorKind::DepthUnavailable:  return "DepthUnavailable";
        case ErrorKind::DecodeError:       return "DecodeError";
        case ErrorKind::InvalidDimensions: return "InvalidDimensions";
        case ErrorKind::ProcessingError:   return "ProcessingError";
        case ErrorKind::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

struct ProcessingError {
    ErrorKind kind = ErrorKind::ProcessingError;
    std::string message;

    std::string describe() const {
        return std::string(errorKindName(kind)) + ": " + message;
    }
};

/**
 * Result<T> - either a value or a ProcessingError.
 *
 * Usage:
 *   Result<PixelBuffer> decoded = ImageCodec::decode(bytes);
 *   if (!decoded) return Result<MaterialMapSet>::failure(decoded.error());
 *   const PixelBuffer& image = decoded.value();
 */
template<typename T>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result failure(ProcessingError error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    static Result failure(ErrorKind kind, std::string message) {
        return failure(ProcessingError{kind, std::move(message)});
    }

    bool isOk() const { return state_.index() == 0; }
    explicit operator bool() const { return isOk(); }

    const T& value() const& { return std::get<0>(state_); }
    T& value() & { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    const ProcessingError& error() const { return std::get<1>(state_); }

private:
    template<size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : state_(tag, std::forward<U>(payload)) {}

    std::variant<T, ProcessingError> state_;
};

// Status - a Result with no payload
class Status {
public:
    static Status ok() { return Status(); }

    static Status failure(ProcessingError error) {
        Status s;
        s.error_ = std::move(error);
        return s;
    }

    static Status failure(ErrorKind kind, std::string message) {
        return failure(ProcessingError{kind, std::move(message)});
    }

    bool isOk() const { return !error_.has_value(); }
    explicit operator bool() const { return isOk(); }

    const ProcessingError& error() const { return *error_; }

private:
    std::optional<ProcessingError> error_;
};

} // namespace LabPBR
