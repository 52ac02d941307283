#pragma once

#include "sconv/core/result.hpp"

#include <string>

namespace sconv {

enum class ErrorKind {
    SourceReadError,        ///< Origin read failed after bounded retries
    ConverterLaunchError,   ///< Converter executable could not be started
    ConverterExitError,     ///< Converter exited non-zero or produced nothing
    ConverterInputClosed,   ///< Converter stopped reading its input (informational)
    DestinationWriteError,  ///< Destination rejected a chunk after bounded retries
    SizeThresholdExceeded,  ///< Informational only, never a failure outcome
    CancellationRequested,
    InvalidConfig,
    InternalError           ///< Unexpected exception or broken invariant inside the pipeline
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceReadError: return "SourceReadError";
        case ErrorKind::ConverterLaunchError: return "ConverterLaunchError";
        case ErrorKind::ConverterExitError: return "ConverterExitError";
        case ErrorKind::ConverterInputClosed: return "ConverterInputClosed";
        case ErrorKind::DestinationWriteError: return "DestinationWriteError";
        case ErrorKind::SizeThresholdExceeded: return "SizeThresholdExceeded";
        case ErrorKind::CancellationRequested: return "CancellationRequested";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::InternalError: return "InternalError";
    }
    return "Unknown";
}

struct PipelineError {
    ErrorKind kind = ErrorKind::ConverterExitError;
    std::string message;

    std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

template<typename T>
using PipelineResult = Result<T, PipelineError>;

template<typename T>
PipelineResult<T> Fail(ErrorKind kind, std::string message) {
    return Err<T>(PipelineError{kind, std::move(message)});
}

} // namespace sconv
