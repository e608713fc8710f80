#pragma once

#include <stdexcept>
#include <string>

namespace speccle {

enum class SourceError {
    SourceUnavailable,
    PermissionDenied,
    InvalidValue,
    UnsupportedPlatform
};

const char* sourceErrorName(SourceError error);

// Thrown by probes to say why a source could not answer.
class SourceException : public std::runtime_error {
public:
    SourceException(SourceError error, const std::string& message);

    SourceError error() const noexcept { return error_; }

private:
    SourceError error_;
};

// Maps an errno value from a failed read to the matching source error.
SourceError sourceErrorFromErrno(int err);

} // namespace speccle
