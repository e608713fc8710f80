#include "speccle/source_error.hpp"

#include <cerrno>

namespace speccle {

const char* sourceErrorName(SourceError error) {
    switch (error) {
    case SourceError::SourceUnavailable:
        return "SourceUnavailable";
    case SourceError::PermissionDenied:
        return "PermissionDenied";
    case SourceError::InvalidValue:
        return "InvalidValue";
    case SourceError::UnsupportedPlatform:
        return "UnsupportedPlatform";
    }
    return "SourceUnavailable";
}

SourceException::SourceException(SourceError error, const std::string& message)
    : std::runtime_error(message), error_(error) {}

SourceError sourceErrorFromErrno(int err) {
    if (err == EACCES || err == EPERM) {
        return SourceError::PermissionDenied;
    }
    return SourceError::SourceUnavailable;
}

} // namespace speccle
