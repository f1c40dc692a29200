#pragma once

#include <stdexcept>
#include <string>

enum class CaptureErrorKind {
    DeviceUnavailable,
    PermissionDenied,
    UnsupportedContext,
    DeviceFailure
};

inline const char* GetCaptureErrorName(CaptureErrorKind kind) {
    switch (kind) {
        case CaptureErrorKind::DeviceUnavailable:  return "DeviceUnavailable";
        case CaptureErrorKind::PermissionDenied:   return "PermissionDenied";
        case CaptureErrorKind::UnsupportedContext: return "UnsupportedContext";
        case CaptureErrorKind::DeviceFailure:      return "DeviceFailure";
    }
    return "Unknown";
}

class CaptureError : public std::runtime_error {
public:
    CaptureError(CaptureErrorKind kind, const std::string& message)
        : std::runtime_error(message), _kind(kind) {}

    CaptureErrorKind GetKind() const { return _kind; }

private:
    CaptureErrorKind _kind;
};
