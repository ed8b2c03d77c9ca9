/**
 * @file errors.cpp
 * @brief Error implementations for CanvaSDK C++
 */

#include "canvasdk/errors.hpp"

namespace canvasdk {

std::string auth_error_kind_to_string(AuthErrorKind kind) {
    switch (kind) {
        case AuthErrorKind::Unauthenticated: return "unauthenticated";
        case AuthErrorKind::InvalidState: return "invalid_state";
        case AuthErrorKind::InvalidGrant: return "invalid_grant";
        case AuthErrorKind::RefreshFailed: return "refresh_failed";
        case AuthErrorKind::Unauthorized: return "unauthorized";
        default: return "unknown";
    }
}

} // namespace canvasdk
