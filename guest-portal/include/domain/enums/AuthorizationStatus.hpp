#pragma once

#include <string>

namespace portal::domain {

enum class AuthorizationStatus {
    AUTHORIZED,
    LOGIN_FAILED,
    AUTHORIZATION_FAILED,
    TRANSPORT_ERROR
};

inline std::string toString(AuthorizationStatus status) {
    switch (status) {
        case AuthorizationStatus::AUTHORIZED: return "AUTHORIZED";
        case AuthorizationStatus::LOGIN_FAILED: return "LOGIN_FAILED";
        case AuthorizationStatus::AUTHORIZATION_FAILED: return "AUTHORIZATION_FAILED";
        case AuthorizationStatus::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace portal::domain
