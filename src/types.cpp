#include "types.hpp"

QString sessionStateName(SessionState state) {
    switch (state) {
    case SessionState::LOGIN_SCREEN:    return QStringLiteral("LOGIN_SCREEN");
    case SessionState::LOGGING_IN:      return QStringLiteral("LOGGING_IN");
    case SessionState::LOADING:         return QStringLiteral("LOADING");
    case SessionState::LOGGED_IN:       return QStringLiteral("LOGGED_IN");
    case SessionState::HOPPING:         return QStringLiteral("HOPPING");
    case SessionState::CONNECTION_LOST: return QStringLiteral("CONNECTION_LOST");
    }
    return QStringLiteral("UNKNOWN");
}

bool sessionStateFromName(const QString& name, SessionState* out) {
    const QString upper = name.trimmed().toUpper();
    if (upper == "LOGIN_SCREEN") *out = SessionState::LOGIN_SCREEN;
    else if (upper == "LOGGING_IN") *out = SessionState::LOGGING_IN;
    else if (upper == "LOADING") *out = SessionState::LOADING;
    else if (upper == "LOGGED_IN") *out = SessionState::LOGGED_IN;
    else if (upper == "HOPPING") *out = SessionState::HOPPING;
    else if (upper == "CONNECTION_LOST") *out = SessionState::CONNECTION_LOST;
    else return false;
    return true;
}

QString keepaliveStateName(KeepaliveState state) {
    switch (state) {
    case KeepaliveState::OFF:    return QStringLiteral("OFF");
    case KeepaliveState::PAUSED: return QStringLiteral("PAUSED");
    case KeepaliveState::ACTIVE: return QStringLiteral("ACTIVE");
    }
    return QStringLiteral("OFF");
}
