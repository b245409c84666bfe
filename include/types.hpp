/* PURPOSE:
 * Define shared enums and structs used by the keepalive, the session tracker and status reporting.
*/

#pragma once
#include <QHostAddress>
#include <QString>
#include <QtGlobal>

enum class SessionState {
    LOGIN_SCREEN,
    LOGGING_IN,
    LOADING,
    LOGGED_IN,
    HOPPING,
    CONNECTION_LOST
};

enum class KeepaliveState {
    OFF,
    PAUSED,
    ACTIVE
};

struct Destination {
    QHostAddress address;
    quint16 port = 0;
};

// Snapshot polled by status consumers. Never fed back into the core.
struct TickFixerStatus {
    bool hasTracker = false;
    bool waiting = true;
    double quality = 100.0;
    double averageMs = 600.0;
    double jitterMs = 0.0;
    qint64 lastDeltaMs = -1;
    int sampleCount = 0;

    KeepaliveState keepalive = KeepaliveState::OFF;
    Destination target;
    int intervalMs = 0;
    quint64 packetsSent = 0;
    quint64 sendErrors = 0;
};

QString sessionStateName(SessionState state);
bool sessionStateFromName(const QString& name, SessionState* out);
QString keepaliveStateName(KeepaliveState state);
