#include "session_tracker.hpp"
#include <QDebug>

SessionTracker::SessionTracker(QObject* parent)
    : QObject(parent),
      m_state(SessionState::LOGIN_SCREEN)
{}

void SessionTracker::setState(SessionState newState) {
    if (m_state == newState)
        return;

    const bool wasLoggedIn = isLoggedIn();
    m_state = newState;
    emit stateChanged(m_state);
    qDebug() << "SessionTracker -> new state:" << sessionStateName(m_state);

    if (newState == SessionState::LOGGED_IN || newState == SessionState::HOPPING)
        emit sessionBoundary();

    if (wasLoggedIn != isLoggedIn())
        emit loggedInChanged(isLoggedIn());
}
