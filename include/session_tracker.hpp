/* PURPOSE:
 * Follow the client's session state and turn raw state changes into the two
 * notifications the rest of the app cares about: logged in/out, and session boundaries.
*/

#pragma once
#include <QObject>
#include "types.hpp"

class SessionTracker : public QObject {
    Q_OBJECT
public:
    explicit SessionTracker(QObject* parent = nullptr);
    SessionState currentState() const { return m_state; }
    bool isLoggedIn() const { return m_state == SessionState::LOGGED_IN; }

    void setState(SessionState newState);

signals:
    void stateChanged(SessionState newState);
    void loggedInChanged(bool loggedIn);
    // Login or world hop: tick timing is about to be irregular.
    void sessionBoundary();

private:
    SessionState m_state;
};
