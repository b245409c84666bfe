/* PURPOSE:
 * Line-oriented control input. Whatever watches the game client writes one command
 * per line ("tick", "state LOGGED_IN", "interval 40", ...) and this turns them into signals.
*/

#pragma once
#include <QObject>
#include <QByteArray>
#include <QString>
#include "types.hpp"

class QSocketNotifier;

struct Command {
    enum class Kind {
        INVALID,
        TICK,
        STATE,
        INTERVAL,
        TARGET,
        THRESHOLD,
        SAMPLES,
        PAUSE,
        UNPAUSE,
        STATUS,
        QUIT
    };

    Kind kind = Kind::INVALID;
    SessionState state = SessionState::LOGIN_SCREEN;
    int value = 0;
    QString host;
    int port = -1;  // -1: keep the current port
    QString error;
};

class CommandChannel : public QObject {
    Q_OBJECT
public:
    explicit CommandChannel(int fd, QObject* parent = nullptr);

    static Command parse(const QString& line);

    // Feeds raw input; complete lines are parsed and dispatched. Used by the
    // stdin notifier and directly by tests.
    void feed(const QByteArray& data);

signals:
    void tickObserved();
    void stateReported(SessionState state);
    void intervalRequested(int ms);
    void targetRequested(const QString& host, int port);
    void thresholdRequested(int ms);
    void sampleSizeRequested(int samples);
    void pauseRequested();
    void unpauseRequested();
    void statusRequested();
    void quitRequested();

private slots:
    void readInput();

private:
    void dispatch(const Command& command);

    int m_fd;
    QSocketNotifier* m_notifier = nullptr;
    QByteArray m_pending;
};
