/* Purpose:
 * Abstracts periodic firing for the keepalive worker thread.
 * Lives in whichever thread owns it; every call must come from that thread.
*/

#pragma once
#include <QObject>
#include <QTimer>

class Heartbeat : public QObject {
    Q_OBJECT
public:
    explicit Heartbeat(QObject* parent = nullptr);
    void start(int intervalMs);
    void setInterval(int intervalMs);
    void stop();

signals:
    void tick();

private:
    QTimer* m_timer;
};
