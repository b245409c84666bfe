/* PURPOSE
 * Sends a steady stream of single-byte UDP datagrams to a local target so the
 * Wi-Fi radio never sits idle long enough to drop into power-save polling.
 *
 * The sender runs on its own thread. Reconfiguration (interval, target, pause)
 * may come from any thread and takes effect on the next fire.
*/

#pragma once
#include <QObject>
#include <QMutex>
#include <QHostAddress>
#include <atomic>
#include <memory>
#include "types.hpp"

class QThread;
class QUdpSocket;
class Heartbeat;

class KeepaliveScheduler : public QObject {
    Q_OBJECT
public:
    static constexpr int MIN_INTERVAL_MS = 10;
    static constexpr int MAX_INTERVAL_MS = 200;
    static constexpr int DEFAULT_INTERVAL_MS = 50;
    static constexpr quint16 DEFAULT_PORT = 9;  // discard service
    static constexpr unsigned long SHUTDOWN_GRACE_MS = 2000;
    static constexpr quint64 ERROR_LOG_EVERY = 100;

    explicit KeepaliveScheduler(QObject* parent = nullptr);
    ~KeepaliveScheduler() override;

    static int clampInterval(int ms);

    // Only honoured while stopped.
    bool configure(const QHostAddress& target, quint16 port, int intervalMs);

    bool start();
    void shutdown();

    void pause();
    void unpause();
    void setInterval(int ms);
    void setTarget(const QHostAddress& address, quint16 port);

    bool isRunning() const { return m_running.load(); }
    bool isPaused() const { return m_paused.load(); }
    int intervalMs() const { return m_intervalMs.load(); }
    Destination target() const;
    quint64 totalSent() const { return m_totalSent.load(); }
    quint64 totalErrors() const { return m_totalErrors.load(); }

signals:
    void started();
    void stopped();

private:
    void sendKeepalive();

    mutable QMutex m_lifecycleMutex;
    QThread* m_thread = nullptr;
    Heartbeat* m_heartbeat = nullptr;
    QUdpSocket* m_socket = nullptr;

    std::shared_ptr<const Destination> m_destination;
    std::atomic<int> m_intervalMs{DEFAULT_INTERVAL_MS};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_paused{false};
    std::atomic<quint64> m_totalSent{0};
    std::atomic<quint64> m_totalErrors{0};
};
