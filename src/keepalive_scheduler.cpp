#include "keepalive_scheduler.hpp"
#include "heartbeat.hpp"
#include <QThread>
#include <QUdpSocket>
#include <QMutexLocker>
#include <QDebug>
#include <algorithm>

namespace {
const char KEEPALIVE_PAYLOAD[1] = {0x00};
}

KeepaliveScheduler::KeepaliveScheduler(QObject* parent)
    : QObject(parent)
{}

KeepaliveScheduler::~KeepaliveScheduler() {
    shutdown();
}

int KeepaliveScheduler::clampInterval(int ms) {
    return std::max(MIN_INTERVAL_MS, std::min(MAX_INTERVAL_MS, ms));
}

bool KeepaliveScheduler::configure(const QHostAddress& target, quint16 port, int intervalMs) {
    QMutexLocker lock(&m_lifecycleMutex);
    if (m_running.load()) {
        qWarning() << "Keepalive configure() ignored while running.";
        return false;
    }
    std::atomic_store(&m_destination, std::make_shared<const Destination>(Destination{target, port}));
    m_intervalMs.store(clampInterval(intervalMs));
    return true;
}

bool KeepaliveScheduler::start() {
    QMutexLocker lock(&m_lifecycleMutex);
    if (m_running.load())
        return true;

    auto* socket = new QUdpSocket();
    if (!socket->bind(QHostAddress::Any, 0) && !socket->bind(QHostAddress::AnyIPv4, 0)) {
        qWarning() << "Failed to create keepalive socket:" << socket->errorString();
        delete socket;
        return false;
    }

    auto* heartbeat = new Heartbeat();
    auto* thread = new QThread();
    thread->setObjectName(QStringLiteral("wifi-keepalive"));
    socket->moveToThread(thread);
    heartbeat->moveToThread(thread);

    // All three run on the worker thread: the timer fires there, the send
    // happens there, and teardown happens there once the event loop exits.
    connect(heartbeat, &Heartbeat::tick, heartbeat, [this] { sendKeepalive(); });
    connect(thread, &QThread::started, heartbeat, [this, heartbeat] {
        heartbeat->start(m_intervalMs.load());
    });
    connect(thread, &QThread::finished, heartbeat, [heartbeat, socket] {
        heartbeat->stop();
        socket->close();
    }, Qt::DirectConnection);

    m_socket = socket;
    m_heartbeat = heartbeat;
    m_thread = thread;
    m_running.store(true);
    thread->start();

    const Destination dest = target();
    qInfo() << "Wi-Fi keepalive started (interval" << m_intervalMs.load() << "ms, target"
            << (dest.address.isNull() ? QStringLiteral("null") : dest.address.toString())
            << ":" << dest.port << ")";

    lock.unlock();
    emit started();
    return true;
}

void KeepaliveScheduler::shutdown() {
    QMutexLocker lock(&m_lifecycleMutex);
    if (!m_running.load())
        return;
    if (QThread::currentThread() == m_thread) {
        qWarning() << "Keepalive shutdown() called from its own thread, ignored.";
        return;
    }
    m_running.store(false);

    m_thread->quit();
    if (!m_thread->wait(SHUTDOWN_GRACE_MS)) {
        qWarning() << "Keepalive thread did not stop within" << SHUTDOWN_GRACE_MS << "ms, terminating.";
        m_thread->terminate();
        m_thread->wait();
    }

    // The thread has finished, nothing else touches these now.
    delete m_heartbeat;
    delete m_socket;
    delete m_thread;
    m_heartbeat = nullptr;
    m_socket = nullptr;
    m_thread = nullptr;

    qInfo() << "Wi-Fi keepalive stopped (sent" << m_totalSent.load() << "packets,"
            << m_totalErrors.load() << "errors)";

    lock.unlock();
    emit stopped();
}

void KeepaliveScheduler::pause() {
    if (!m_paused.exchange(true))
        qDebug() << "Keepalive paused.";
}

void KeepaliveScheduler::unpause() {
    if (m_paused.exchange(false))
        qDebug() << "Keepalive resumed.";
}

void KeepaliveScheduler::setInterval(int ms) {
    const int clamped = clampInterval(ms);
    QMutexLocker lock(&m_lifecycleMutex);
    m_intervalMs.store(clamped);
    if (!m_running.load() || !m_heartbeat)
        return;

    Heartbeat* heartbeat = m_heartbeat;
    QMetaObject::invokeMethod(heartbeat, [heartbeat, clamped] {
        heartbeat->setInterval(clamped);
    }, Qt::QueuedConnection);
}

void KeepaliveScheduler::setTarget(const QHostAddress& address, quint16 port) {
    std::atomic_store(&m_destination, std::make_shared<const Destination>(Destination{address, port}));
    qDebug() << "Keepalive target set to" << address.toString() << ":" << port;
}

Destination KeepaliveScheduler::target() const {
    const std::shared_ptr<const Destination> dest = std::atomic_load(&m_destination);
    return dest ? *dest : Destination{};
}

void KeepaliveScheduler::sendKeepalive() {
    if (m_paused.load() || !m_running.load())
        return;

    const std::shared_ptr<const Destination> dest = std::atomic_load(&m_destination);
    if (!dest || dest->address.isNull())
        return;

    const qint64 written = m_socket->writeDatagram(KEEPALIVE_PAYLOAD, sizeof(KEEPALIVE_PAYLOAD),
                                                   dest->address, dest->port);
    if (written == qint64(sizeof(KEEPALIVE_PAYLOAD))) {
        m_totalSent.fetch_add(1);
        return;
    }

    // The next fire is the retry. Only log a sample so a dead route can't flood the log.
    const quint64 errors = m_totalErrors.fetch_add(1) + 1;
    if (errors % ERROR_LOG_EVERY == 1)
        qDebug() << "Keepalive send error (total errors:" << errors << "):" << m_socket->errorString();
}
