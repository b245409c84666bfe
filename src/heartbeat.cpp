#include "heartbeat.hpp"
#include <QDebug>

Heartbeat::Heartbeat(QObject* parent)
    : QObject(parent),
      m_timer(new QTimer(this))
{
    // CoarseTimer would let a 10ms period drift by up to 5%
    m_timer->setTimerType(Qt::PreciseTimer);
    connect(m_timer, &QTimer::timeout, this, &Heartbeat::tick);
}

void Heartbeat::start(int intervalMs) {
    if (!m_timer->isActive()) {
        m_timer->start(intervalMs);
        emit tick();
        qDebug() << "Heartbeat started at" << intervalMs << "ms interval.";
    }
}

// Restarts the period from now, so the next fire lands one new interval later.
void Heartbeat::setInterval(int intervalMs) {
    if (m_timer->interval() == intervalMs)
        return;
    m_timer->setInterval(intervalMs);
    qDebug() << "Heartbeat rescheduled at" << intervalMs << "ms interval.";
}

void Heartbeat::stop() {
    if (m_timer->isActive()) {
        m_timer->stop();
        qDebug() << "Heartbeat stopped.";
    }
}
