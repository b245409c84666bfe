#include "status_report.hpp"
#include "tick_quality_tracker.hpp"
#include <QDebug>
#include <cstdlib>
#include <utility>

StatusReport::StatusReport(StatusSource status, ThresholdSource threshold, QObject* parent)
    : QObject(parent),
      m_status(std::move(status)),
      m_threshold(std::move(threshold)),
      m_timer(new QTimer(this))
{
    connect(m_timer, &QTimer::timeout, this, &StatusReport::report);
}

void StatusReport::start(int intervalMs) {
    if (intervalMs <= 0) {
        stop();
        return;
    }
    m_timer->start(intervalMs);
}

void StatusReport::stop() {
    m_timer->stop();
}

QualityGrade StatusReport::gradeFor(double quality) {
    if (quality >= 95.0) return QualityGrade::GOOD;
    if (quality >= 80.0) return QualityGrade::FAIR;
    if (quality >= 60.0) return QualityGrade::POOR;
    return QualityGrade::BAD;
}

QString StatusReport::gradeName(QualityGrade grade) {
    switch (grade) {
    case QualityGrade::GOOD: return QStringLiteral("GOOD");
    case QualityGrade::FAIR: return QStringLiteral("FAIR");
    case QualityGrade::POOR: return QStringLiteral("POOR");
    case QualityGrade::BAD:  return QStringLiteral("BAD");
    }
    return QStringLiteral("BAD");
}

QStringList StatusReport::formatLines(const TickFixerStatus& status, int thresholdMs) {
    QStringList lines;
    lines << QStringLiteral("Tick Fixer");

    if (!status.hasTracker) {
        lines << QStringLiteral("Status: Off");
    } else if (status.waiting) {
        lines << QStringLiteral("Status: Waiting...");
    } else {
        lines << QStringLiteral("Tick Quality: %1% (%2)")
                     .arg(status.quality, 0, 'f', 1)
                     .arg(gradeName(gradeFor(status.quality)));
        lines << QStringLiteral("Avg Tick: %1ms").arg(status.averageMs, 0, 'f', 0);
        QString jitter = QStringLiteral("Jitter: %1ms").arg(status.jitterMs, 0, 'f', 1);
        if (status.jitterMs > JITTER_WARN_MS)
            jitter += QStringLiteral(" (high)");
        lines << jitter;
        if (status.lastDeltaMs >= 0) {
            const bool onBeat = std::llabs(status.lastDeltaMs - TickQualityTracker::IDEAL_TICK_MS) <= thresholdMs;
            lines << QStringLiteral("Last Tick: %1ms%2")
                         .arg(status.lastDeltaMs)
                         .arg(onBeat ? QString() : QStringLiteral(" (off-beat)"));
        }
    }

    QString keepalive = QStringLiteral("Keepalive: %1").arg(keepaliveStateName(status.keepalive));
    if (status.keepalive != KeepaliveState::OFF) {
        keepalive += QStringLiteral(" -> %1:%2 every %3ms, sent %4, errors %5")
                         .arg(status.target.address.toString())
                         .arg(status.target.port)
                         .arg(status.intervalMs)
                         .arg(status.packetsSent)
                         .arg(status.sendErrors);
    }
    lines << keepalive;
    return lines;
}

void StatusReport::report() {
    const QStringList lines = formatLines(m_status(), m_threshold());
    qInfo().noquote() << lines.join(QStringLiteral(" | "));
}
