/* PURPOSE:
 * Text rendition of the status panel: tick quality, jitter and keepalive state.
 * Read-only; polls a status source on its own cadence and logs the lines.
*/

#pragma once
#include <QObject>
#include <QStringList>
#include <QTimer>
#include <functional>
#include "types.hpp"

enum class QualityGrade {
    GOOD,
    FAIR,
    POOR,
    BAD
};

class StatusReport : public QObject {
    Q_OBJECT
public:
    static constexpr double JITTER_WARN_MS = 30.0;

    using StatusSource = std::function<TickFixerStatus()>;
    using ThresholdSource = std::function<int()>;

    StatusReport(StatusSource status, ThresholdSource threshold, QObject* parent = nullptr);

    void start(int intervalMs);
    void stop();

    static QualityGrade gradeFor(double quality);
    static QString gradeName(QualityGrade grade);
    static QStringList formatLines(const TickFixerStatus& status, int thresholdMs);

public slots:
    void report();

private:
    StatusSource m_status;
    ThresholdSource m_threshold;
    QTimer* m_timer;
};
