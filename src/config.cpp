#include "config.hpp"
#include "keepalive_scheduler.hpp"
#include "tick_quality_tracker.hpp"
#include "target_resolver.hpp"
#include <QSettings>
#include <QDebug>

namespace {
const char KEY_INTERVAL[] = "keepalive/intervalMs";
const char KEY_TARGET[] = "keepalive/target";
const char KEY_PORT[] = "keepalive/port";
const char KEY_ONLY_LOGGED_IN[] = "keepalive/onlyWhenLoggedIn";
const char KEY_PUBLIC_FALLBACK[] = "keepalive/allowPublicFallback";
const char KEY_SAMPLE_SIZE[] = "tracker/sampleSize";
const char KEY_THRESHOLD[] = "tracker/thresholdMs";
const char KEY_REPORT_INTERVAL[] = "status/reportIntervalMs";

int boundedInt(const QSettings& settings, const char* key, int fallback, int lo, int hi) {
    const QVariant raw = settings.value(QLatin1String(key), fallback);
    bool ok = false;
    const int value = raw.toInt(&ok);
    if (!ok) {
        qWarning() << "Config" << key << "is not a number:" << raw.toString() << "- using" << fallback;
        return fallback;
    }
    if (value < lo || value > hi) {
        const int fixed = qBound(lo, value, hi);
        qWarning() << "Config" << key << "=" << value << "out of range [" << lo << "," << hi << "], using" << fixed;
        return fixed;
    }
    return value;
}
}

TickFixerConfig::TickFixerConfig()
    : keepaliveIntervalMs(KeepaliveScheduler::DEFAULT_INTERVAL_MS),
      keepaliveTarget(QString::fromLatin1(TargetResolver::GATEWAY_KEYWORD)),
      keepalivePort(KeepaliveScheduler::DEFAULT_PORT),
      onlyWhenLoggedIn(true),
      allowPublicFallback(true),
      tickSampleSize(TickQualityTracker::DEFAULT_SAMPLE_SIZE),
      tickQualityThresholdMs(TickQualityTracker::DEFAULT_THRESHOLD_MS),
      reportIntervalMs(DEFAULT_REPORT_INTERVAL_MS)
{}

TickFixerConfig TickFixerConfig::clamped() const {
    TickFixerConfig out = *this;
    out.keepaliveIntervalMs = KeepaliveScheduler::clampInterval(keepaliveIntervalMs);
    out.keepaliveTarget = keepaliveTarget.trimmed();
    if (out.keepaliveTarget.isEmpty())
        out.keepaliveTarget = QString::fromLatin1(TargetResolver::GATEWAY_KEYWORD);
    out.keepalivePort = qBound(MIN_PORT, keepalivePort, MAX_PORT);
    out.tickSampleSize = qBound(TickQualityTracker::MIN_SAMPLE_SIZE, tickSampleSize,
                                TickQualityTracker::MAX_SAMPLE_SIZE);
    out.tickQualityThresholdMs = qBound(TickQualityTracker::MIN_THRESHOLD_MS, tickQualityThresholdMs,
                                        TickQualityTracker::MAX_THRESHOLD_MS);
    out.reportIntervalMs = qBound(0, reportIntervalMs, MAX_REPORT_INTERVAL_MS);
    return out;
}

TickFixerConfig TickFixerConfig::load(QSettings& settings) {
    const TickFixerConfig defaults;
    TickFixerConfig config;

    config.keepaliveIntervalMs = boundedInt(settings, KEY_INTERVAL, defaults.keepaliveIntervalMs,
                                            KeepaliveScheduler::MIN_INTERVAL_MS,
                                            KeepaliveScheduler::MAX_INTERVAL_MS);
    config.keepaliveTarget = settings.value(QLatin1String(KEY_TARGET), defaults.keepaliveTarget).toString();
    config.keepalivePort = boundedInt(settings, KEY_PORT, defaults.keepalivePort, MIN_PORT, MAX_PORT);
    config.onlyWhenLoggedIn = settings.value(QLatin1String(KEY_ONLY_LOGGED_IN), defaults.onlyWhenLoggedIn).toBool();
    config.allowPublicFallback = settings.value(QLatin1String(KEY_PUBLIC_FALLBACK), defaults.allowPublicFallback).toBool();
    config.tickSampleSize = boundedInt(settings, KEY_SAMPLE_SIZE, defaults.tickSampleSize,
                                       TickQualityTracker::MIN_SAMPLE_SIZE,
                                       TickQualityTracker::MAX_SAMPLE_SIZE);
    config.tickQualityThresholdMs = boundedInt(settings, KEY_THRESHOLD, defaults.tickQualityThresholdMs,
                                               TickQualityTracker::MIN_THRESHOLD_MS,
                                               TickQualityTracker::MAX_THRESHOLD_MS);
    config.reportIntervalMs = boundedInt(settings, KEY_REPORT_INTERVAL, defaults.reportIntervalMs,
                                         0, MAX_REPORT_INTERVAL_MS);
    return config.clamped();
}

void TickFixerConfig::save(QSettings& settings) const {
    settings.setValue(QLatin1String(KEY_INTERVAL), keepaliveIntervalMs);
    settings.setValue(QLatin1String(KEY_TARGET), keepaliveTarget);
    settings.setValue(QLatin1String(KEY_PORT), keepalivePort);
    settings.setValue(QLatin1String(KEY_ONLY_LOGGED_IN), onlyWhenLoggedIn);
    settings.setValue(QLatin1String(KEY_PUBLIC_FALLBACK), allowPublicFallback);
    settings.setValue(QLatin1String(KEY_SAMPLE_SIZE), tickSampleSize);
    settings.setValue(QLatin1String(KEY_THRESHOLD), tickQualityThresholdMs);
    settings.setValue(QLatin1String(KEY_REPORT_INTERVAL), reportIntervalMs);
}

bool TickFixerConfig::operator==(const TickFixerConfig& other) const {
    return keepaliveIntervalMs == other.keepaliveIntervalMs
        && keepaliveTarget == other.keepaliveTarget
        && keepalivePort == other.keepalivePort
        && onlyWhenLoggedIn == other.onlyWhenLoggedIn
        && allowPublicFallback == other.allowPublicFallback
        && tickSampleSize == other.tickSampleSize
        && tickQualityThresholdMs == other.tickQualityThresholdMs
        && reportIntervalMs == other.reportIntervalMs;
}
