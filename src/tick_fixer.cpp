#include "tick_fixer.hpp"
#include <QDebug>

TickFixer::TickFixer(const TickFixerConfig& config, NetworkEnvironment* network, QObject* parent)
    : QObject(parent),
      m_config(config.clamped()),
      m_resolver(network, m_config.allowPublicFallback)
{}

TickFixer::~TickFixer() {
    shutDown();
}

bool TickFixer::startUp(bool loggedIn) {
    if (m_started)
        return m_keepalive.isRunning();
    m_started = true;
    m_loggedIn = loggedIn;
    m_manualPause = false;

    m_tracker = std::make_unique<TickQualityTracker>(m_config.tickSampleSize, m_config.tickQualityThresholdMs);
    qInfo() << "Tick Fixer started (samples" << m_config.tickSampleSize
            << ", threshold" << m_config.tickQualityThresholdMs << "ms)";

    return startKeepalive();
}

void TickFixer::shutDown() {
    if (!m_started)
        return;
    m_started = false;
    m_keepalive.shutdown();
    m_tracker.reset();
    qInfo() << "Tick Fixer stopped";
}

bool TickFixer::startKeepalive() {
    const QHostAddress target = m_resolver.resolve(m_config.keepaliveTarget);
    if (target.isNull()) {
        qCritical() << "No keepalive target available, keepalive is off.";
        emit keepaliveUnavailable();
        return false;
    }

    if (!m_keepalive.configure(target, quint16(m_config.keepalivePort), m_config.keepaliveIntervalMs))
        return m_keepalive.isRunning();
    applyPausePolicy();
    if (!m_keepalive.start()) {
        emit keepaliveUnavailable();
        return false;
    }
    return true;
}

void TickFixer::applyConfig(const TickFixerConfig& config) {
    const TickFixerConfig next = config.clamped();
    const TickFixerConfig previous = m_config;
    m_config = next;
    if (!m_started)
        return;

    if (next.keepaliveIntervalMs != previous.keepaliveIntervalMs)
        m_keepalive.setInterval(next.keepaliveIntervalMs);

    m_resolver.setAllowPublicFallback(next.allowPublicFallback);
    if (next.keepaliveTarget != previous.keepaliveTarget || next.keepalivePort != previous.keepalivePort
        || next.allowPublicFallback != previous.allowPublicFallback) {
        if (m_keepalive.isRunning()) {
            const QHostAddress target = m_resolver.resolve(next.keepaliveTarget);
            if (target.isNull())
                qWarning() << "Keeping previous keepalive target, could not resolve" << next.keepaliveTarget;
            else
                m_keepalive.setTarget(target, quint16(next.keepalivePort));
        } else if (!startKeepalive()) {
            qWarning() << "Keepalive still off after target change to" << next.keepaliveTarget;
        }
        // Resolution blocks this thread (DNS, probe), so ticks queued behind it
        // arrive bunched up. Don't let that land in the samples.
        if (m_tracker)
            m_tracker->reset();
    }

    if (next.tickSampleSize != previous.tickSampleSize) {
        m_tracker = std::make_unique<TickQualityTracker>(next.tickSampleSize, next.tickQualityThresholdMs);
        qInfo() << "Tick sample size changed to" << next.tickSampleSize << ", tracker replaced.";
    } else if (next.tickQualityThresholdMs != previous.tickQualityThresholdMs && m_tracker) {
        m_tracker->setThresholdMs(next.tickQualityThresholdMs);
    }

    if (next.onlyWhenLoggedIn != previous.onlyWhenLoggedIn)
        applyPausePolicy();
}

void TickFixer::onTick() {
    if (m_tracker)
        m_tracker->recordTick();
}

void TickFixer::onSessionBoundary() {
    if (m_tracker)
        m_tracker->reset();
}

void TickFixer::onLoggedInChanged(bool loggedIn) {
    m_loggedIn = loggedIn;
    applyPausePolicy();
}

void TickFixer::pauseKeepalive() {
    m_manualPause = true;
    applyPausePolicy();
}

void TickFixer::unpauseKeepalive() {
    m_manualPause = false;
    applyPausePolicy();
}

void TickFixer::applyPausePolicy() {
    const bool shouldPause = m_manualPause || (m_config.onlyWhenLoggedIn && !m_loggedIn);
    if (shouldPause)
        m_keepalive.pause();
    else
        m_keepalive.unpause();
}

TickFixerStatus TickFixer::status() const {
    TickFixerStatus status;
    if (m_tracker) {
        status.hasTracker = true;
        status.waiting = m_tracker->isWaiting();
        status.quality = m_tracker->quality();
        status.averageMs = m_tracker->averageMs();
        status.jitterMs = m_tracker->jitterMs();
        status.lastDeltaMs = m_tracker->lastDeltaMs();
        status.sampleCount = m_tracker->sampleCount();
    }

    if (!m_keepalive.isRunning())
        status.keepalive = KeepaliveState::OFF;
    else if (m_keepalive.isPaused())
        status.keepalive = KeepaliveState::PAUSED;
    else
        status.keepalive = KeepaliveState::ACTIVE;
    status.target = m_keepalive.target();
    status.intervalMs = m_keepalive.intervalMs();
    status.packetsSent = m_keepalive.totalSent();
    status.sendErrors = m_keepalive.totalErrors();
    return status;
}
