#include "tick_quality_tracker.hpp"
#include <QElapsedTimer>
#include <QDebug>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace {
qint64 monotonicNanos() {
    static QElapsedTimer origin = [] {
        QElapsedTimer timer;
        timer.start();
        return timer;
    }();
    return origin.nsecsElapsed();
}
}

TickQualityTracker::TickQualityTracker(int sampleSize, int thresholdMs, Clock clock)
    : m_capacity(qMax(1, sampleSize)),
      m_deltas(new std::atomic<qint64>[m_capacity]),
      m_clock(clock ? std::move(clock) : Clock(monotonicNanos)),
      m_thresholdMs(thresholdMs)
{
    for (int i = 0; i < m_capacity; ++i)
        m_deltas[i].store(0, std::memory_order_relaxed);
}

void TickQualityTracker::recordTick() {
    const qint64 now = m_clock();
    if (!m_haveLastTick) {
        m_lastTickNs = now;
        m_haveLastTick = true;
        return;
    }

    const qint64 deltaMs = (now - m_lastTickNs) / 1000000;
    m_lastTickNs = now;

    const int warmup = m_warmupRemaining.load(std::memory_order_relaxed);
    if (warmup > 0) {
        m_warmupRemaining.store(warmup - 1, std::memory_order_relaxed);
        return;
    }

    m_deltas[m_head].store(deltaMs, std::memory_order_relaxed);
    m_lastIndex.store(m_head, std::memory_order_relaxed);
    m_head = (m_head + 1) % m_capacity;

    // release pairs with readers' acquire so a counted cell is never read unwritten
    const int count = m_count.load(std::memory_order_relaxed);
    if (count < m_capacity)
        m_count.store(count + 1, std::memory_order_release);
    else
        std::atomic_thread_fence(std::memory_order_release);
}

void TickQualityTracker::reset() {
    m_head = 0;
    m_haveLastTick = false;
    m_lastTickNs = 0;
    m_count.store(0, std::memory_order_release);
    m_lastIndex.store(-1, std::memory_order_relaxed);
    m_warmupRemaining.store(WARMUP_TICKS, std::memory_order_relaxed);
    qDebug() << "Tick quality tracker reset, ignoring the next" << WARMUP_TICKS << "ticks.";
}

// Cells [0, count) are always valid: the ring fills from 0 and only wraps once full.
double TickQualityTracker::quality() const {
    const int count = m_count.load(std::memory_order_acquire);
    if (count == 0)
        return 100.0;

    const qint64 threshold = m_thresholdMs.load(std::memory_order_relaxed);
    int good = 0;
    for (int i = 0; i < count; ++i) {
        const qint64 delta = m_deltas[i].load(std::memory_order_relaxed);
        if (std::llabs(delta - IDEAL_TICK_MS) <= threshold)
            ++good;
    }
    return good * 100.0 / count;
}

double TickQualityTracker::averageMs() const {
    return averageOver(m_count.load(std::memory_order_acquire));
}

double TickQualityTracker::averageOver(int count) const {
    if (count == 0)
        return double(IDEAL_TICK_MS);

    qint64 sum = 0;
    for (int i = 0; i < count; ++i)
        sum += m_deltas[i].load(std::memory_order_relaxed);
    return double(sum) / count;
}

// Population standard deviation.
double TickQualityTracker::jitterMs() const {
    const int count = m_count.load(std::memory_order_acquire);
    if (count < 2)
        return 0.0;

    const double mean = averageOver(count);
    double sumSq = 0.0;
    for (int i = 0; i < count; ++i) {
        const double diff = double(m_deltas[i].load(std::memory_order_relaxed)) - mean;
        sumSq += diff * diff;
    }
    return std::sqrt(sumSq / count);
}

qint64 TickQualityTracker::lastDeltaMs() const {
    if (m_count.load(std::memory_order_acquire) == 0)
        return -1;
    const int index = m_lastIndex.load(std::memory_order_relaxed);
    return index < 0 ? -1 : m_deltas[index].load(std::memory_order_relaxed);
}
