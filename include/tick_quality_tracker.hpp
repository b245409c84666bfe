/* PURPOSE:
 * Measure how regular the 600ms game tick is.
 *
 * Keeps a ring buffer of the most recent tick-to-tick deltas and derives quality,
 * average and jitter from it on demand. The first ticks after a reset are thrown
 * away since login and world hops always produce a burst of irregular ticks.
 *
 * recordTick() must come from a single thread. The getters can be called from any
 * thread at any time; they may see a state one sample behind.
*/

#pragma once
#include <QtGlobal>
#include <atomic>
#include <functional>
#include <memory>

class TickQualityTracker {
public:
    static constexpr qint64 IDEAL_TICK_MS = 600;
    static constexpr int WARMUP_TICKS = 15;
    static constexpr int MIN_SAMPLE_SIZE = 10;
    static constexpr int MAX_SAMPLE_SIZE = 500;
    static constexpr int DEFAULT_SAMPLE_SIZE = 100;
    static constexpr int MIN_THRESHOLD_MS = 5;
    static constexpr int MAX_THRESHOLD_MS = 100;
    static constexpr int DEFAULT_THRESHOLD_MS = 30;

    // Monotonic time in nanoseconds.
    using Clock = std::function<qint64()>;

    TickQualityTracker(int sampleSize, int thresholdMs, Clock clock = Clock());
    TickQualityTracker(const TickQualityTracker&) = delete;
    TickQualityTracker& operator=(const TickQualityTracker&) = delete;

    void recordTick();
    void reset();

    void setThresholdMs(int thresholdMs) { m_thresholdMs.store(thresholdMs, std::memory_order_relaxed); }
    int thresholdMs() const { return m_thresholdMs.load(std::memory_order_relaxed); }

    bool isWaiting() const { return m_warmupRemaining.load(std::memory_order_relaxed) > 0; }
    int capacity() const { return m_capacity; }
    int sampleCount() const { return m_count.load(std::memory_order_acquire); }

    double quality() const;
    double averageMs() const;
    double jitterMs() const;
    qint64 lastDeltaMs() const;

private:
    double averageOver(int count) const;

    const int m_capacity;
    std::unique_ptr<std::atomic<qint64>[]> m_deltas;
    Clock m_clock;

    // writer-only
    int m_head = 0;
    qint64 m_lastTickNs = 0;
    bool m_haveLastTick = false;

    std::atomic<int> m_count{0};
    std::atomic<int> m_lastIndex{-1};
    std::atomic<int> m_thresholdMs;
    std::atomic<int> m_warmupRemaining{WARMUP_TICKS};
};
