#include <doctest/doctest.h>
#include "tick_quality_tracker.hpp"
#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

namespace {

struct FakeClock {
    qint64 nowNs = 1000000000;
    TickQualityTracker::Clock clock() { return [this] { return nowNs; }; }
    void advanceMs(qint64 ms) { nowNs += ms * 1000000; }
};

// Seed + the whole disregard window, all on a perfect 600ms beat.
void warmUp(TickQualityTracker& tracker, FakeClock& clock) {
    tracker.recordTick();
    for (int i = 0; i < TickQualityTracker::WARMUP_TICKS; ++i) {
        clock.advanceMs(600);
        tracker.recordTick();
    }
}

void feed(TickQualityTracker& tracker, FakeClock& clock, const std::vector<qint64>& deltas) {
    for (qint64 d : deltas) {
        clock.advanceMs(d);
        tracker.recordTick();
    }
}

} // namespace

TEST_CASE("Fresh tracker reports healthy defaults") {
    FakeClock clock;
    TickQualityTracker tracker(100, 30, clock.clock());

    CHECK(tracker.isWaiting());
    CHECK(tracker.capacity() == 100);
    CHECK(tracker.sampleCount() == 0);
    CHECK(tracker.quality() == 100.0);
    CHECK(tracker.averageMs() == 600.0);
    CHECK(tracker.jitterMs() == 0.0);
    CHECK(tracker.lastDeltaMs() == -1);
}

// The first tick only seeds the clock; the 15 deltas after it are discarded.
// So 15 ticks in the tracker is still waiting, the 16th ends warm-up without
// recording, and the 17th produces the first sample.
TEST_CASE("Warm-up swallows 15 ticks after the seed, then recording starts") {
    FakeClock clock;
    TickQualityTracker tracker(100, 30, clock.clock());

    tracker.recordTick();                 // 1: seed
    for (int i = 2; i <= 15; ++i) {
        clock.advanceMs(600);
        tracker.recordTick();
    }
    CHECK(tracker.isWaiting());           // 15 ticks in: still warming up
    CHECK(tracker.sampleCount() == 0);

    clock.advanceMs(600);
    tracker.recordTick();                 // 16: last discarded delta
    CHECK_FALSE(tracker.isWaiting());
    CHECK(tracker.sampleCount() == 0);

    clock.advanceMs(600);
    tracker.recordTick();                 // 17: first recorded delta
    CHECK(tracker.sampleCount() == 1);
    CHECK(tracker.lastDeltaMs() == 600);
}

TEST_CASE("Perfect beat gives full quality and no jitter") {
    FakeClock clock;
    TickQualityTracker tracker(100, 30, clock.clock());
    warmUp(tracker, clock);
    feed(tracker, clock, {600, 600, 600, 600});

    CHECK(tracker.sampleCount() == 4);
    CHECK(tracker.quality() == 100.0);
    CHECK(tracker.averageMs() == 600.0);
    CHECK(tracker.jitterMs() == 0.0);
}

TEST_CASE("Deviations inside the threshold still count as good") {
    FakeClock clock;
    TickQualityTracker tracker(100, 30, clock.clock());
    warmUp(tracker, clock);
    feed(tracker, clock, {600, 630, 570, 600});

    CHECK(tracker.quality() == 100.0);
    CHECK(tracker.averageMs() == doctest::Approx(600.0));
    CHECK(tracker.jitterMs() == doctest::Approx(std::sqrt(450.0)));   // ~21.2
}

TEST_CASE("Deviations outside the threshold are bad ticks") {
    FakeClock clock;
    TickQualityTracker tracker(100, 30, clock.clock());
    warmUp(tracker, clock);
    feed(tracker, clock, {600, 700, 500, 600});

    CHECK(tracker.quality() == 50.0);
    CHECK(tracker.averageMs() == doctest::Approx(600.0));
    CHECK(tracker.jitterMs() == doctest::Approx(std::sqrt(5000.0)));
}

TEST_CASE("Jitter needs at least two samples") {
    FakeClock clock;
    TickQualityTracker tracker(100, 30, clock.clock());
    warmUp(tracker, clock);
    feed(tracker, clock, {900});

    CHECK(tracker.sampleCount() == 1);
    CHECK(tracker.jitterMs() == 0.0);
    CHECK(tracker.averageMs() == 900.0);
    CHECK(tracker.quality() == 0.0);
}

TEST_CASE("Threshold changes re-grade existing samples without touching them") {
    FakeClock clock;
    TickQualityTracker tracker(100, 30, clock.clock());
    warmUp(tracker, clock);
    feed(tracker, clock, {600, 645});

    CHECK(tracker.quality() == 50.0);
    tracker.setThresholdMs(50);
    CHECK(tracker.thresholdMs() == 50);
    CHECK(tracker.quality() == 100.0);
    CHECK(tracker.sampleCount() == 2);
    CHECK(tracker.lastDeltaMs() == 645);
}

TEST_CASE("Ring buffer keeps only the most recent capacity deltas") {
    FakeClock clock;
    TickQualityTracker tracker(10, 30, clock.clock());
    warmUp(tracker, clock);

    feed(tracker, clock, {1000, 1000});                       // pushed out below
    feed(tracker, clock, {600, 600, 600, 600, 600, 600, 600, 600, 600, 610});

    CHECK(tracker.sampleCount() == 10);
    CHECK(tracker.quality() == 100.0);
    CHECK(tracker.averageMs() == doctest::Approx(601.0));
    CHECK(tracker.lastDeltaMs() == 610);
}

TEST_CASE("lastDeltaMs never reports a discarded warm-up delta") {
    FakeClock clock;
    TickQualityTracker tracker(100, 30, clock.clock());

    tracker.recordTick();
    for (int i = 0; i < TickQualityTracker::WARMUP_TICKS; ++i) {
        clock.advanceMs(1200);
        tracker.recordTick();
        CHECK(tracker.lastDeltaMs() == -1);
    }

    feed(tracker, clock, {605});
    CHECK(tracker.lastDeltaMs() == 605);
}

TEST_CASE("reset() drops history and restarts the warm-up window") {
    FakeClock clock;
    TickQualityTracker tracker(100, 30, clock.clock());
    warmUp(tracker, clock);
    feed(tracker, clock, {900, 300, 700});
    REQUIRE(tracker.quality() < 100.0);

    tracker.reset();
    CHECK(tracker.isWaiting());
    CHECK(tracker.sampleCount() == 0);
    CHECK(tracker.quality() == 100.0);
    CHECK(tracker.averageMs() == 600.0);
    CHECK(tracker.lastDeltaMs() == -1);

    // the gap across the reset must not turn into a sample
    clock.advanceMs(30000);
    warmUp(tracker, clock);
    feed(tracker, clock, {600});
    CHECK(tracker.sampleCount() == 1);
    CHECK(tracker.lastDeltaMs() == 600);
}

TEST_CASE("Readers on another thread always see sane statistics") {
    FakeClock clock;
    TickQualityTracker tracker(50, 30, clock.clock());
    warmUp(tracker, clock);

    std::atomic<bool> done{false};
    std::atomic<bool> sane{true};
    std::thread reader([&] {
        while (!done.load()) {
            const double q = tracker.quality();
            const double avg = tracker.averageMs();
            const int count = tracker.sampleCount();
            if (q < 0.0 || q > 100.0 || avg < 0.0 || count < 0 || count > 50)
                sane.store(false);
        }
    });

    for (int i = 0; i < 2000; ++i)
        feed(tracker, clock, {i % 2 ? 590 : 640});
    done.store(true);
    reader.join();

    CHECK(sane.load());
    CHECK(tracker.sampleCount() == 50);
    CHECK(tracker.quality() == 50.0);
}
