#include <doctest/doctest.h>
#include "status_report.hpp"

TEST_CASE("Quality grades follow the 95/80/60 cut-offs") {
    CHECK(StatusReport::gradeFor(100.0) == QualityGrade::GOOD);
    CHECK(StatusReport::gradeFor(95.0) == QualityGrade::GOOD);
    CHECK(StatusReport::gradeFor(94.9) == QualityGrade::FAIR);
    CHECK(StatusReport::gradeFor(80.0) == QualityGrade::FAIR);
    CHECK(StatusReport::gradeFor(60.0) == QualityGrade::POOR);
    CHECK(StatusReport::gradeFor(59.9) == QualityGrade::BAD);
}

TEST_CASE("Warming up shows a waiting line instead of numbers") {
    TickFixerStatus status;
    status.hasTracker = true;
    status.waiting = true;

    const QStringList lines = StatusReport::formatLines(status, 30);
    CHECK(lines.size() == 3);
    CHECK(lines[1] == "Status: Waiting...");
    CHECK(lines[2] == "Keepalive: OFF");
}

TEST_CASE("Live statistics are formatted and flagged") {
    TickFixerStatus status;
    status.hasTracker = true;
    status.waiting = false;
    status.quality = 87.5;
    status.averageMs = 604.4;
    status.jitterMs = 42.26;
    status.lastDeltaMs = 680;
    status.keepalive = KeepaliveState::ACTIVE;
    status.target.address = QHostAddress("192.168.1.1");
    status.target.port = 9;
    status.intervalMs = 50;
    status.packetsSent = 1200;
    status.sendErrors = 3;

    const QStringList lines = StatusReport::formatLines(status, 30);
    REQUIRE(lines.size() == 6);
    CHECK(lines[1] == "Tick Quality: 87.5% (FAIR)");
    CHECK(lines[2] == "Avg Tick: 604ms");
    CHECK(lines[3] == "Jitter: 42.3ms (high)");
    CHECK(lines[4] == "Last Tick: 680ms (off-beat)");
    CHECK(lines[5] == "Keepalive: ACTIVE -> 192.168.1.1:9 every 50ms, sent 1200, errors 3");
}

TEST_CASE("On-beat last tick and no samples yet") {
    TickFixerStatus status;
    status.hasTracker = true;
    status.waiting = false;
    status.lastDeltaMs = 615;
    status.keepalive = KeepaliveState::PAUSED;

    QStringList lines = StatusReport::formatLines(status, 30);
    CHECK(lines.contains("Last Tick: 615ms"));
    CHECK(lines.last().startsWith("Keepalive: PAUSED"));

    status.lastDeltaMs = -1;
    lines = StatusReport::formatLines(status, 30);
    CHECK(lines.size() == 5);
    CHECK(lines[1] == "Tick Quality: 100.0% (GOOD)");
}

TEST_CASE("report() polls its sources") {
    int polls = 0;
    StatusReport report([&] { ++polls; return TickFixerStatus(); }, [] { return 30; });
    report.report();
    report.report();
    CHECK(polls == 2);
}
