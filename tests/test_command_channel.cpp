#include <doctest/doctest.h>
#include "command_channel.hpp"
#include <QStringList>
#include <QVector>

TEST_CASE("Bare verbs parse, case-insensitively") {
    CHECK(CommandChannel::parse("tick").kind == Command::Kind::TICK);
    CHECK(CommandChannel::parse("TICK").kind == Command::Kind::TICK);
    CHECK(CommandChannel::parse("pause").kind == Command::Kind::PAUSE);
    CHECK(CommandChannel::parse("resume").kind == Command::Kind::UNPAUSE);
    CHECK(CommandChannel::parse("status").kind == Command::Kind::STATUS);
    CHECK(CommandChannel::parse("exit").kind == Command::Kind::QUIT);
}

TEST_CASE("Commands with arguments carry their values") {
    const Command state = CommandChannel::parse("state logged_in");
    CHECK(state.kind == Command::Kind::STATE);
    CHECK(state.state == SessionState::LOGGED_IN);

    const Command interval = CommandChannel::parse("interval  40");
    CHECK(interval.kind == Command::Kind::INTERVAL);
    CHECK(interval.value == 40);

    const Command samples = CommandChannel::parse("samples 250");
    CHECK(samples.kind == Command::Kind::SAMPLES);
    CHECK(samples.value == 250);

    const Command target = CommandChannel::parse("target 192.168.0.1");
    CHECK(target.kind == Command::Kind::TARGET);
    CHECK(target.host == "192.168.0.1");
    CHECK(target.port == -1);

    const Command withPort = CommandChannel::parse("target router.lan 4000");
    CHECK(withPort.kind == Command::Kind::TARGET);
    CHECK(withPort.host == "router.lan");
    CHECK(withPort.port == 4000);
}

TEST_CASE("Malformed commands are rejected with a reason") {
    const QStringList bad = {
        "", "jump", "tick now", "state", "state sleeping", "interval", "interval fast",
        "threshold 1 2", "target", "target a.b 0", "target a.b 70000", "target a.b x"
    };
    for (const QString& line : bad) {
        const Command command = CommandChannel::parse(line);
        CAPTURE(line.toStdString());
        CHECK(command.kind == Command::Kind::INVALID);
        CHECK_FALSE(command.error.isEmpty());
    }
}

TEST_CASE("feed() dispatches complete lines and buffers the rest") {
    CommandChannel channel(-1);
    int ticks = 0;
    QVector<int> intervals;
    QVector<SessionState> states;
    QObject::connect(&channel, &CommandChannel::tickObserved, [&] { ++ticks; });
    QObject::connect(&channel, &CommandChannel::intervalRequested, [&](int ms) { intervals << ms; });
    QObject::connect(&channel, &CommandChannel::stateReported, [&](SessionState s) { states << s; });

    channel.feed("tick\ntick\nstate LOGGED_IN\r\n# comment\n\nbogus\ninter");
    CHECK(ticks == 2);
    CHECK(states == QVector<SessionState>({SessionState::LOGGED_IN}));
    CHECK(intervals.isEmpty());

    channel.feed("val 25\n");
    CHECK(intervals == QVector<int>({25}));
}

TEST_CASE("Target with port reaches listeners intact") {
    CommandChannel channel(-1);
    QString host;
    int port = 0;
    QObject::connect(&channel, &CommandChannel::targetRequested, [&](const QString& h, int p) {
        host = h;
        port = p;
    });

    channel.feed("target 10.0.0.1 9\n");
    CHECK(host == "10.0.0.1");
    CHECK(port == 9);
}
