#include "app.hpp"
#include "command_channel.hpp"
#include "config.hpp"
#include "session_tracker.hpp"
#include "status_report.hpp"
#include "tick_fixer.hpp"
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QSettings>
#include <QDebug>
#include <memory>
#include <unistd.h>

namespace {

// Applies an integer option if it was given; reports a malformed one.
bool intOption(const QCommandLineParser& parser, const QCommandLineOption& option, int* out) {
    if (!parser.isSet(option))
        return true;
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    if (!ok) {
        qCritical() << "Option" << option.names().first() << "expects a number, got" << parser.value(option);
        return false;
    }
    *out = value;
    return true;
}

}

int App::run(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("tickfixer");
    QCoreApplication::setOrganizationName("tickfixer");
    QCoreApplication::setApplicationVersion("1.2.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Keeps the Wi-Fi radio out of power save with a steady UDP keepalive and reports game tick quality.\n"
        "Reads one command per line on stdin: tick, state <name>, interval <ms>, target <host> [port],\n"
        "threshold <ms>, samples <n>, pause, unpause, status, quit.");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption({"c", "config"}, "Settings file (INI).", "file");
    const QCommandLineOption intervalOption({"i", "interval"}, "Keepalive interval in ms (10-200).", "ms");
    const QCommandLineOption targetOption({"t", "target"}, "Keepalive target host, or 'gateway'.", "host");
    const QCommandLineOption portOption({"p", "port"}, "Keepalive target port (1-65535).", "port");
    const QCommandLineOption samplesOption("sample-size", "Tick sample size (10-500).", "n");
    const QCommandLineOption thresholdOption("threshold", "Tick quality threshold in ms (5-100).", "ms");
    const QCommandLineOption alwaysOnOption("always-on", "Keep sending while logged out.");
    const QCommandLineOption lanOnlyOption("lan-only", "Never fall back to a target outside the local network.");
    const QCommandLineOption reportOption("report-interval", "Status log interval in ms, 0 to disable.", "ms");
    const QCommandLineOption saveOption("save", "Write the effective settings back to the settings file.");
    parser.addOptions({configOption, intervalOption, targetOption, portOption, samplesOption,
                       thresholdOption, alwaysOnOption, lanOnlyOption, reportOption, saveOption});
    parser.process(app);

    std::unique_ptr<QSettings> settings;
    if (parser.isSet(configOption)) {
        const QString path = parser.value(configOption);
        if (QFileInfo::exists(path) && !QFileInfo(path).isReadable()) {
            qCritical() << "Settings file" << path << "is not readable.";
            return 1;
        }
        settings = std::make_unique<QSettings>(path, QSettings::IniFormat);
    } else {
        settings = std::make_unique<QSettings>(QSettings::IniFormat, QSettings::UserScope,
                                               QCoreApplication::organizationName(),
                                               QCoreApplication::applicationName());
    }
    if (settings->status() != QSettings::NoError) {
        qCritical() << "Failed to read settings from" << settings->fileName();
        return 1;
    }

    TickFixerConfig config = TickFixerConfig::load(*settings);
    if (!intOption(parser, intervalOption, &config.keepaliveIntervalMs)
        || !intOption(parser, portOption, &config.keepalivePort)
        || !intOption(parser, samplesOption, &config.tickSampleSize)
        || !intOption(parser, thresholdOption, &config.tickQualityThresholdMs)
        || !intOption(parser, reportOption, &config.reportIntervalMs))
        return 1;
    if (parser.isSet(targetOption))
        config.keepaliveTarget = parser.value(targetOption);
    if (parser.isSet(alwaysOnOption))
        config.onlyWhenLoggedIn = false;
    if (parser.isSet(lanOnlyOption))
        config.allowPublicFallback = false;
    config = config.clamped();

    if (parser.isSet(saveOption)) {
        config.save(*settings);
        settings->sync();
        if (settings->status() != QSettings::NoError)
            qWarning() << "Failed to save settings to" << settings->fileName();
    }

    SessionTracker session;
    TickFixer fixer(config);
    StatusReport report([&fixer] { return fixer.status(); },
                        [&fixer] { return fixer.config().tickQualityThresholdMs; });
    CommandChannel commands(STDIN_FILENO);

    QObject::connect(&session, &SessionTracker::sessionBoundary, &fixer, &TickFixer::onSessionBoundary);
    QObject::connect(&session, &SessionTracker::loggedInChanged, &fixer, &TickFixer::onLoggedInChanged);

    QObject::connect(&commands, &CommandChannel::tickObserved, &fixer, &TickFixer::onTick);
    QObject::connect(&commands, &CommandChannel::stateReported, &session, &SessionTracker::setState);
    QObject::connect(&commands, &CommandChannel::pauseRequested, &fixer, &TickFixer::pauseKeepalive);
    QObject::connect(&commands, &CommandChannel::unpauseRequested, &fixer, &TickFixer::unpauseKeepalive);
    QObject::connect(&commands, &CommandChannel::statusRequested, &report, &StatusReport::report);
    QObject::connect(&commands, &CommandChannel::quitRequested, &app, &QCoreApplication::quit);

    QObject::connect(&commands, &CommandChannel::intervalRequested, &fixer, [&fixer](int ms) {
        TickFixerConfig next = fixer.config();
        next.keepaliveIntervalMs = ms;
        fixer.applyConfig(next);
    });
    QObject::connect(&commands, &CommandChannel::targetRequested, &fixer, [&fixer](const QString& host, int port) {
        TickFixerConfig next = fixer.config();
        next.keepaliveTarget = host;
        if (port > 0)
            next.keepalivePort = port;
        fixer.applyConfig(next);
    });
    QObject::connect(&commands, &CommandChannel::thresholdRequested, &fixer, [&fixer](int ms) {
        TickFixerConfig next = fixer.config();
        next.tickQualityThresholdMs = ms;
        fixer.applyConfig(next);
    });
    QObject::connect(&commands, &CommandChannel::sampleSizeRequested, &fixer, [&fixer](int samples) {
        TickFixerConfig next = fixer.config();
        next.tickSampleSize = samples;
        fixer.applyConfig(next);
    });

    if (!fixer.startUp(session.isLoggedIn()))
        qWarning() << "Running without keepalive, tick quality tracking only.";
    report.start(config.reportIntervalMs);

    const int code = app.exec();
    report.stop();
    fixer.shutDown();
    return code;
}
