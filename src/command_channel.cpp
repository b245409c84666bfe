#include "command_channel.hpp"
#include <QSocketNotifier>
#include <QStringList>
#include <QDebug>
#include <cerrno>
#include <cstring>
#include <unistd.h>

CommandChannel::CommandChannel(int fd, QObject* parent)
    : QObject(parent),
      m_fd(fd)
{
    if (m_fd >= 0) {
        m_notifier = new QSocketNotifier(m_fd, QSocketNotifier::Read, this);
        connect(m_notifier, &QSocketNotifier::activated, this, &CommandChannel::readInput);
    }
}

Command CommandChannel::parse(const QString& line) {
    Command command;
    const QStringList parts = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.isEmpty()) {
        command.error = QStringLiteral("empty command");
        return command;
    }

    const QString verb = parts[0].toLower();
    auto numberArg = [&](int index, int* out) {
        if (parts.size() <= index)
            return false;
        bool ok = false;
        *out = parts[index].toInt(&ok);
        return ok;
    };
    auto expectArgs = [&](int count) {
        if (parts.size() - 1 == count)
            return true;
        command.error = QStringLiteral("%1 takes %2 argument(s)").arg(verb).arg(count);
        return false;
    };

    if (verb == "tick") {
        if (expectArgs(0)) command.kind = Command::Kind::TICK;
    } else if (verb == "pause") {
        if (expectArgs(0)) command.kind = Command::Kind::PAUSE;
    } else if (verb == "unpause" || verb == "resume") {
        if (expectArgs(0)) command.kind = Command::Kind::UNPAUSE;
    } else if (verb == "status") {
        if (expectArgs(0)) command.kind = Command::Kind::STATUS;
    } else if (verb == "quit" || verb == "exit") {
        if (expectArgs(0)) command.kind = Command::Kind::QUIT;
    } else if (verb == "state") {
        if (!expectArgs(1))
            return command;
        if (sessionStateFromName(parts[1], &command.state))
            command.kind = Command::Kind::STATE;
        else
            command.error = QStringLiteral("unknown state '%1'").arg(parts[1]);
    } else if (verb == "interval" || verb == "threshold" || verb == "samples") {
        if (!expectArgs(1))
            return command;
        if (!numberArg(1, &command.value)) {
            command.error = QStringLiteral("'%1' is not a number").arg(parts[1]);
            return command;
        }
        if (verb == "interval") command.kind = Command::Kind::INTERVAL;
        else if (verb == "threshold") command.kind = Command::Kind::THRESHOLD;
        else command.kind = Command::Kind::SAMPLES;
    } else if (verb == "target") {
        if (parts.size() != 2 && parts.size() != 3) {
            command.error = QStringLiteral("target takes a host and an optional port");
            return command;
        }
        command.host = parts[1];
        if (parts.size() == 3 && (!numberArg(2, &command.port) || command.port < 1 || command.port > 65535)) {
            command.error = QStringLiteral("'%1' is not a valid port").arg(parts[2]);
            command.port = -1;
            return command;
        }
        command.kind = Command::Kind::TARGET;
    } else {
        command.error = QStringLiteral("unknown command '%1'").arg(parts[0]);
    }
    return command;
}

void CommandChannel::feed(const QByteArray& data) {
    m_pending += data;
    qsizetype newline;
    while ((newline = m_pending.indexOf('\n')) >= 0) {
        const QString line = QString::fromUtf8(m_pending.left(newline)).trimmed();
        m_pending.remove(0, newline + 1);
        if (line.isEmpty() || line.startsWith(QLatin1Char('#')))
            continue;

        const Command command = parse(line);
        if (command.kind == Command::Kind::INVALID)
            qWarning() << "Ignoring command" << line << ":" << command.error;
        else
            dispatch(command);
    }
}

void CommandChannel::readInput() {
    char buffer[4096];
    const ssize_t n = ::read(m_fd, buffer, sizeof(buffer));
    if (n > 0) {
        feed(QByteArray(buffer, int(n)));
        return;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN))
        return;

    if (n < 0)
        qWarning() << "Command input failed:" << std::strerror(errno);
    else
        qInfo() << "Command input closed.";
    m_notifier->setEnabled(false);
    emit quitRequested();
}

void CommandChannel::dispatch(const Command& command) {
    switch (command.kind) {
    case Command::Kind::TICK:      emit tickObserved(); break;
    case Command::Kind::STATE:     emit stateReported(command.state); break;
    case Command::Kind::INTERVAL:  emit intervalRequested(command.value); break;
    case Command::Kind::TARGET:    emit targetRequested(command.host, command.port); break;
    case Command::Kind::THRESHOLD: emit thresholdRequested(command.value); break;
    case Command::Kind::SAMPLES:   emit sampleSizeRequested(command.value); break;
    case Command::Kind::PAUSE:     emit pauseRequested(); break;
    case Command::Kind::UNPAUSE:   emit unpauseRequested(); break;
    case Command::Kind::STATUS:    emit statusRequested(); break;
    case Command::Kind::QUIT:      emit quitRequested(); break;
    case Command::Kind::INVALID:   break;
    }
}
