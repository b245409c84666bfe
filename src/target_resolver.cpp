#include "target_resolver.hpp"
#include <QFile>
#include <QHostInfo>
#include <QProcess>
#include <QTcpSocket>
#include <QtEndian>
#include <QDebug>

namespace {
constexpr int ROUTE_COMMAND_TIMEOUT_MS = 1000;
constexpr quint16 ECHO_PORT = 7;
constexpr uint RTF_UP = 0x0001;
constexpr uint RTF_GATEWAY = 0x0002;

NetworkEnvironment& systemEnvironment() {
    static NetworkEnvironment env;
    return env;
}
}

// ---------- NetworkEnvironment ----------

QHostAddress NetworkEnvironment::lookupHost(const QString& host) {
    QHostAddress literal;
    if (literal.setAddress(host))
        return literal;

    const QHostInfo info = QHostInfo::fromName(host);
    if (info.error() != QHostInfo::NoError || info.addresses().isEmpty()) {
        qWarning() << "Failed to resolve target host" << host << ":" << info.errorString();
        return QHostAddress();
    }

    const QList<QHostAddress> addresses = info.addresses();
    for (const QHostAddress& address : addresses) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol)
            return address;
    }
    return addresses.first();
}

QHostAddress NetworkEnvironment::defaultGateway() {
#ifdef Q_OS_LINUX
    QFile routes(QStringLiteral("/proc/net/route"));
    if (!routes.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to read routing table:" << routes.errorString();
        return QHostAddress();
    }
    return parseProcNetRoute(routes.readAll());
#else
    QProcess process;
    process.start(QStringLiteral("route"), {QStringLiteral("-n"), QStringLiteral("get"), QStringLiteral("default")});
    if (!process.waitForFinished(ROUTE_COMMAND_TIMEOUT_MS)) {
        qWarning() << "Failed to detect default gateway via route command:" << process.errorString();
        process.kill();
        process.waitForFinished();
        return QHostAddress();
    }
    return parseRouteGetOutput(process.readAllStandardOutput());
#endif
}

// A TCP connect that is refused still proves the host answered.
bool NetworkEnvironment::isReachable(const QHostAddress& address, int timeoutMs) {
    QTcpSocket socket;
    socket.connectToHost(address, ECHO_PORT);
    if (socket.waitForConnected(timeoutMs)) {
        socket.abort();
        return true;
    }
    return socket.error() == QAbstractSocket::ConnectionRefusedError;
}

QHostAddress NetworkEnvironment::parseProcNetRoute(const QByteArray& table) {
    QHostAddress best;
    bool haveBest = false;
    uint bestMetric = 0;

    const QList<QByteArray> lines = table.split('\n');
    for (int i = 1; i < lines.size(); ++i) {  // line 0 is the column header
        const QList<QByteArray> fields = lines[i].simplified().split(' ');
        if (fields.size() < 7)
            continue;

        bool ok = false;
        const uint destination = fields[1].toUInt(&ok, 16);
        if (!ok || destination != 0)
            continue;
        const uint gateway = fields[2].toUInt(&ok, 16);
        if (!ok || gateway == 0)
            continue;
        const uint flags = fields[3].toUInt(&ok, 16);
        if (!ok || (flags & (RTF_UP | RTF_GATEWAY)) != (RTF_UP | RTF_GATEWAY))
            continue;
        const uint metric = fields[6].toUInt(&ok, 10);
        if (!ok)
            continue;

        if (!haveBest || metric < bestMetric) {
            // the kernel prints the raw network-order word in host order
            best = QHostAddress(qFromBigEndian<quint32>(gateway));
            bestMetric = metric;
            haveBest = true;
        }
    }
    return best;
}

QHostAddress NetworkEnvironment::parseRouteGetOutput(const QByteArray& output) {
    const QList<QByteArray> lines = output.split('\n');
    for (const QByteArray& raw : lines) {
        const QByteArray line = raw.trimmed();
        if (line.startsWith("gateway:"))
            return QHostAddress(QString::fromLatin1(line.mid(int(qstrlen("gateway:"))).trimmed()));
    }
    return QHostAddress();
}

// ---------- TargetResolver ----------

TargetResolver::TargetResolver(NetworkEnvironment* env, bool allowPublicFallback)
    : m_env(env ? env : &systemEnvironment()),
      m_allowPublicFallback(allowPublicFallback)
{}

bool TargetResolver::isGatewayKeyword(const QString& configValue) {
    const QString trimmed = configValue.trimmed();
    return trimmed.isEmpty() || trimmed.compare(QLatin1String(GATEWAY_KEYWORD), Qt::CaseInsensitive) == 0;
}

QVector<ResolverStrategy> TargetResolver::strategiesFor(const QString& configValue) const {
    NetworkEnvironment* env = m_env;
    QVector<ResolverStrategy> strategies;

    if (!isGatewayKeyword(configValue)) {
        const QString host = configValue.trimmed();
        strategies.append({QStringLiteral("configured host"), [env, host] { return env->lookupHost(host); }});
    }

    strategies.append({QStringLiteral("default gateway"), [env] { return env->defaultGateway(); }});

    strategies.append({QStringLiteral("private fallback"), [env] {
        const QHostAddress candidate(QString::fromLatin1(PRIVATE_FALLBACK));
        return env->isReachable(candidate, PROBE_TIMEOUT_MS) ? candidate : QHostAddress();
    }});

    // the only strategy that sends keepalives off the local network
    if (m_allowPublicFallback) {
        strategies.append({QStringLiteral("public fallback"), [] {
            return QHostAddress(QString::fromLatin1(PUBLIC_FALLBACK));
        }});
    }

    return strategies;
}

QHostAddress TargetResolver::resolve(const QString& configValue) const {
    const QVector<ResolverStrategy> strategies = strategiesFor(configValue);
    for (const ResolverStrategy& strategy : strategies) {
        const QHostAddress address = strategy.resolve();
        if (!address.isNull()) {
            qInfo() << "Keepalive target resolved via" << strategy.name << "->" << address.toString();
            return address;
        }
        qDebug() << "Keepalive target strategy" << strategy.name << "found nothing.";
    }
    qCritical() << "Failed to resolve any keepalive target.";
    return QHostAddress();
}
