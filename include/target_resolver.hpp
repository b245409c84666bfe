/* PURPOSE:
 * Pick the address the keepalive should send to.
 *
 * Resolution is an ordered list of strategies tried until one finds an address:
 *   configured host -> default gateway -> private address probe -> public last resort
 * A null QHostAddress from resolve() means nothing worked and the keepalive can't start.
*/

#pragma once
#include <QHostAddress>
#include <QString>
#include <QVector>
#include <functional>

// OS-facing lookups. Subclassed in tests to observe or fake the network.
class NetworkEnvironment {
public:
    virtual ~NetworkEnvironment() = default;

    virtual QHostAddress lookupHost(const QString& host);
    virtual QHostAddress defaultGateway();
    virtual bool isReachable(const QHostAddress& address, int timeoutMs);

    // Exposed for tests: parses the text of /proc/net/route.
    static QHostAddress parseProcNetRoute(const QByteArray& table);
    // Exposed for tests: parses `route -n get default` output.
    static QHostAddress parseRouteGetOutput(const QByteArray& output);
};

struct ResolverStrategy {
    QString name;
    std::function<QHostAddress()> resolve;  // null address = not found
};

class TargetResolver {
public:
    static constexpr const char* GATEWAY_KEYWORD = "gateway";
    static constexpr const char* PRIVATE_FALLBACK = "192.168.1.1";
    static constexpr const char* PUBLIC_FALLBACK = "8.8.8.8";
    static constexpr int PROBE_TIMEOUT_MS = 500;

    // env is not owned; nullptr uses the real network. Without the public
    // fallback, resolve() returns a null address when nothing local answers.
    explicit TargetResolver(NetworkEnvironment* env = nullptr, bool allowPublicFallback = true);

    void setAllowPublicFallback(bool allow) { m_allowPublicFallback = allow; }
    bool allowPublicFallback() const { return m_allowPublicFallback; }

    static bool isGatewayKeyword(const QString& configValue);

    QVector<ResolverStrategy> strategiesFor(const QString& configValue) const;
    QHostAddress resolve(const QString& configValue) const;

private:
    NetworkEnvironment* m_env;
    bool m_allowPublicFallback;
};
