/* PURPOSE
 * Owns the keepalive and the tick tracker for one session and keeps them in line
 * with the config and the client's login state.
*/

#pragma once
#include <QObject>
#include <memory>
#include "config.hpp"
#include "types.hpp"
#include "keepalive_scheduler.hpp"
#include "target_resolver.hpp"
#include "tick_quality_tracker.hpp"

class TickFixer : public QObject {
    Q_OBJECT
public:
    // network may be nullptr to use the real network.
    explicit TickFixer(const TickFixerConfig& config, NetworkEnvironment* network = nullptr,
                       QObject* parent = nullptr);
    ~TickFixer() override;

    // Returns false when the keepalive could not start; tick tracking still runs.
    bool startUp(bool loggedIn);
    void shutDown();

    void applyConfig(const TickFixerConfig& config);
    const TickFixerConfig& config() const { return m_config; }

    TickFixerStatus status() const;
    const TickQualityTracker* tracker() const { return m_tracker.get(); }
    const KeepaliveScheduler& keepalive() const { return m_keepalive; }

public slots:
    void onTick();
    void onSessionBoundary();
    void onLoggedInChanged(bool loggedIn);
    void pauseKeepalive();
    void unpauseKeepalive();

signals:
    void keepaliveUnavailable();

private:
    bool startKeepalive();
    void applyPausePolicy();

    TickFixerConfig m_config;
    TargetResolver m_resolver;
    KeepaliveScheduler m_keepalive;
    std::unique_ptr<TickQualityTracker> m_tracker;
    bool m_loggedIn = false;
    bool m_manualPause = false;
    bool m_started = false;
};
