/* PURPOSE:
 * User-facing settings and their bounds, loaded from an INI file through QSettings.
 * Out-of-range values are clamped on load, never rejected.
*/

#pragma once
#include <QString>

class QSettings;

struct TickFixerConfig {
    static constexpr int MIN_PORT = 1;
    static constexpr int MAX_PORT = 65535;
    static constexpr int DEFAULT_REPORT_INTERVAL_MS = 5000;
    static constexpr int MAX_REPORT_INTERVAL_MS = 600000;

    int keepaliveIntervalMs;
    QString keepaliveTarget;
    int keepalivePort;
    bool onlyWhenLoggedIn;
    bool allowPublicFallback;  // last-resort target outside the LAN
    int tickSampleSize;
    int tickQualityThresholdMs;
    int reportIntervalMs;  // 0 disables periodic status output

    TickFixerConfig();

    // Returns a copy with every value forced into its bounds.
    TickFixerConfig clamped() const;

    static TickFixerConfig load(QSettings& settings);
    void save(QSettings& settings) const;

    bool operator==(const TickFixerConfig& other) const;
    bool operator!=(const TickFixerConfig& other) const { return !(*this == other); }
};
