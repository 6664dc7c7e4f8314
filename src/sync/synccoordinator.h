#ifndef SYNCCOORDINATOR_H
#define SYNCCOORDINATOR_H

#include <QObject>
#include <QMap>
#include <QMutex>
#include <QElapsedTimer>
#include <functional>
#include "synctypes.h"

namespace Unison {

class EventBus;

/**
 * @brief Admission settings for the coordinator
 */
struct CoordinatorConfig {
    QMap<SyncDomain, qint64> cooldowns;  ///< Base cooldown per domain, ms
    int emergencyThreshold = 10000;      ///< Record count that triggers emergency mode
    int emergencyMultiplier = 10;        ///< Cooldown factor while in emergency mode
    int spikeDelta = 100;                ///< Jump between two reports that gets logged

    static CoordinatorConfig defaults();
};

/**
 * @brief Per-domain admission control for sync passes
 *
 * Each domain has an independent lock and cooldown. A pass is admitted
 * when the domain is not locked and its cooldown has elapsed since the
 * last completed pass. Check and set happen under one mutex, so two
 * concurrent callers can never both be admitted for the same domain.
 *
 * Cooldowns are checked on demand against a monotonic clock; there are
 * no timers. The clock can be replaced for tests.
 *
 * Emergency mode multiplies all cooldowns and force-clears held locks.
 * Holders learn about a force-clear through isGrantValid() and stop at
 * their next checkpoint; their later release is ignored.
 *
 * Usage:
 * @code
 * SyncGuard guard(&coordinator, SyncDomain::Contacts);
 * if (!guard.isGranted()) {
 *     return; // guard.denial() tells why
 * }
 * // ... sync, checking guard.isValid() between records ...
 * @endcode
 */
class SyncCoordinator : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<qint64()>;

    explicit SyncCoordinator(const CoordinatorConfig &config = CoordinatorConfig::defaults(),
                             EventBus *bus = nullptr,
                             QObject *parent = nullptr);

    /**
     * @brief Replace the monotonic millisecond clock
     */
    void setClock(Clock clock);

    // ========== Admission ==========

    /**
     * @brief Try to start a pass for a domain
     * @param reason Set to the denial reason when refused
     * @param retryAfterMs Set to the remaining cooldown when refused by cooldown
     * @return true if the caller now holds the domain
     */
    bool requestSync(SyncDomain domain, SyncError *reason = nullptr,
                     qint64 *retryAfterMs = nullptr);

    /**
     * @brief End the pass for a domain and start its cooldown
     *
     * Call exactly once per successful requestSync(), on every exit path.
     * Releasing an unlocked domain is a no-op.
     */
    void releaseSync(SyncDomain domain);

    /**
     * @brief Whether the grant identified by generation still holds the lock
     */
    bool isGrantValid(SyncDomain domain, quint64 generation) const;

    // ========== Queries ==========

    bool isSyncActive() const;
    bool isLocked(SyncDomain domain) const;
    qint64 remainingCooldown(SyncDomain domain) const;
    qint64 cooldown(SyncDomain domain) const;

    /**
     * @brief Clock value of the last completed pass, or -1 if none
     */
    qint64 lastCompleted(SyncDomain domain) const;

    /**
     * @brief Change the base cooldown of a domain
     *
     * Takes effect immediately, scaled if emergency mode is active.
     */
    void setCooldown(SyncDomain domain, qint64 cooldownMs);

    // ========== Emergency Mode ==========

    bool isEmergencyMode() const;

    /**
     * @brief Multiply all cooldowns and force-clear held locks
     *
     * Does nothing if already active.
     */
    void activateEmergencyMode();

    /**
     * @brief Restore base cooldowns
     *
     * Does nothing if not active.
     */
    void deactivateEmergencyMode();

    /**
     * @brief Feed the externally observed record count
     *
     * Activates emergency mode above the threshold and logs large jumps.
     */
    void reportRecordCount(qint64 count);

    CoordinatorConfig config() const;

signals:
    void emergencyModeChanged(bool active);
    void locksForceReleased();

private:
    friend class SyncGuard;

    struct LockState {
        bool locked = false;
        qint64 lastCompletedAt = -1;
        qint64 baseCooldownMs = 0;
        qint64 cooldownMs = 0;
        quint64 generation = 0;
    };

    // Callers hold m_mutex
    qint64 now() const;
    qint64 remainingLocked(const LockState &state) const;

    bool acquire(SyncDomain domain, SyncError *reason, qint64 *retryAfterMs,
                 quint64 *generation);
    void release(SyncDomain domain, quint64 generation);

    mutable QMutex m_mutex;
    QMap<SyncDomain, LockState> m_states;
    CoordinatorConfig m_config;
    bool m_emergency = false;
    qint64 m_lastReportedCount = -1;

    EventBus *m_bus = nullptr;
    Clock m_clock;
    QElapsedTimer m_elapsed;
};

/**
 * @brief Scoped sync admission
 *
 * Requests the domain on construction and releases it on destruction,
 * whatever path leaves the scope.
 */
class SyncGuard
{
public:
    SyncGuard(SyncCoordinator *coordinator, SyncDomain domain);
    ~SyncGuard();

    SyncGuard(const SyncGuard &) = delete;
    SyncGuard &operator=(const SyncGuard &) = delete;

    bool isGranted() const { return m_granted; }
    SyncError denial() const { return m_denial; }
    qint64 retryAfterMs() const { return m_retryAfterMs; }

    /**
     * @brief false once the grant was force-cleared or released
     */
    bool isValid() const;

    /**
     * @brief Release early; the destructor then does nothing
     */
    void release();

private:
    SyncCoordinator *m_coordinator;
    SyncDomain m_domain;
    bool m_granted = false;
    bool m_released = false;
    quint64 m_generation = 0;
    SyncError m_denial = SyncError::None;
    qint64 m_retryAfterMs = 0;
};

} // namespace Unison

#endif // SYNCCOORDINATOR_H
