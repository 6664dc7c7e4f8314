#include "synccoordinator.h"
#include "eventbus.h"

#include <QMutexLocker>
#include <QDebug>

namespace Unison {

CoordinatorConfig CoordinatorConfig::defaults()
{
    CoordinatorConfig config;
    config.cooldowns[SyncDomain::Contacts] = 300000;
    config.cooldowns[SyncDomain::Messages] = 60000;
    config.cooldowns[SyncDomain::Calls] = 120000;
    config.cooldowns[SyncDomain::Files] = 30000;
    return config;
}

SyncCoordinator::SyncCoordinator(const CoordinatorConfig &config, EventBus *bus, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_bus(bus)
{
    if (m_config.emergencyMultiplier < 1) {
        qWarning() << "[SyncCoordinator] Invalid emergency multiplier"
                   << m_config.emergencyMultiplier << "- using 1";
        m_config.emergencyMultiplier = 1;
    }

    const CoordinatorConfig fallback = CoordinatorConfig::defaults();
    for (SyncDomain domain : allDomains()) {
        LockState state;
        state.baseCooldownMs = m_config.cooldowns.value(domain, fallback.cooldowns.value(domain));
        state.cooldownMs = state.baseCooldownMs;
        m_states.insert(domain, state);
    }

    m_elapsed.start();
}

void SyncCoordinator::setClock(Clock clock)
{
    QMutexLocker locker(&m_mutex);
    m_clock = std::move(clock);
}

qint64 SyncCoordinator::now() const
{
    return m_clock ? m_clock() : m_elapsed.elapsed();
}

qint64 SyncCoordinator::remainingLocked(const LockState &state) const
{
    if (state.lastCompletedAt < 0) {
        return 0;
    }
    qint64 elapsed = now() - state.lastCompletedAt;
    return elapsed < state.cooldownMs ? state.cooldownMs - elapsed : 0;
}

// ========== Admission ==========

bool SyncCoordinator::acquire(SyncDomain domain, SyncError *reason, qint64 *retryAfterMs,
                              quint64 *generation)
{
    QMutexLocker locker(&m_mutex);
    LockState &state = m_states[domain];

    if (state.locked) {
        if (reason) *reason = SyncError::LockDenied;
        if (retryAfterMs) *retryAfterMs = 0;
        qDebug() << "[SyncCoordinator]" << domainName(domain) << "denied: already syncing";
        return false;
    }

    qint64 remaining = remainingLocked(state);
    if (remaining > 0) {
        if (reason) {
            *reason = m_emergency ? SyncError::EmergencyThrottled : SyncError::CooldownActive;
        }
        if (retryAfterMs) *retryAfterMs = remaining;
        qDebug() << "[SyncCoordinator]" << domainName(domain) << "denied: cooldown,"
                 << remaining << "ms left" << (m_emergency ? "(emergency)" : "");
        return false;
    }

    state.locked = true;
    ++state.generation;
    if (generation) *generation = state.generation;
    if (reason) *reason = SyncError::None;
    if (retryAfterMs) *retryAfterMs = 0;

    qDebug() << "[SyncCoordinator]" << domainName(domain) << "granted, generation" << state.generation;
    return true;
}

void SyncCoordinator::release(SyncDomain domain, quint64 generation)
{
    QMutexLocker locker(&m_mutex);
    LockState &state = m_states[domain];

    if (!state.locked || state.generation != generation) {
        qDebug() << "[SyncCoordinator] Ignoring stale release of" << domainName(domain);
        return;
    }

    state.locked = false;
    state.lastCompletedAt = now();
    qDebug() << "[SyncCoordinator]" << domainName(domain) << "released";
}

bool SyncCoordinator::requestSync(SyncDomain domain, SyncError *reason, qint64 *retryAfterMs)
{
    return acquire(domain, reason, retryAfterMs, nullptr);
}

void SyncCoordinator::releaseSync(SyncDomain domain)
{
    quint64 generation;
    {
        QMutexLocker locker(&m_mutex);
        generation = m_states[domain].generation;
    }
    release(domain, generation);
}

bool SyncCoordinator::isGrantValid(SyncDomain domain, quint64 generation) const
{
    QMutexLocker locker(&m_mutex);
    const LockState state = m_states.value(domain);
    return state.locked && state.generation == generation;
}

// ========== Queries ==========

bool SyncCoordinator::isSyncActive() const
{
    QMutexLocker locker(&m_mutex);
    for (const LockState &state : m_states) {
        if (state.locked) return true;
    }
    return false;
}

bool SyncCoordinator::isLocked(SyncDomain domain) const
{
    QMutexLocker locker(&m_mutex);
    return m_states.value(domain).locked;
}

qint64 SyncCoordinator::remainingCooldown(SyncDomain domain) const
{
    QMutexLocker locker(&m_mutex);
    return remainingLocked(m_states.value(domain));
}

qint64 SyncCoordinator::cooldown(SyncDomain domain) const
{
    QMutexLocker locker(&m_mutex);
    return m_states.value(domain).cooldownMs;
}

qint64 SyncCoordinator::lastCompleted(SyncDomain domain) const
{
    QMutexLocker locker(&m_mutex);
    return m_states.value(domain).lastCompletedAt;
}

void SyncCoordinator::setCooldown(SyncDomain domain, qint64 cooldownMs)
{
    QMutexLocker locker(&m_mutex);
    LockState &state = m_states[domain];
    state.baseCooldownMs = qMax<qint64>(0, cooldownMs);
    state.cooldownMs = m_emergency
        ? state.baseCooldownMs * m_config.emergencyMultiplier
        : state.baseCooldownMs;
    m_config.cooldowns[domain] = state.baseCooldownMs;
}

CoordinatorConfig SyncCoordinator::config() const
{
    QMutexLocker locker(&m_mutex);
    return m_config;
}

// ========== Emergency Mode ==========

bool SyncCoordinator::isEmergencyMode() const
{
    QMutexLocker locker(&m_mutex);
    return m_emergency;
}

void SyncCoordinator::activateEmergencyMode()
{
    int cleared = 0;
    {
        QMutexLocker locker(&m_mutex);
        if (m_emergency) {
            return;
        }
        m_emergency = true;

        const qint64 t = now();
        for (LockState &state : m_states) {
            state.cooldownMs = state.baseCooldownMs * m_config.emergencyMultiplier;
            if (state.locked) {
                state.locked = false;
                state.lastCompletedAt = t;
                ++state.generation;
                ++cleared;
            }
        }
    }

    qWarning() << "[SyncCoordinator] Emergency mode activated, cooldowns x"
               << m_config.emergencyMultiplier << "," << cleared << "lock(s) force-cleared";

    emit emergencyModeChanged(true);
    if (cleared > 0) {
        emit locksForceReleased();
    }
    if (m_bus) {
        m_bus->publishEmergencyModeChanged(true);
    }
}

void SyncCoordinator::deactivateEmergencyMode()
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_emergency) {
            return;
        }
        m_emergency = false;
        for (LockState &state : m_states) {
            state.cooldownMs = state.baseCooldownMs;
        }
    }

    qInfo() << "[SyncCoordinator] Emergency mode deactivated";

    emit emergencyModeChanged(false);
    if (m_bus) {
        m_bus->publishEmergencyModeChanged(false);
    }
}

void SyncCoordinator::reportRecordCount(qint64 count)
{
    bool trigger = false;
    {
        QMutexLocker locker(&m_mutex);
        if (m_lastReportedCount >= 0 && count - m_lastReportedCount > m_config.spikeDelta) {
            qWarning() << "[SyncCoordinator] Record count spike:" << m_lastReportedCount
                       << "->" << count;
        }
        m_lastReportedCount = count;
        trigger = count > m_config.emergencyThreshold && !m_emergency;
    }

    if (trigger) {
        qWarning() << "[SyncCoordinator] Record count" << count << "exceeds threshold";
        activateEmergencyMode();
    }
}

// ========== SyncGuard ==========

SyncGuard::SyncGuard(SyncCoordinator *coordinator, SyncDomain domain)
    : m_coordinator(coordinator)
    , m_domain(domain)
{
    m_granted = m_coordinator->acquire(m_domain, &m_denial, &m_retryAfterMs, &m_generation);
}

SyncGuard::~SyncGuard()
{
    release();
}

bool SyncGuard::isValid() const
{
    return m_granted && !m_released && m_coordinator->isGrantValid(m_domain, m_generation);
}

void SyncGuard::release()
{
    if (m_granted && !m_released) {
        m_released = true;
        m_coordinator->release(m_domain, m_generation);
    }
}

} // namespace Unison
