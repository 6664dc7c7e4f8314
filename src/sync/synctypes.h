#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QDateTime>
#include <QList>
#include <QMetaType>

/**
 * @file synctypes.h
 * @brief Common types and enums shared by the sync and transfer engines
 */

namespace Unison {

/**
 * @brief Data domains that are synchronized independently
 *
 * Each domain has its own admission lock and cooldown.
 */
enum class SyncDomain {
    Contacts,
    Messages,
    Calls,
    Files
};

/**
 * @brief All domains in canonical order
 */
inline QList<SyncDomain> allDomains()
{
    return {SyncDomain::Contacts, SyncDomain::Messages, SyncDomain::Calls, SyncDomain::Files};
}

/**
 * @brief Canonical name of a domain ("contacts", "messages", "calls", "files")
 */
QString domainName(SyncDomain domain);

/**
 * @brief Parse a domain name
 * @param ok Set to false if the name is unknown
 */
SyncDomain domainFromName(const QString &name, bool *ok = nullptr);

/**
 * @brief Error taxonomy for sync passes and transfers
 *
 * LockDenied, CooldownActive and EmergencyThrottled are admission denials,
 * never failures. ConflictUnresolved marks deferred work, not a fault.
 */
enum class SyncError {
    None,
    LockDenied,             ///< Domain already syncing
    CooldownActive,         ///< Domain synced too recently
    EmergencyThrottled,     ///< Cooldown denial while emergency mode is active
    DeviceDataUnavailable,  ///< Device data source failed
    ChecksumMismatch,       ///< Destination hash differs from source
    IOError,                ///< Source unreadable or destination unwritable
    ConflictUnresolved      ///< Waiting for an explicit resolution
};

QString errorName(SyncError error);
SyncError errorFromName(const QString &name);

/**
 * @brief Policy for scalar field conflicts between local and device records
 *
 * Array-valued fields are always unioned, whatever the strategy.
 */
enum class MergeStrategy {
    KeepBoth,       ///< Defer to manual resolution
    PreferDevice,   ///< Device scalar wins
    PreferLocal     ///< Local scalar wins
};

QString mergeStrategyName(MergeStrategy strategy);
MergeStrategy mergeStrategyFromName(const QString &name,
                                    MergeStrategy fallback = MergeStrategy::PreferDevice);

/**
 * @brief Explicit resolution chosen for a recorded conflict
 */
enum class ConflictResolution {
    KeepLocal,
    KeepDevice,
    Merge
};

QString resolutionName(ConflictResolution resolution);
ConflictResolution resolutionFromName(const QString &name, bool *ok = nullptr);

/**
 * @brief Summary of sync operation results
 */
struct SyncStats {
    int fetched = 0;        ///< Records reported by the device
    int created = 0;        ///< New records created
    int updated = 0;        ///< Existing records updated
    int unchanged = 0;      ///< Records with no changes
    int conflicts = 0;      ///< Conflicts recorded or still open
    int errors = 0;         ///< Per-record errors

    int total() const { return created + updated + unchanged; }

    QString summary() const {
        return QString("Fetched: %1, Created: %2, Updated: %3, Unchanged: %4, Conflicts: %5, Errors: %6")
            .arg(fetched).arg(created).arg(updated).arg(unchanged).arg(conflicts).arg(errors);
    }
};

/**
 * @brief Result of one domain sync pass
 */
struct SyncResult {
    SyncDomain domain = SyncDomain::Contacts;
    bool granted = false;       ///< Coordinator admitted the pass
    bool success = false;
    SyncError error = SyncError::None;
    QString errorMessage;
    qint64 retryAfterMs = 0;    ///< Remaining cooldown on CooldownActive
    SyncStats stats;
    QDateTime startTime;
    QDateTime endTime;

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }
};

} // namespace Unison

// Register types for Qt metatype system (needed for cross-thread signals)
Q_DECLARE_METATYPE(Unison::SyncDomain)
Q_DECLARE_METATYPE(Unison::SyncError)
Q_DECLARE_METATYPE(Unison::SyncStats)
Q_DECLARE_METATYPE(Unison::SyncResult)

#endif // SYNCTYPES_H
