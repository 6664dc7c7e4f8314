#ifndef CONDUIT_H
#define CONDUIT_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <functional>
#include "synctypes.h"

namespace Unison {

class RecordStore;
class DeviceDataSource;
class EventBus;

/**
 * @brief Context passed to conduits during sync operations
 *
 * Contains everything a conduit needs to perform its sync.
 */
class SyncContext
{
public:
    RecordStore *store = nullptr;            ///< Local canonical storage
    DeviceDataSource *source = nullptr;      ///< Device-side snapshots
    EventBus *bus = nullptr;                 ///< May be null
    QString deviceId;
    MergeStrategy strategy = MergeStrategy::PreferDevice;
};

/**
 * @brief Abstract base class for domain conduits
 *
 * A conduit runs the sync pass for one domain: it pulls the device
 * snapshot, compares it record by record with the store and writes
 * what changed. Admission and release are the engine's job; a conduit
 * only checks isCancelled() between records and stops early when the
 * grant has been revoked.
 *
 * To create a new conduit:
 * 1. Subclass Conduit
 * 2. Implement conduitId(), displayName(), domain() and syncRecords()
 * 3. Register with SyncEngine
 *
 * Conduits:
 *   - ContactConduit: device contacts, merged through the conflict resolver
 *   - MessageConduit: new messages and read flags, plus thread summaries
 *   - CallLogConduit: new call log entries
 */
class Conduit : public QObject
{
    Q_OBJECT

public:
    explicit Conduit(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~Conduit() = default;

    // ========== Conduit Identity ==========

    /**
     * @brief Unique identifier for this conduit
     *
     * Examples: "contacts", "messages", "calls"
     */
    virtual QString conduitId() const = 0;

    /**
     * @brief Human-readable name for display
     */
    virtual QString displayName() const = 0;

    /**
     * @brief Domain this conduit synchronizes
     */
    virtual SyncDomain domain() const = 0;

    // ========== Core Sync Operation ==========

    /**
     * @brief Perform the sync pass
     *
     * Checks prerequisites, wraps syncRecords() in a store batch and
     * stamps the result. Never throws; failures are reported in the result.
     */
    SyncResult sync(SyncContext *context);

    /**
     * @brief Check if conduit can sync with this context
     */
    virtual bool canSync(const SyncContext *context) const;

    /**
     * @brief Set external cancel check callback
     *
     * When set, this function will be called between records. Returns
     * true if the pass must stop.
     */
    void setCancelCheck(std::function<bool()> callback) { m_cancelCheck = callback; }

    /**
     * @brief Get the last time this conduit ran successfully
     */
    QDateTime lastRunTime() const { return m_lastRunTime; }
    void setLastRunTime(const QDateTime &time) { m_lastRunTime = time; }

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);
    void progressUpdated(int current, int total, const QString &message);
    void conflictDetected(const QString &conflictId);

protected:
    /**
     * @brief Domain-specific pass
     *
     * Set result.success, result.error and result.stats. Data source
     * failures are DeviceDataUnavailable.
     */
    virtual void syncRecords(SyncContext *context, SyncResult &result) = 0;

    /**
     * @brief Mark the result as failed
     */
    void fail(SyncResult &result, SyncError error, const QString &message);

    /**
     * @brief Stop the pass because the grant was revoked
     */
    void interrupt(SyncResult &result);

    /**
     * @brief Check if cancellation was requested
     */
    bool isCancelled() const { return m_cancelCheck && m_cancelCheck(); }

    std::function<bool()> m_cancelCheck;  ///< External cancellation check
    QDateTime m_lastRunTime;              ///< Last successful run time
};

} // namespace Unison

#endif // CONDUIT_H
