#ifndef SYNCENGINE_H
#define SYNCENGINE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include "synctypes.h"
#include "records.h"
#include "conduit.h"

namespace Unison {

class SyncCoordinator;
class RecordStore;
class DeviceDataSource;
class EventBus;
class TransferEngine;

/**
 * @brief Main sync orchestrator
 *
 * The SyncEngine coordinates:
 *   - Admission through the SyncCoordinator
 *   - Conduit registration and execution
 *   - Event publication
 *   - Explicit conflict resolution
 *   - File imports through the TransferEngine
 *
 * Each pass asks the coordinator for its domain, runs the domain
 * conduit, and releases the domain on every exit path. A denied pass
 * produces a result carrying the denial reason and publishes nothing.
 *
 * Usage:
 * @code
 * SyncEngine engine(&coordinator, &store, &source, &bus);
 * engine.setMergeStrategy(MergeStrategy::KeepBoth);
 *
 * SyncResult result = engine.syncDomain(SyncDomain::Contacts, "iphone-1");
 * if (!result.granted) {
 *     // retry after result.retryAfterMs
 * }
 * @endcode
 */
class SyncEngine : public QObject
{
    Q_OBJECT

public:
    SyncEngine(SyncCoordinator *coordinator, RecordStore *store,
               DeviceDataSource *source, EventBus *bus = nullptr,
               QObject *parent = nullptr);
    ~SyncEngine() override;

    // ========== Conduit Management ==========

    /**
     * @brief Register a conduit for its domain
     *
     * The engine takes ownership of the conduit. The contacts, messages
     * and calls conduits are registered on construction.
     */
    void registerConduit(Conduit *conduit);

    /**
     * @brief Get the conduit registered for a domain
     */
    Conduit* conduit(SyncDomain domain) const;

    // ========== Configuration ==========

    void setMergeStrategy(MergeStrategy strategy) { m_strategy = strategy; }
    MergeStrategy mergeStrategy() const { return m_strategy; }

    /**
     * @brief Engine used for the files domain
     *
     * Installs file access that reads imported files through the data
     * source. Call before the transfer engine is started so recovered
     * imports can be read too.
     */
    void setTransferEngine(TransferEngine *engine);

    /**
     * @brief Default destination for imported files
     */
    void setDownloadDirectory(const QString &path) { m_downloadDirectory = path; }
    QString downloadDirectory() const { return m_downloadDirectory; }

    // ========== Sync Operations ==========

    /**
     * @brief Run one pass for a domain
     *
     * The files domain imports every file the device offers into the
     * download directory.
     */
    SyncResult syncDomain(SyncDomain domain, const QString &deviceId);

    /**
     * @brief Sync contacts, messages and calls in that order
     */
    QList<SyncResult> syncAll(const QString &deviceId);

    /**
     * @brief Queue device files for import
     * @param files Paths to import; empty means everything the device offers
     * @param destinationDir Target directory; empty means the download directory
     * @param transferIds Ids of the queued transfers
     */
    SyncResult importFiles(const QString &deviceId, const QStringList &files = QStringList(),
                           const QString &destinationDir = QString(),
                           QStringList *transferIds = nullptr);

    // ========== Conflicts ==========

    /**
     * @brief Apply an explicit resolution to an open conflict
     * @return false if the conflict is unknown, already resolved, or cannot be written
     */
    bool resolveConflict(const QString &conflictId, ConflictResolution resolution,
                         QString *error = nullptr);

    QList<ConflictRecord> openConflicts();

signals:
    void syncStarted(Unison::SyncDomain domain);
    void syncFinished(const Unison::SyncResult &result);
    void progressUpdated(int current, int total, const QString &message);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);
    void conflictDetected(const QString &conflictId);

private:
    void connectConduitSignals(Conduit *conduit);
    void finish(SyncResult &result);
    SyncResult denied(SyncDomain domain, SyncError reason, qint64 retryAfterMs) const;

    SyncCoordinator *m_coordinator;
    RecordStore *m_store;
    DeviceDataSource *m_source;
    EventBus *m_bus;
    TransferEngine *m_transferEngine = nullptr;

    QMap<SyncDomain, Conduit*> m_conduits;
    MergeStrategy m_strategy = MergeStrategy::PreferDevice;
    QString m_downloadDirectory;
};

} // namespace Unison

#endif // SYNCENGINE_H
