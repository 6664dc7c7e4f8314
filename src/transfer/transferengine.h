#ifndef TRANSFERENGINE_H
#define TRANSFERENGINE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QMap>
#include <QMutex>
#include <QThreadPool>
#include <memory>
#include <optional>
#include "transfertypes.h"
#include "transferworker.h"

namespace Unison {

class RecordStore;
class EventBus;
class TransferIo;

/**
 * @brief Transfer engine settings
 */
struct TransferEngineConfig {
    int maxConcurrency = 3;
    qint64 chunkSize = 256 * 1024;
    qint64 bandwidthLimit = 0;              ///< Per transfer, bytes per second, 0 = unlimited
    QMap<QString, QString> organizeMap;     ///< File type -> folder id
    QString thumbnailDir;                   ///< Empty disables thumbnails

    static TransferEngineConfig defaults();
};

/**
 * @brief Queues and runs file copies with bounded concurrency
 *
 * Pending transfers wait in a FIFO queue. Whenever a slot is free the
 * head of the queue is marked in_progress and handed to a worker on a
 * pool limited to maxConcurrency threads, so at most maxConcurrency
 * transfers are ever in progress.
 *
 * Every transfer is verified against the SHA-256 of its source taken
 * at enqueue time. A mismatch fails the transfer and removes the
 * destination.
 *
 * The record store holds the canonical transfer records; the engine
 * only caches live progress of active transfers. On start() records
 * interrupted while in progress are queued again.
 *
 * Usage:
 * @code
 * TransferEngine engine(store, bus);
 * engine.start();
 *
 * TransferRequest request;
 * request.sourcePath = "/media/phone/DCIM/IMG_0001.JPG";
 * request.destinationPath = "/home/me/Pictures/";
 * QString id = engine.enqueue(request);
 * @endcode
 */
class TransferEngine : public QObject
{
    Q_OBJECT

public:
    TransferEngine(RecordStore *store, EventBus *bus,
                   const TransferEngineConfig &config = TransferEngineConfig::defaults(),
                   QObject *parent = nullptr);
    ~TransferEngine() override;

    /**
     * @brief Replace the file access layer
     *
     * Call before start().
     */
    void setIo(std::shared_ptr<TransferIo> io);

    TransferEngineConfig config() const { return m_config; }

    /**
     * @brief Create default folders and requeue interrupted transfers
     */
    bool start();

    /**
     * @brief Stop accepting work, stop all workers and wait for them
     *
     * Active transfers stay in_progress in the store and are picked up
     * again by the next start().
     */
    void shutdown();

    /**
     * @brief Block until no worker is running
     * @return false on timeout
     */
    bool waitForDone(int msecs = -1);

    // ========== Queue Operations ==========

    /**
     * @brief Validate, checksum and queue a file copy
     * @param error Set to IOError if the source cannot be read
     * @param message Human-readable failure reason
     * @return Transfer id, or empty on failure
     */
    QString enqueue(const TransferRequest &request,
                    SyncError *error = nullptr, QString *message = nullptr);

    /**
     * @brief Pause an in-progress transfer at its next chunk boundary
     * @return false if the transfer is not running or already finishing
     */
    bool pause(const QString &transferId);

    /**
     * @brief Put a paused transfer back at the tail of the queue
     */
    bool resume(const QString &transferId);

    /**
     * @brief Cancel a pending, in-progress or paused transfer
     *
     * The partial destination is removed. A running transfer that has
     * already committed its outcome can no longer be cancelled.
     */
    bool cancel(const QString &transferId);

    /**
     * @brief Queue a failed transfer again from the beginning
     */
    bool retry(const QString &transferId);

    // ========== Queries ==========

    std::optional<TransferRecord> transfer(const QString &transferId);
    QList<TransferRecord> transfers(const TransferFilter &filter = TransferFilter());
    QList<TransferProgress> activeTransfers() const;
    int activeCount() const;
    int queuedCount() const;

    TransferStatistics statistics();

    /**
     * @brief Write all transfer records to a file
     * @param format "json", "csv" or "txt"
     * @param exported Number of records written
     */
    bool exportTransfers(const QString &format, const QString &path,
                         int *exported = nullptr, QString *error = nullptr);

    // ========== Folders ==========

    QString createFolder(const QString &name, FolderType type = FolderType::Custom,
                         const QString &parentId = QString());
    QList<FileFolder> folders();
    bool addToFolder(const QString &transferId, const QString &folderId);

signals:
    void transferStatusChanged(const QString &transferId, Unison::TransferStatus status);

private:
    friend class TransferWorker;

    // Called from pool threads
    void workerProgress(const TransferRecord &record);
    void workerFinished(TransferRecord record, TransferWorker::Outcome outcome);

    // Callers hold m_mutex
    void drain();
    QString resolveDestination(const TransferRequest &request, const QString &filename) const;
    TransferProgress progressOf(const TransferRecord &record) const;

    void createDefaultFolders();
    void publishStatus(const TransferRecord &record);

    RecordStore *m_store;
    EventBus *m_bus;
    TransferEngineConfig m_config;
    std::shared_ptr<TransferIo> m_io;

    mutable QMutex m_mutex;
    QStringList m_queue;
    QMap<QString, std::shared_ptr<TransferControl>> m_active;
    QMap<QString, TransferProgress> m_progress;
    bool m_accepting = false;

    QThreadPool m_pool;
};

} // namespace Unison

#endif // TRANSFERENGINE_H
