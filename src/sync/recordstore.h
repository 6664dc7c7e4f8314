#ifndef RECORDSTORE_H
#define RECORDSTORE_H

#include <QObject>
#include <QString>
#include <QList>
#include <optional>
#include "records.h"
#include "../transfer/transfertypes.h"

namespace Unison {

/**
 * @brief Abstract persistence contract for all synchronized entities
 *
 * The store is the canonical copy of contacts, messages, call logs,
 * transfers, folders and conflicts. In-memory tables elsewhere are caches.
 *
 * Every call is atomic on its own; there are no multi-call transactions.
 * Implementations must serialize concurrent writers themselves, since
 * transfer workers persist progress from pool threads.
 *
 * Implementations:
 *   - LocalRecordStore: one JSON document per entity kind on disk
 */
class RecordStore : public QObject
{
    Q_OBJECT

public:
    explicit RecordStore(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~RecordStore() = default;

    /**
     * @brief Unique identifier for this store type
     */
    virtual QString storeId() const = 0;

    // ========== Contacts ==========

    virtual QList<Contact> contacts() = 0;
    virtual std::optional<Contact> contact(const QString &id) = 0;
    virtual bool upsertContact(const Contact &contact) = 0;
    virtual bool removeContact(const QString &id) = 0;

    // ========== Messages ==========

    /**
     * @brief Messages of one thread, or all messages if threadId is empty
     */
    virtual QList<Message> messages(const QString &threadId = QString()) = 0;
    virtual std::optional<Message> message(const QString &id) = 0;
    virtual bool upsertMessage(const Message &message) = 0;
    virtual bool removeMessage(const QString &id) = 0;

    virtual QList<MessageThread> threads() = 0;
    virtual std::optional<MessageThread> thread(const QString &id) = 0;
    virtual bool upsertThread(const MessageThread &thread) = 0;

    // ========== Call logs ==========

    virtual QList<CallLogEntry> callLogs() = 0;
    virtual std::optional<CallLogEntry> callLog(const QString &id) = 0;
    virtual bool upsertCallLog(const CallLogEntry &entry) = 0;
    virtual bool removeCallLog(const QString &id) = 0;

    // ========== Transfers ==========

    virtual QList<TransferRecord> transfers(const TransferFilter &filter = TransferFilter()) = 0;
    virtual std::optional<TransferRecord> transfer(const QString &id) = 0;
    virtual bool upsertTransfer(const TransferRecord &record) = 0;
    virtual bool removeTransfer(const QString &id) = 0;

    // ========== Folders ==========

    virtual QList<FileFolder> folders() = 0;
    virtual std::optional<FileFolder> folder(const QString &id) = 0;

    /**
     * @brief Insert a folder, leaving an existing folder with the same id untouched
     * @return true if the folder exists afterwards
     */
    virtual bool insertFolderIfMissing(const FileFolder &folder) = 0;
    virtual bool upsertFolder(const FileFolder &folder) = 0;

    /**
     * @brief Folder memberships of one transfer, or all if transferId is empty
     */
    virtual QList<FolderMembership> memberships(const QString &transferId = QString()) = 0;
    virtual bool addMembership(const FolderMembership &membership) = 0;

    // ========== Conflicts ==========

    virtual QList<ConflictRecord> conflicts(bool openOnly = false) = 0;
    virtual std::optional<ConflictRecord> conflict(const QString &id) = 0;
    virtual bool upsertConflict(const ConflictRecord &conflict) = 0;

    /**
     * @brief The open conflict recorded for a local record, if any
     */
    virtual std::optional<ConflictRecord> openConflictFor(const QString &localId) = 0;

    // ========== Batch Operations ==========

    /**
     * @brief Defer writes until commitBatch()
     *
     * Not all stores support this. Default implementation does nothing.
     */
    virtual void beginBatch() {}

    /**
     * @brief Commit batched writes
     * @return true on success
     */
    virtual bool commitBatch() { return true; }

    /**
     * @brief Check if store supports batching
     */
    virtual bool supportsBatch() const { return false; }

signals:
    void errorOccurred(const QString &error);
};

} // namespace Unison

#endif // RECORDSTORE_H
