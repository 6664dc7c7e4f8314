#ifndef LOCALRECORDSTORE_H
#define LOCALRECORDSTORE_H

#include "recordstore.h"
#include <QString>
#include <QMap>
#include <QJsonObject>
#include <QMutex>

namespace Unison {

/**
 * @brief File-based record store
 *
 * Stores each entity kind as one JSON document:
 *   <basePath>/
 *   ├── contacts.json
 *   ├── messages.json
 *   ├── threads.json
 *   ├── calllogs.json
 *   ├── transfers.json
 *   ├── folders.json
 *   ├── memberships.json
 *   └── conflicts.json
 *
 * Documents are rewritten atomically (QSaveFile) after every mutating call,
 * or once per batch. With an empty base path the store is memory-only.
 * One mutex serializes all readers and writers.
 */
class LocalRecordStore : public RecordStore
{
    Q_OBJECT

public:
    /**
     * @brief Create a local store
     * @param basePath Directory holding the JSON documents (empty = memory only)
     * @param parent Parent QObject
     */
    explicit LocalRecordStore(const QString &basePath = QString(), QObject *parent = nullptr);
    ~LocalRecordStore() override = default;

    QString storeId() const override { return "local-json"; }

    QString basePath() const { return m_basePath; }

    /**
     * @brief Load all documents from disk
     * @return true if loaded successfully (or if nothing was stored yet)
     */
    bool load();

    // ========== Contacts ==========

    QList<Contact> contacts() override;
    std::optional<Contact> contact(const QString &id) override;
    bool upsertContact(const Contact &contact) override;
    bool removeContact(const QString &id) override;

    // ========== Messages ==========

    QList<Message> messages(const QString &threadId = QString()) override;
    std::optional<Message> message(const QString &id) override;
    bool upsertMessage(const Message &message) override;
    bool removeMessage(const QString &id) override;

    QList<MessageThread> threads() override;
    std::optional<MessageThread> thread(const QString &id) override;
    bool upsertThread(const MessageThread &thread) override;

    // ========== Call logs ==========

    QList<CallLogEntry> callLogs() override;
    std::optional<CallLogEntry> callLog(const QString &id) override;
    bool upsertCallLog(const CallLogEntry &entry) override;
    bool removeCallLog(const QString &id) override;

    // ========== Transfers ==========

    QList<TransferRecord> transfers(const TransferFilter &filter = TransferFilter()) override;
    std::optional<TransferRecord> transfer(const QString &id) override;
    bool upsertTransfer(const TransferRecord &record) override;
    bool removeTransfer(const QString &id) override;

    // ========== Folders ==========

    QList<FileFolder> folders() override;
    std::optional<FileFolder> folder(const QString &id) override;
    bool insertFolderIfMissing(const FileFolder &folder) override;
    bool upsertFolder(const FileFolder &folder) override;
    QList<FolderMembership> memberships(const QString &transferId = QString()) override;
    bool addMembership(const FolderMembership &membership) override;

    // ========== Conflicts ==========

    QList<ConflictRecord> conflicts(bool openOnly = false) override;
    std::optional<ConflictRecord> conflict(const QString &id) override;
    bool upsertConflict(const ConflictRecord &conflict) override;
    std::optional<ConflictRecord> openConflictFor(const QString &localId) override;

    // ========== Batch Operations ==========

    void beginBatch() override;
    bool commitBatch() override;
    bool supportsBatch() const override { return true; }

private:
    enum Table {
        Contacts,
        Messages,
        Threads,
        CallLogs,
        Transfers,
        Folders,
        Memberships,
        Conflicts,
        TableCount
    };

    static QString tableFileName(Table table);

    // Callers hold m_mutex
    QList<QJsonObject> rows(Table table) const;
    std::optional<QJsonObject> row(Table table, const QString &key) const;
    bool put(Table table, const QString &key, const QJsonObject &obj, QString *error);
    bool erase(Table table, const QString &key, QString *error);
    bool persist(Table table, QString *error);
    bool writeTable(Table table, QString *error);

    // Emits errorOccurred outside the lock
    bool report(bool ok, const QString &error);

    QString m_basePath;
    QMap<QString, QJsonObject> m_tables[TableCount];
    bool m_dirty[TableCount] = {};
    int m_batchDepth = 0;
    mutable QMutex m_mutex;
};

} // namespace Unison

#endif // LOCALRECORDSTORE_H
