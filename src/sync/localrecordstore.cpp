#include "localrecordstore.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QDebug>
#include <algorithm>

namespace Unison {

LocalRecordStore::LocalRecordStore(const QString &basePath, QObject *parent)
    : RecordStore(parent)
    , m_basePath(basePath)
{
}

QString LocalRecordStore::tableFileName(Table table)
{
    switch (table) {
        case Contacts:    return "contacts.json";
        case Messages:    return "messages.json";
        case Threads:     return "threads.json";
        case CallLogs:    return "calllogs.json";
        case Transfers:   return "transfers.json";
        case Folders:     return "folders.json";
        case Memberships: return "memberships.json";
        case Conflicts:   return "conflicts.json";
        case TableCount:  break;
    }
    return QString();
}

// ========== Persistence ==========

bool LocalRecordStore::load()
{
    if (m_basePath.isEmpty()) {
        return true;
    }

    QString error;
    int loaded = 0;
    {
        QMutexLocker locker(&m_mutex);

        for (int t = 0; t < TableCount; ++t) {
            const Table table = static_cast<Table>(t);
            m_tables[t].clear();

            QFile file(QDir(m_basePath).filePath(tableFileName(table)));
            if (!file.exists()) {
                continue;
            }

            if (!file.open(QIODevice::ReadOnly)) {
                error = QString("Failed to open %1").arg(file.fileName());
                break;
            }

            QJsonParseError parseError;
            QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
            file.close();

            if (parseError.error != QJsonParseError::NoError) {
                error = QString("Failed to parse %1: %2")
                    .arg(file.fileName(), parseError.errorString());
                break;
            }

            const QJsonArray array = doc.object()["rows"].toArray();
            for (const QJsonValue &val : array) {
                QJsonObject obj = val.toObject();
                QString key = obj["_key"].toString();
                obj.remove("_key");
                m_tables[t].insert(key, obj);
            }
            loaded += m_tables[t].size();
        }
    }

    if (!error.isEmpty()) {
        qWarning() << "[LocalRecordStore]" << error;
        emit errorOccurred(error);
        return false;
    }

    qDebug() << "[LocalRecordStore] Loaded" << loaded << "rows from" << m_basePath;
    return true;
}

bool LocalRecordStore::writeTable(Table table, QString *error)
{
    if (m_basePath.isEmpty()) {
        m_dirty[table] = false;
        return true;
    }

    QDir dir(m_basePath);
    if (!dir.exists() && !dir.mkpath(".")) {
        *error = QString("Failed to create store directory: %1").arg(m_basePath);
        return false;
    }

    QJsonArray array;
    for (auto it = m_tables[table].constBegin(); it != m_tables[table].constEnd(); ++it) {
        QJsonObject obj = it.value();
        obj["_key"] = it.key();
        array.append(obj);
    }

    QJsonObject root;
    root["version"] = 1;
    root["rows"] = array;

    QSaveFile file(dir.filePath(tableFileName(table)));
    if (!file.open(QIODevice::WriteOnly)) {
        *error = QString("Failed to write %1").arg(file.fileName());
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        *error = QString("Failed to commit %1: %2").arg(file.fileName(), file.errorString());
        return false;
    }

    m_dirty[table] = false;
    return true;
}

bool LocalRecordStore::persist(Table table, QString *error)
{
    if (m_batchDepth > 0) {
        m_dirty[table] = true;
        return true;
    }
    return writeTable(table, error);
}

bool LocalRecordStore::report(bool ok, const QString &error)
{
    if (!ok) {
        qWarning() << "[LocalRecordStore]" << error;
        emit errorOccurred(error);
    }
    return ok;
}

void LocalRecordStore::beginBatch()
{
    QMutexLocker locker(&m_mutex);
    ++m_batchDepth;
}

bool LocalRecordStore::commitBatch()
{
    QString error;
    bool ok = true;
    {
        QMutexLocker locker(&m_mutex);
        if (m_batchDepth == 0) {
            return true;
        }
        if (--m_batchDepth > 0) {
            return true;
        }

        for (int t = 0; t < TableCount && ok; ++t) {
            if (m_dirty[t]) {
                ok = writeTable(static_cast<Table>(t), &error);
            }
        }
    }
    return report(ok, error);
}

// ========== Row helpers ==========

QList<QJsonObject> LocalRecordStore::rows(Table table) const
{
    return m_tables[table].values();
}

std::optional<QJsonObject> LocalRecordStore::row(Table table, const QString &key) const
{
    auto it = m_tables[table].constFind(key);
    if (it == m_tables[table].constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool LocalRecordStore::put(Table table, const QString &key, const QJsonObject &obj, QString *error)
{
    if (key.isEmpty()) {
        *error = QString("Cannot store row with empty id in %1").arg(tableFileName(table));
        return false;
    }
    m_tables[table].insert(key, obj);
    return persist(table, error);
}

bool LocalRecordStore::erase(Table table, const QString &key, QString *error)
{
    if (m_tables[table].remove(key) == 0) {
        return false;
    }
    return persist(table, error);
}

// ========== Contacts ==========

QList<Contact> LocalRecordStore::contacts()
{
    QMutexLocker locker(&m_mutex);
    QList<Contact> result;
    for (const QJsonObject &obj : rows(Contacts)) {
        result.append(contactFromJson(obj));
    }
    return result;
}

std::optional<Contact> LocalRecordStore::contact(const QString &id)
{
    QMutexLocker locker(&m_mutex);
    auto obj = row(Contacts, id);
    if (!obj) return std::nullopt;
    return contactFromJson(*obj);
}

bool LocalRecordStore::upsertContact(const Contact &contact)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = put(Contacts, contact.id, contactToJson(contact), &error);
    }
    return report(ok, error);
}

bool LocalRecordStore::removeContact(const QString &id)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = erase(Contacts, id, &error);
    }
    return error.isEmpty() ? ok : report(ok, error);
}

// ========== Messages ==========

QList<Message> LocalRecordStore::messages(const QString &threadId)
{
    QList<Message> result;
    {
        QMutexLocker locker(&m_mutex);
        for (const QJsonObject &obj : rows(Messages)) {
            Message message = messageFromJson(obj);
            if (threadId.isEmpty() || message.threadId == threadId) {
                result.append(message);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const Message &a, const Message &b) {
        return a.timestamp < b.timestamp;
    });
    return result;
}

std::optional<Message> LocalRecordStore::message(const QString &id)
{
    QMutexLocker locker(&m_mutex);
    auto obj = row(Messages, id);
    if (!obj) return std::nullopt;
    return messageFromJson(*obj);
}

bool LocalRecordStore::upsertMessage(const Message &message)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = put(Messages, message.id, messageToJson(message), &error);
    }
    return report(ok, error);
}

bool LocalRecordStore::removeMessage(const QString &id)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = erase(Messages, id, &error);
    }
    return error.isEmpty() ? ok : report(ok, error);
}

QList<MessageThread> LocalRecordStore::threads()
{
    QList<MessageThread> result;
    {
        QMutexLocker locker(&m_mutex);
        for (const QJsonObject &obj : rows(Threads)) {
            result.append(threadFromJson(obj));
        }
    }

    // Most recent conversation first
    std::sort(result.begin(), result.end(), [](const MessageThread &a, const MessageThread &b) {
        return a.lastMessageAt > b.lastMessageAt;
    });
    return result;
}

std::optional<MessageThread> LocalRecordStore::thread(const QString &id)
{
    QMutexLocker locker(&m_mutex);
    auto obj = row(Threads, id);
    if (!obj) return std::nullopt;
    return threadFromJson(*obj);
}

bool LocalRecordStore::upsertThread(const MessageThread &thread)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = put(Threads, thread.id, threadToJson(thread), &error);
    }
    return report(ok, error);
}

// ========== Call logs ==========

QList<CallLogEntry> LocalRecordStore::callLogs()
{
    QList<CallLogEntry> result;
    {
        QMutexLocker locker(&m_mutex);
        for (const QJsonObject &obj : rows(CallLogs)) {
            result.append(callLogFromJson(obj));
        }
    }

    std::sort(result.begin(), result.end(), [](const CallLogEntry &a, const CallLogEntry &b) {
        return a.startTime > b.startTime;
    });
    return result;
}

std::optional<CallLogEntry> LocalRecordStore::callLog(const QString &id)
{
    QMutexLocker locker(&m_mutex);
    auto obj = row(CallLogs, id);
    if (!obj) return std::nullopt;
    return callLogFromJson(*obj);
}

bool LocalRecordStore::upsertCallLog(const CallLogEntry &entry)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = put(CallLogs, entry.id, callLogToJson(entry), &error);
    }
    return report(ok, error);
}

bool LocalRecordStore::removeCallLog(const QString &id)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = erase(CallLogs, id, &error);
    }
    return error.isEmpty() ? ok : report(ok, error);
}

// ========== Transfers ==========

QList<TransferRecord> LocalRecordStore::transfers(const TransferFilter &filter)
{
    QList<TransferRecord> result;
    {
        QMutexLocker locker(&m_mutex);
        for (const QJsonObject &obj : rows(Transfers)) {
            TransferRecord record = transferFromJson(obj);
            if (filter.matches(record)) {
                result.append(record);
            }
        }
    }

    // Newest first, ties broken by id for a stable order
    std::sort(result.begin(), result.end(), [](const TransferRecord &a, const TransferRecord &b) {
        if (a.createdAt != b.createdAt) return a.createdAt > b.createdAt;
        return a.id > b.id;
    });

    if (filter.offset > 0) {
        result = result.mid(filter.offset);
    }
    if (filter.limit >= 0 && result.size() > filter.limit) {
        result = result.mid(0, filter.limit);
    }
    return result;
}

std::optional<TransferRecord> LocalRecordStore::transfer(const QString &id)
{
    QMutexLocker locker(&m_mutex);
    auto obj = row(Transfers, id);
    if (!obj) return std::nullopt;
    return transferFromJson(*obj);
}

bool LocalRecordStore::upsertTransfer(const TransferRecord &record)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = put(Transfers, record.id, transferToJson(record), &error);
    }
    return report(ok, error);
}

bool LocalRecordStore::removeTransfer(const QString &id)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = erase(Transfers, id, &error);
    }
    return error.isEmpty() ? ok : report(ok, error);
}

// ========== Folders ==========

QList<FileFolder> LocalRecordStore::folders()
{
    QList<FileFolder> result;
    {
        QMutexLocker locker(&m_mutex);
        for (const QJsonObject &obj : rows(Folders)) {
            result.append(folderFromJson(obj));
        }
    }

    std::sort(result.begin(), result.end(), [](const FileFolder &a, const FileFolder &b) {
        if (a.type != b.type) return a.type < b.type;
        return a.name < b.name;
    });
    return result;
}

std::optional<FileFolder> LocalRecordStore::folder(const QString &id)
{
    QMutexLocker locker(&m_mutex);
    auto obj = row(Folders, id);
    if (!obj) return std::nullopt;
    return folderFromJson(*obj);
}

bool LocalRecordStore::insertFolderIfMissing(const FileFolder &folder)
{
    QString error;
    bool ok = true;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_tables[Folders].contains(folder.id)) {
            ok = put(Folders, folder.id, folderToJson(folder), &error);
        }
    }
    return report(ok, error);
}

bool LocalRecordStore::upsertFolder(const FileFolder &folder)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = put(Folders, folder.id, folderToJson(folder), &error);
    }
    return report(ok, error);
}

QList<FolderMembership> LocalRecordStore::memberships(const QString &transferId)
{
    QMutexLocker locker(&m_mutex);
    QList<FolderMembership> result;
    for (const QJsonObject &obj : rows(Memberships)) {
        FolderMembership membership = membershipFromJson(obj);
        if (transferId.isEmpty() || membership.transferId == transferId) {
            result.append(membership);
        }
    }
    return result;
}

bool LocalRecordStore::addMembership(const FolderMembership &membership)
{
    QString error;
    bool ok = true;
    {
        QMutexLocker locker(&m_mutex);
        const QString key = membership.transferId + '/' + membership.folderId;
        // INSERT OR IGNORE semantics
        if (!m_tables[Memberships].contains(key)) {
            ok = put(Memberships, key, membershipToJson(membership), &error);
        }
    }
    return report(ok, error);
}

// ========== Conflicts ==========

QList<ConflictRecord> LocalRecordStore::conflicts(bool openOnly)
{
    QList<ConflictRecord> result;
    {
        QMutexLocker locker(&m_mutex);
        for (const QJsonObject &obj : rows(Conflicts)) {
            ConflictRecord conflict = conflictFromJson(obj);
            if (!openOnly || conflict.isOpen()) {
                result.append(conflict);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const ConflictRecord &a, const ConflictRecord &b) {
        return a.createdAt < b.createdAt;
    });
    return result;
}

std::optional<ConflictRecord> LocalRecordStore::conflict(const QString &id)
{
    QMutexLocker locker(&m_mutex);
    auto obj = row(Conflicts, id);
    if (!obj) return std::nullopt;
    return conflictFromJson(*obj);
}

bool LocalRecordStore::upsertConflict(const ConflictRecord &conflict)
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = put(Conflicts, conflict.id, conflictToJson(conflict), &error);
    }
    return report(ok, error);
}

std::optional<ConflictRecord> LocalRecordStore::openConflictFor(const QString &localId)
{
    QMutexLocker locker(&m_mutex);
    for (const QJsonObject &obj : rows(Conflicts)) {
        if (obj["localId"].toString() != localId) continue;
        ConflictRecord conflict = conflictFromJson(obj);
        if (conflict.isOpen()) {
            return conflict;
        }
    }
    return std::nullopt;
}

} // namespace Unison
