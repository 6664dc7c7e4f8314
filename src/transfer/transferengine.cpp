#include "transferengine.h"
#include "transferio.h"
#include "filetypes.h"
#include "../sync/recordstore.h"
#include "../sync/eventbus.h"

#include <QDir>
#include <QFileInfo>
#include <QIODevice>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLocale>
#include <QMutexLocker>
#include <QTextStream>
#include <QUuid>
#include <QDebug>
#include <algorithm>

namespace Unison {

namespace {

QDateTime nowUtc()
{
    return QDateTime::currentDateTimeUtc();
}

QString csvField(const QString &value)
{
    QString escaped = value;
    escaped.replace('"', "\"\"");
    return '"' + escaped + '"';
}

} // namespace

TransferEngineConfig TransferEngineConfig::defaults()
{
    TransferEngineConfig config;
    config.organizeMap = FileTypes::defaultOrganizeMap();
    return config;
}

TransferEngine::TransferEngine(RecordStore *store, EventBus *bus,
                               const TransferEngineConfig &config, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_bus(bus)
    , m_config(config)
    , m_io(std::make_shared<TransferIo>())
{
    qRegisterMetaType<Unison::TransferStatus>("Unison::TransferStatus");

    if (m_config.maxConcurrency < 1) {
        qWarning() << "[TransferEngine] Invalid maxConcurrency" << m_config.maxConcurrency << "- using 1";
        m_config.maxConcurrency = 1;
    }
    m_pool.setMaxThreadCount(m_config.maxConcurrency);
}

TransferEngine::~TransferEngine()
{
    shutdown();
}

void TransferEngine::setIo(std::shared_ptr<TransferIo> io)
{
    QMutexLocker locker(&m_mutex);
    if (io) {
        m_io = std::move(io);
    }
}

// ========== Lifecycle ==========

void TransferEngine::createDefaultFolders()
{
    struct Default { const char *id; const char *name; FolderType type; };
    static const Default defaults[] = {
        {"photos", "Photos", FolderType::Photos},
        {"videos", "Videos", FolderType::Videos},
        {"documents", "Documents", FolderType::Documents},
        {"downloads", "Downloads", FolderType::Downloads},
        {"trash", "Trash", FolderType::Trash},
    };

    for (const Default &d : defaults) {
        FileFolder folder;
        folder.id = d.id;
        folder.name = d.name;
        folder.type = d.type;
        folder.autoOrganize = true;
        folder.createdAt = nowUtc();
        if (!m_store->insertFolderIfMissing(folder)) {
            qWarning() << "[TransferEngine] Failed to create default folder" << folder.name;
        }
    }
}

bool TransferEngine::start()
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_accepting) {
            return true;
        }
        m_accepting = true;
    }

    createDefaultFolders();

    TransferFilter filter;
    filter.statuses = {TransferStatus::Pending, TransferStatus::InProgress};
    QList<TransferRecord> incomplete = m_store->transfers(filter);

    // Oldest first
    std::sort(incomplete.begin(), incomplete.end(), [](const TransferRecord &a, const TransferRecord &b) {
        return a.createdAt < b.createdAt;
    });

    QList<TransferRecord> started;
    bool ok = true;
    {
        QMutexLocker locker(&m_mutex);
        for (TransferRecord &record : incomplete) {
            if (record.status == TransferStatus::InProgress) {
                record.status = TransferStatus::Pending;
                record.updatedAt = nowUtc();
                ok = m_store->upsertTransfer(record) && ok;
            }
            if (!m_queue.contains(record.id) && !m_active.contains(record.id)) {
                m_queue.append(record.id);
            }
        }
        drain();
    }

    if (!incomplete.isEmpty()) {
        qInfo() << "[TransferEngine] Resumed" << incomplete.size() << "incomplete transfer(s)";
    }
    return ok;
}

void TransferEngine::shutdown()
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_accepting && m_active.isEmpty()) {
            return;
        }
        m_accepting = false;
        m_queue.clear();
        for (const auto &control : m_active) {
            int expected = TransferControl::None;
            control->request.compare_exchange_strong(expected, TransferControl::Stop);
        }
    }

    m_pool.waitForDone();
    qDebug() << "[TransferEngine] Shut down";
}

bool TransferEngine::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}

// ========== Queue Operations ==========

QString TransferEngine::resolveDestination(const TransferRequest &request, const QString &filename) const
{
    QString dest = request.destinationPath;
    if (dest.isEmpty()) {
        return QString();
    }

    if (dest.endsWith('/') || QFileInfo(dest).isDir()) {
        dest = QDir(dest).filePath(filename);
    }

    // Never overwrite an existing file or another transfer's target
    auto taken = [this](const QString &path) {
        if (m_io->exists(path)) return true;
        TransferFilter live;
        live.statuses = {TransferStatus::Pending, TransferStatus::InProgress, TransferStatus::Paused};
        for (const TransferRecord &record : m_store->transfers(live)) {
            if (record.destinationPath == path) return true;
        }
        return false;
    };

    if (!taken(dest)) {
        return dest;
    }

    QFileInfo info(dest);
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix().isEmpty() ? QString() : "." + info.suffix();
    for (int n = 1; ; ++n) {
        QString candidate = info.dir().filePath(QString("%1 (%2)%3").arg(base).arg(n).arg(suffix));
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

QString TransferEngine::enqueue(const TransferRequest &request, SyncError *error, QString *message)
{
    auto reject = [&](const QString &reason) {
        qWarning() << "[TransferEngine] Rejected transfer:" << reason;
        if (error) *error = SyncError::IOError;
        if (message) *message = reason;
        return QString();
    };

    std::shared_ptr<TransferIo> io;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_accepting) {
            return reject("Transfer engine is not running");
        }
        io = m_io;
    }

    std::unique_ptr<QIODevice> readable(io->openRead(request.sourcePath));
    if (request.sourcePath.isEmpty() || !readable) {
        return reject(QString("Source is not readable: %1").arg(request.sourcePath));
    }
    readable.reset();

    QString hashError;
    const QString checksum = io->sha256(request.sourcePath, &hashError);
    if (checksum.isEmpty()) {
        return reject(hashError);
    }

    TransferRecord record;
    record.id = "transfer-" + QUuid::createUuid().toString(QUuid::WithoutBraces);
    record.filename = request.filename.isEmpty()
        ? QFileInfo(request.sourcePath).fileName() : request.filename;
    record.sourcePath = request.sourcePath;
    record.deviceId = request.deviceId;
    record.fileSize = qMax<qint64>(0, io->size(request.sourcePath));
    record.extension = FileTypes::extensionOf(record.filename);
    record.mimeType = FileTypes::mimeTypeForFile(record.filename);
    record.fileType = FileTypes::fileTypeForMime(record.mimeType);
    record.kind = request.kind;
    record.status = TransferStatus::Pending;
    record.checksum = checksum;
    record.autoDeleteSource = request.autoDeleteSource;
    record.folderId = request.folderId.isEmpty()
        ? FileTypes::folderForFileType(m_config.organizeMap, record.fileType)
        : request.folderId;
    record.createdAt = nowUtc();
    record.updatedAt = record.createdAt;

    {
        QMutexLocker locker(&m_mutex);
        if (!m_accepting) {
            return reject("Transfer engine is not running");
        }

        record.destinationPath = resolveDestination(request, record.filename);
        if (record.destinationPath.isEmpty()) {
            return reject("No destination given");
        }

        if (!m_store->upsertTransfer(record)) {
            return reject(QString("Cannot persist transfer %1").arg(record.filename));
        }

        FolderMembership membership;
        membership.transferId = record.id;
        membership.folderId = record.folderId;
        membership.addedAt = record.createdAt;
        if (!m_store->addMembership(membership)) {
            qWarning() << "[TransferEngine] Could not add" << record.filename << "to folder" << record.folderId;
        }

        m_queue.append(record.id);
        drain();
    }

    qInfo() << "[TransferEngine] Queued" << record.filename << "(" << record.id << ")";
    if (error) *error = SyncError::None;
    return record.id;
}

void TransferEngine::drain()
{
    while (m_accepting && m_active.size() < m_config.maxConcurrency && !m_queue.isEmpty()) {
        const QString id = m_queue.takeFirst();

        std::optional<TransferRecord> record = m_store->transfer(id);
        if (!record || record->status != TransferStatus::Pending) {
            continue;
        }

        record->status = TransferStatus::InProgress;
        if (!record->startedAt.isValid()) {
            record->startedAt = nowUtc();
        }
        record->updatedAt = nowUtc();
        if (!m_store->upsertTransfer(*record)) {
            qWarning() << "[TransferEngine] Could not mark" << id << "in progress";
        }

        auto control = std::make_shared<TransferControl>();
        m_active.insert(id, control);
        m_progress.insert(id, progressOf(*record));

        TransferWorker::Options options;
        options.chunkSize = m_config.chunkSize;
        options.bandwidthLimit = m_config.bandwidthLimit;
        options.thumbnailer = Thumbnailer(m_config.thumbnailDir);

        m_pool.start(new TransferWorker(this, *record, control, m_io, options));
        qDebug() << "[TransferEngine] Started" << record->filename
                 << "(" << m_active.size() << "/" << m_config.maxConcurrency << "active)";
    }
}

bool TransferEngine::pause(const QString &transferId)
{
    QMutexLocker locker(&m_mutex);
    auto control = m_active.value(transferId);
    if (!control) {
        return false;
    }

    int expected = TransferControl::None;
    return control->request.compare_exchange_strong(expected, TransferControl::Pause);
}

bool TransferEngine::resume(const QString &transferId)
{
    TransferRecord record;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_accepting || m_active.contains(transferId)) {
            return false;
        }

        std::optional<TransferRecord> stored = m_store->transfer(transferId);
        if (!stored || stored->status != TransferStatus::Paused) {
            return false;
        }

        record = *stored;
        record.status = TransferStatus::Pending;
        record.updatedAt = nowUtc();
        if (!m_store->upsertTransfer(record)) {
            return false;
        }

        m_queue.append(transferId);
        drain();
    }

    qDebug() << "[TransferEngine] Resumed" << record.filename;
    return true;
}

bool TransferEngine::cancel(const QString &transferId)
{
    TransferRecord record;
    {
        QMutexLocker locker(&m_mutex);

        if (auto control = m_active.value(transferId)) {
            // The worker reports Cancelled and the partial file goes in workerFinished().
            // Too late once the worker has committed or is stopping.
            int current = control->request.load();
            while (current != TransferControl::Committed && current != TransferControl::Stop) {
                if (control->request.compare_exchange_weak(current, TransferControl::Cancel)) {
                    return true;
                }
            }
            return false;
        }

        std::optional<TransferRecord> stored = m_store->transfer(transferId);
        if (!stored || (stored->status != TransferStatus::Pending
                        && stored->status != TransferStatus::Paused)) {
            return false;
        }

        m_queue.removeAll(transferId);

        record = *stored;
        if (!m_io->remove(record.destinationPath)) {
            qWarning() << "[TransferEngine] Could not remove partial file" << record.destinationPath;
        }
        record.status = TransferStatus::Cancelled;
        record.updatedAt = nowUtc();
        if (!m_store->upsertTransfer(record)) {
            return false;
        }
    }

    qInfo() << "[TransferEngine] Cancelled" << record.filename;
    publishStatus(record);
    return true;
}

bool TransferEngine::retry(const QString &transferId)
{
    std::optional<TransferRecord> stored = m_store->transfer(transferId);
    if (!stored || stored->status != TransferStatus::Failed) {
        return false;
    }

    std::shared_ptr<TransferIo> io;
    {
        QMutexLocker locker(&m_mutex);
        io = m_io;
    }

    // The source may have changed since the failed attempt
    QString hashError;
    const QString checksum = io->sha256(stored->sourcePath, &hashError);
    if (checksum.isEmpty()) {
        qWarning() << "[TransferEngine] Cannot retry" << stored->filename << "-" << hashError;
        return false;
    }

    TransferRecord record;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_accepting) {
            return false;
        }

        stored = m_store->transfer(transferId);
        if (!stored || stored->status != TransferStatus::Failed) {
            return false;
        }

        record = *stored;
        if (!m_io->remove(record.destinationPath)) {
            qWarning() << "[TransferEngine] Could not remove old destination" << record.destinationPath;
        }
        record.checksum = checksum;
        record.fileSize = qMax<qint64>(0, m_io->size(record.sourcePath));
        record.status = TransferStatus::Pending;
        record.progress = 0;
        record.bytesTransferred = 0;
        record.transferSpeed = 0.0;
        record.error = SyncError::None;
        record.errorMessage.clear();
        record.retryCount++;
        record.completedAt = QDateTime();
        record.updatedAt = nowUtc();
        if (!m_store->upsertTransfer(record)) {
            return false;
        }

        m_queue.append(transferId);
        drain();
    }

    qInfo() << "[TransferEngine] Retrying" << record.filename << "attempt" << record.retryCount;
    return true;
}

// ========== Worker callbacks ==========

TransferProgress TransferEngine::progressOf(const TransferRecord &record) const
{
    TransferProgress progress;
    progress.id = record.id;
    progress.filename = record.filename;
    progress.status = record.status;
    progress.progress = record.progress;
    progress.transferSpeed = record.transferSpeed;
    progress.bytesTransferred = record.bytesTransferred;
    if (record.transferSpeed > 0.0) {
        progress.estimatedSecondsRemaining =
            static_cast<qint64>((record.fileSize - record.bytesTransferred) / record.transferSpeed);
    }
    return progress;
}

void TransferEngine::workerProgress(const TransferRecord &record)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_active.contains(record.id)) {
            return;
        }
        m_progress.insert(record.id, progressOf(record));
    }

    // Only this worker writes the record while it is active
    TransferRecord persisted = record;
    persisted.updatedAt = nowUtc();
    if (!m_store->upsertTransfer(persisted)) {
        qWarning() << "[TransferEngine] Failed to persist progress of" << record.id;
    }

    if (m_bus) {
        m_bus->publishTransferProgress(record.id, record.progress, record.transferSpeed);
    }
}

void TransferEngine::workerFinished(TransferRecord record, TransferWorker::Outcome outcome)
{
    // Leave the active set first so callers that see the final status can act on it
    std::shared_ptr<TransferIo> io;
    {
        QMutexLocker locker(&m_mutex);
        m_active.remove(record.id);
        m_progress.remove(record.id);
        io = m_io;
    }

    switch (outcome) {
        case TransferWorker::Completed:
            record.status = TransferStatus::Completed;
            record.completedAt = nowUtc();
            record.error = SyncError::None;
            record.errorMessage.clear();
            break;

        case TransferWorker::Failed:
            if (!io->remove(record.destinationPath)) {
                qWarning() << "[TransferEngine] Could not remove" << record.destinationPath;
            }
            record.status = TransferStatus::Failed;
            break;

        case TransferWorker::Paused:
            record.status = TransferStatus::Paused;
            break;

        case TransferWorker::Cancelled:
            if (!io->remove(record.destinationPath)) {
                qWarning() << "[TransferEngine] Could not remove" << record.destinationPath;
            }
            record.status = TransferStatus::Cancelled;
            break;

        case TransferWorker::Stopped:
            // Left in progress for the next start()
            break;
    }

    record.updatedAt = nowUtc();
    if (!m_store->upsertTransfer(record)) {
        qWarning() << "[TransferEngine] Failed to persist final state of" << record.id;
    }

    {
        QMutexLocker locker(&m_mutex);
        drain();
    }

    switch (record.status) {
        case TransferStatus::Completed:
            qInfo() << "[TransferEngine] Completed" << record.filename;
            break;
        case TransferStatus::Failed:
            qWarning() << "[TransferEngine] Failed" << record.filename << "-" << record.errorMessage;
            break;
        default:
            qDebug() << "[TransferEngine]" << record.filename << "->" << statusName(record.status);
            break;
    }

    if (outcome != TransferWorker::Stopped) {
        publishStatus(record);
    }
}

void TransferEngine::publishStatus(const TransferRecord &record)
{
    emit transferStatusChanged(record.id, record.status);

    if (!m_bus) {
        return;
    }
    if (record.status == TransferStatus::Completed) {
        m_bus->publishTransferCompleted(record.id);
    } else if (record.status == TransferStatus::Failed) {
        m_bus->publishTransferFailed(record.id, record.error, record.errorMessage);
    }
}

// ========== Queries ==========

std::optional<TransferRecord> TransferEngine::transfer(const QString &transferId)
{
    return m_store->transfer(transferId);
}

QList<TransferRecord> TransferEngine::transfers(const TransferFilter &filter)
{
    return m_store->transfers(filter);
}

QList<TransferProgress> TransferEngine::activeTransfers() const
{
    QMutexLocker locker(&m_mutex);
    return m_progress.values();
}

int TransferEngine::activeCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_active.size();
}

int TransferEngine::queuedCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_queue.size();
}

TransferStatistics TransferEngine::statistics()
{
    TransferStatistics stats;
    const QList<TransferRecord> all = m_store->transfers();

    double speedSum = 0.0;
    int speedCount = 0;

    for (const TransferRecord &record : all) {
        stats.totalTransfers++;

        switch (record.status) {
            case TransferStatus::Failed:
                stats.failedTransfers++;
                continue;
            case TransferStatus::Cancelled:
                stats.cancelledTransfers++;
                continue;
            case TransferStatus::Completed:
                break;
            default:
                continue;
        }

        stats.completedTransfers++;
        stats.totalBytesTransferred += record.fileSize;
        if (record.transferSpeed > 0.0) {
            speedSum += record.transferSpeed;
            speedCount++;
        }

        TypeBreakdown &type = stats.byType[record.fileType];
        type.count++;
        type.totalSize += record.fileSize;

        TypeBreakdown &day = stats.byDate[record.createdAt.toLocalTime().date()];
        day.count++;
        day.totalSize += record.fileSize;
    }

    stats.averageTransferSpeed = speedCount > 0 ? speedSum / speedCount : 0.0;
    stats.recentTransfers = all.mid(0, 10);
    return stats;
}

bool TransferEngine::exportTransfers(const QString &format, const QString &path,
                                     int *exported, QString *error)
{
    const QString fmt = format.toLower();
    if (fmt != "json" && fmt != "csv" && fmt != "txt") {
        if (error) *error = QString("Unsupported export format: %1").arg(format);
        return false;
    }

    const QList<TransferRecord> all = m_store->transfers();
    QByteArray data;

    if (fmt == "json") {
        QJsonArray array;
        for (const TransferRecord &record : all) {
            array.append(transferToJson(record));
        }
        data = QJsonDocument(array).toJson(QJsonDocument::Indented);
    } else {
        QString text;
        QTextStream out(&text);

        if (fmt == "csv") {
            out << "id,filename,status,fileType,fileSize,bytesTransferred,"
                   "sourcePath,destinationPath,checksum,error,createdAt,completedAt\n";
            for (const TransferRecord &record : all) {
                QStringList fields = {
                    record.id, record.filename, statusName(record.status), record.fileType,
                    QString::number(record.fileSize), QString::number(record.bytesTransferred),
                    record.sourcePath, record.destinationPath, record.checksum,
                    record.error == SyncError::None ? QString() : errorName(record.error),
                    record.createdAt.toString(Qt::ISODate), record.completedAt.toString(Qt::ISODate)
                };
                for (QString &field : fields) {
                    field = csvField(field);
                }
                out << fields.join(',') << "\n";
            }
        } else {
            const QLocale locale = QLocale::c();
            for (const TransferRecord &record : all) {
                out << "Transfer: " << record.filename << "\n"
                    << "Status: " << statusName(record.status) << "\n"
                    << "Size: " << locale.formattedDataSize(record.fileSize) << "\n"
                    << "Date: " << record.createdAt.toString(Qt::ISODate) << "\n"
                    << "---\n\n";
            }
        }
        out.flush();
        data = text.toUtf8();
    }

    QDir dir = QFileInfo(path).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        if (error) *error = QString("Cannot create %1").arg(dir.path());
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) *error = QString("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    file.write(data);
    if (!file.commit()) {
        if (error) *error = QString("Cannot commit %1: %2").arg(path, file.errorString());
        return false;
    }

    if (exported) *exported = all.size();
    qInfo() << "[TransferEngine] Exported" << all.size() << "transfer(s) to" << path;
    return true;
}

// ========== Folders ==========

QString TransferEngine::createFolder(const QString &name, FolderType type, const QString &parentId)
{
    if (name.trimmed().isEmpty()) {
        return QString();
    }

    FileFolder folder;
    folder.id = "folder-" + QUuid::createUuid().toString(QUuid::WithoutBraces);
    folder.name = name.trimmed();
    folder.parentId = parentId;
    folder.type = type;
    folder.createdAt = nowUtc();

    if (!m_store->upsertFolder(folder)) {
        return QString();
    }
    return folder.id;
}

QList<FileFolder> TransferEngine::folders()
{
    return m_store->folders();
}

bool TransferEngine::addToFolder(const QString &transferId, const QString &folderId)
{
    if (!m_store->transfer(transferId) || !m_store->folder(folderId)) {
        return false;
    }

    FolderMembership membership;
    membership.transferId = transferId;
    membership.folderId = folderId;
    membership.addedAt = nowUtc();
    return m_store->addMembership(membership);
}

} // namespace Unison
