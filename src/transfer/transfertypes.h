#ifndef TRANSFERTYPES_H
#define TRANSFERTYPES_H

#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QMetaType>
#include "../sync/synctypes.h"

/**
 * @file transfertypes.h
 * @brief File transfer records, requests and aggregate views
 */

namespace Unison {

enum class TransferStatus {
    Pending,
    InProgress,
    Paused,
    Completed,
    Failed,
    Cancelled
};

QString statusName(TransferStatus status);
TransferStatus statusFromName(const QString &name);

/**
 * @brief Completed, failed and cancelled transfers never change again
 */
inline bool isTerminal(TransferStatus status)
{
    return status == TransferStatus::Completed
        || status == TransferStatus::Failed
        || status == TransferStatus::Cancelled;
}

enum class TransferKind {
    Import,     ///< Device -> computer
    Export,     ///< Computer -> device
    Sync
};

QString kindName(TransferKind kind);
TransferKind kindFromName(const QString &name);

/**
 * @brief What the caller asks the engine to copy
 */
struct TransferRequest {
    QString sourcePath;
    QString destinationPath;
    QString filename;           ///< Defaults to the source file name
    QString deviceId;
    QString folderId;           ///< Explicit folder; empty means auto-organize
    TransferKind kind = TransferKind::Import;
    bool autoDeleteSource = false;
};

/**
 * @brief One file copy job
 *
 * Persisted in the record store; the engine keeps a cached copy
 * while the transfer is queued or active.
 */
struct TransferRecord {
    QString id;
    QString filename;
    QString sourcePath;
    QString destinationPath;
    QString deviceId;
    qint64 fileSize = 0;
    QString fileType;           ///< "image", "video", "audio", "document", "app", "other"
    QString mimeType;
    QString extension;
    TransferKind kind = TransferKind::Import;
    TransferStatus status = TransferStatus::Pending;
    int progress = 0;           ///< Percent, 0-100
    double transferSpeed = 0.0; ///< Smoothed bytes per second
    qint64 bytesTransferred = 0;
    QString checksum;           ///< SHA-256 of the source at enqueue time
    SyncError error = SyncError::None;
    QString errorMessage;
    int retryCount = 0;
    bool autoDeleteSource = false;
    QString folderId;
    QString thumbnailPath;
    QDateTime createdAt;
    QDateTime startedAt;
    QDateTime completedAt;
    QDateTime updatedAt;
};

/**
 * @brief Filter for transfer queries; empty fields match everything
 */
struct TransferFilter {
    QList<TransferStatus> statuses;
    QString fileType;
    QString deviceId;
    int limit = -1;
    int offset = 0;

    bool matches(const TransferRecord &record) const;
};

/**
 * @brief Live view of an active transfer
 */
struct TransferProgress {
    QString id;
    QString filename;
    TransferStatus status = TransferStatus::InProgress;
    int progress = 0;
    double transferSpeed = 0.0;
    qint64 bytesTransferred = 0;
    qint64 estimatedSecondsRemaining = -1;
};

struct TypeBreakdown {
    int count = 0;
    qint64 totalSize = 0;
};

/**
 * @brief Aggregate view over all recorded transfers
 */
struct TransferStatistics {
    int totalTransfers = 0;
    int completedTransfers = 0;
    int failedTransfers = 0;
    int cancelledTransfers = 0;
    qint64 totalBytesTransferred = 0;       ///< Sum of completed file sizes
    double averageTransferSpeed = 0.0;      ///< Over completed transfers with speed > 0
    QMap<QString, TypeBreakdown> byType;    ///< Completed transfers per file type
    QMap<QDate, TypeBreakdown> byDate;      ///< Completed transfers per creation day
    QList<TransferRecord> recentTransfers;  ///< Newest first, at most 10
};

enum class FolderType {
    Photos,
    Videos,
    Documents,
    Downloads,
    Trash,
    Custom
};

QString folderTypeName(FolderType type);
FolderType folderTypeFromName(const QString &name);

struct FileFolder {
    QString id;
    QString name;
    QString parentId;
    FolderType type = FolderType::Custom;
    bool autoOrganize = false;
    QDateTime createdAt;
};

struct FolderMembership {
    QString transferId;
    QString folderId;
    QDateTime addedAt;
};

QJsonObject transferToJson(const TransferRecord &record);
TransferRecord transferFromJson(const QJsonObject &json);

QJsonObject folderToJson(const FileFolder &folder);
FileFolder folderFromJson(const QJsonObject &json);

QJsonObject membershipToJson(const FolderMembership &membership);
FolderMembership membershipFromJson(const QJsonObject &json);

} // namespace Unison

Q_DECLARE_METATYPE(Unison::TransferStatus)
Q_DECLARE_METATYPE(Unison::TransferRecord)

#endif // TRANSFERTYPES_H
