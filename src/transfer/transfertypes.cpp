#include "transfertypes.h"

namespace Unison {

namespace {

QString isoString(const QDateTime &dt)
{
    return dt.isValid() ? dt.toString(Qt::ISODateWithMs) : QString();
}

QDateTime fromIso(const QJsonValue &value)
{
    return QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
}

} // namespace

QString statusName(TransferStatus status)
{
    switch (status) {
        case TransferStatus::Pending:    return "pending";
        case TransferStatus::InProgress: return "in_progress";
        case TransferStatus::Paused:     return "paused";
        case TransferStatus::Completed:  return "completed";
        case TransferStatus::Failed:     return "failed";
        case TransferStatus::Cancelled:  return "cancelled";
    }
    return "pending";
}

TransferStatus statusFromName(const QString &name)
{
    if (name == "in_progress") return TransferStatus::InProgress;
    if (name == "paused") return TransferStatus::Paused;
    if (name == "completed") return TransferStatus::Completed;
    if (name == "failed") return TransferStatus::Failed;
    if (name == "cancelled") return TransferStatus::Cancelled;
    return TransferStatus::Pending;
}

QString kindName(TransferKind kind)
{
    switch (kind) {
        case TransferKind::Import: return "import";
        case TransferKind::Export: return "export";
        case TransferKind::Sync:   return "sync";
    }
    return "import";
}

TransferKind kindFromName(const QString &name)
{
    if (name == "export") return TransferKind::Export;
    if (name == "sync") return TransferKind::Sync;
    return TransferKind::Import;
}

bool TransferFilter::matches(const TransferRecord &record) const
{
    if (!statuses.isEmpty() && !statuses.contains(record.status)) return false;
    if (!fileType.isEmpty() && record.fileType != fileType) return false;
    if (!deviceId.isEmpty() && record.deviceId != deviceId) return false;
    return true;
}

QString folderTypeName(FolderType type)
{
    switch (type) {
        case FolderType::Photos:    return "photos";
        case FolderType::Videos:    return "videos";
        case FolderType::Documents: return "documents";
        case FolderType::Downloads: return "downloads";
        case FolderType::Trash:     return "trash";
        case FolderType::Custom:    return "custom";
    }
    return "custom";
}

FolderType folderTypeFromName(const QString &name)
{
    if (name == "photos") return FolderType::Photos;
    if (name == "videos") return FolderType::Videos;
    if (name == "documents") return FolderType::Documents;
    if (name == "downloads") return FolderType::Downloads;
    if (name == "trash") return FolderType::Trash;
    return FolderType::Custom;
}

// ========== JSON mapping ==========

QJsonObject transferToJson(const TransferRecord &record)
{
    QJsonObject obj;
    obj["id"] = record.id;
    obj["filename"] = record.filename;
    obj["sourcePath"] = record.sourcePath;
    obj["destinationPath"] = record.destinationPath;
    obj["deviceId"] = record.deviceId;
    obj["fileSize"] = record.fileSize;
    obj["fileType"] = record.fileType;
    obj["mimeType"] = record.mimeType;
    obj["extension"] = record.extension;
    obj["kind"] = kindName(record.kind);
    obj["status"] = statusName(record.status);
    obj["progress"] = record.progress;
    obj["transferSpeed"] = record.transferSpeed;
    obj["bytesTransferred"] = record.bytesTransferred;
    obj["checksum"] = record.checksum;
    obj["error"] = errorName(record.error);
    obj["errorMessage"] = record.errorMessage;
    obj["retryCount"] = record.retryCount;
    obj["autoDeleteSource"] = record.autoDeleteSource;
    obj["folderId"] = record.folderId;
    obj["thumbnailPath"] = record.thumbnailPath;
    obj["createdAt"] = isoString(record.createdAt);
    obj["startedAt"] = isoString(record.startedAt);
    obj["completedAt"] = isoString(record.completedAt);
    obj["updatedAt"] = isoString(record.updatedAt);
    return obj;
}

TransferRecord transferFromJson(const QJsonObject &json)
{
    TransferRecord record;
    record.id = json["id"].toString();
    record.filename = json["filename"].toString();
    record.sourcePath = json["sourcePath"].toString();
    record.destinationPath = json["destinationPath"].toString();
    record.deviceId = json["deviceId"].toString();
    record.fileSize = json["fileSize"].toInteger();
    record.fileType = json["fileType"].toString();
    record.mimeType = json["mimeType"].toString();
    record.extension = json["extension"].toString();
    record.kind = kindFromName(json["kind"].toString());
    record.status = statusFromName(json["status"].toString());
    record.progress = json["progress"].toInt();
    record.transferSpeed = json["transferSpeed"].toDouble();
    record.bytesTransferred = json["bytesTransferred"].toInteger();
    record.checksum = json["checksum"].toString();
    record.error = errorFromName(json["error"].toString());
    record.errorMessage = json["errorMessage"].toString();
    record.retryCount = json["retryCount"].toInt();
    record.autoDeleteSource = json["autoDeleteSource"].toBool();
    record.folderId = json["folderId"].toString();
    record.thumbnailPath = json["thumbnailPath"].toString();
    record.createdAt = fromIso(json["createdAt"]);
    record.startedAt = fromIso(json["startedAt"]);
    record.completedAt = fromIso(json["completedAt"]);
    record.updatedAt = fromIso(json["updatedAt"]);
    return record;
}

QJsonObject folderToJson(const FileFolder &folder)
{
    QJsonObject obj;
    obj["id"] = folder.id;
    obj["name"] = folder.name;
    obj["parentId"] = folder.parentId;
    obj["type"] = folderTypeName(folder.type);
    obj["autoOrganize"] = folder.autoOrganize;
    obj["createdAt"] = isoString(folder.createdAt);
    return obj;
}

FileFolder folderFromJson(const QJsonObject &json)
{
    FileFolder folder;
    folder.id = json["id"].toString();
    folder.name = json["name"].toString();
    folder.parentId = json["parentId"].toString();
    folder.type = folderTypeFromName(json["type"].toString());
    folder.autoOrganize = json["autoOrganize"].toBool();
    folder.createdAt = fromIso(json["createdAt"]);
    return folder;
}

QJsonObject membershipToJson(const FolderMembership &membership)
{
    QJsonObject obj;
    obj["transferId"] = membership.transferId;
    obj["folderId"] = membership.folderId;
    obj["addedAt"] = isoString(membership.addedAt);
    return obj;
}

FolderMembership membershipFromJson(const QJsonObject &json)
{
    FolderMembership membership;
    membership.transferId = json["transferId"].toString();
    membership.folderId = json["folderId"].toString();
    membership.addedAt = fromIso(json["addedAt"]);
    return membership;
}

} // namespace Unison
