#include "filetypes.h"

#include <QFileInfo>
#include <QMimeDatabase>
#include <QMimeType>

namespace Unison {
namespace FileTypes {

QString extensionOf(const QString &fileName)
{
    QString suffix = QFileInfo(fileName).suffix().toLower();
    return suffix.isEmpty() ? QString() : "." + suffix;
}

QString mimeTypeForFile(const QString &fileName)
{
    static const QMimeDatabase db;
    QMimeType mime = db.mimeTypeForFile(fileName, QMimeDatabase::MatchExtension);
    if (!mime.isValid()) {
        return "application/octet-stream";
    }
    return mime.name();
}

QString fileTypeForMime(const QString &mimeType)
{
    if (mimeType.startsWith("image/")) return "image";
    if (mimeType.startsWith("video/")) return "video";
    if (mimeType.startsWith("audio/")) return "audio";
    if (mimeType.startsWith("text/")
        || mimeType.contains("pdf")
        || mimeType.contains("document")
        || mimeType.contains("msword")
        || mimeType.contains("spreadsheet")
        || mimeType.contains("presentation")) {
        return "document";
    }
    // Unknown content is not an application
    if (mimeType == "application/octet-stream") return "other";
    if (mimeType.startsWith("application/")) return "app";
    return "other";
}

QMap<QString, QString> defaultOrganizeMap()
{
    return {
        {"image", "photos"},
        {"video", "videos"},
        {"document", "documents"}
    };
}

QString folderForFileType(const QMap<QString, QString> &organizeMap, const QString &fileType)
{
    return organizeMap.value(fileType, "downloads");
}

} // namespace FileTypes
} // namespace Unison
