#ifndef FILETYPES_H
#define FILETYPES_H

#include <QString>
#include <QMap>

namespace Unison {

/**
 * @brief File classification used for auto-organizing transfers
 *
 * The MIME type comes from Qt's shared MIME database, matched on the
 * file name only (the source may not be readable yet). The coarse file
 * type is one of: image, video, audio, document, app, other.
 */
namespace FileTypes {

QString mimeTypeForFile(const QString &fileName);
QString fileTypeForMime(const QString &mimeType);

/**
 * @brief Lower-case extension including the dot, or empty
 */
QString extensionOf(const QString &fileName);

/**
 * @brief Default folder id per file type
 *
 * image -> photos, video -> videos, document -> documents, anything
 * else -> downloads.
 */
QMap<QString, QString> defaultOrganizeMap();

QString folderForFileType(const QMap<QString, QString> &organizeMap, const QString &fileType);

} // namespace FileTypes

} // namespace Unison

#endif // FILETYPES_H
