#include "thumbnailer.h"

#include <QDir>
#include <QImage>
#include <QImageReader>

namespace Unison {

Thumbnailer::Thumbnailer(const QString &thumbnailDir, int maxEdge)
    : m_thumbnailDir(thumbnailDir)
    , m_maxEdge(maxEdge)
{
}

QString Thumbnailer::create(const QString &imagePath, const QString &key, QString *error) const
{
    if (m_thumbnailDir.isEmpty()) {
        if (error) *error = "No thumbnail directory configured";
        return QString();
    }

    QImageReader reader(imagePath);
    reader.setAutoTransform(true);
    QImage image = reader.read();
    if (image.isNull()) {
        if (error) *error = QString("Cannot decode %1: %2").arg(imagePath, reader.errorString());
        return QString();
    }

    QDir dir(m_thumbnailDir);
    if (!dir.exists() && !dir.mkpath(".")) {
        if (error) *error = QString("Cannot create %1").arg(m_thumbnailDir);
        return QString();
    }

    QImage thumb = image.scaled(m_maxEdge, m_maxEdge, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    QString path = dir.filePath(key + ".jpg");
    if (!thumb.save(path, "JPG", 85)) {
        if (error) *error = QString("Cannot write %1").arg(path);
        return QString();
    }
    return path;
}

} // namespace Unison
