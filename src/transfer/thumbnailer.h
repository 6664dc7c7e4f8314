#ifndef THUMBNAILER_H
#define THUMBNAILER_H

#include <QString>

namespace Unison {

/**
 * @brief Writes small JPEG previews of imported images
 *
 * Only images are thumbnailed; video files are skipped.
 */
class Thumbnailer
{
public:
    explicit Thumbnailer(const QString &thumbnailDir, int maxEdge = 300);

    QString thumbnailDir() const { return m_thumbnailDir; }

    /**
     * @brief Create a thumbnail for an image
     * @param imagePath Source image
     * @param key Base name of the thumbnail file
     * @param error Set when no thumbnail was written
     * @return Thumbnail path, or empty on failure
     */
    QString create(const QString &imagePath, const QString &key, QString *error = nullptr) const;

private:
    QString m_thumbnailDir;
    int m_maxEdge;
};

} // namespace Unison

#endif // THUMBNAILER_H
