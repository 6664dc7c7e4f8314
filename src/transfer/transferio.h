#ifndef TRANSFERIO_H
#define TRANSFERIO_H

#include <QString>
#include <QByteArray>

class QIODevice;

namespace Unison {

/**
 * @brief File access used by the transfer engine and its workers
 *
 * All methods may be called concurrently from pool threads.
 * Returned devices are open and owned by the caller.
 */
class TransferIo
{
public:
    virtual ~TransferIo() = default;

    /**
     * @brief Open a file for reading, or nullptr on failure
     */
    virtual QIODevice* openRead(const QString &path);

    /**
     * @brief Open a file for writing, creating parent directories
     * @param append Keep existing content and write after it
     */
    virtual QIODevice* openWrite(const QString &path, bool append);

    /**
     * @brief Size of a file, or -1 if it does not exist
     */
    virtual qint64 size(const QString &path);

    virtual bool exists(const QString &path);
    virtual bool remove(const QString &path);

    /**
     * @brief SHA-256 of a file as lower-case hex, or empty on failure
     */
    QString sha256(const QString &path, QString *error = nullptr);
};

} // namespace Unison

#endif // TRANSFERIO_H
