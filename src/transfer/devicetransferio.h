#ifndef DEVICETRANSFERIO_H
#define DEVICETRANSFERIO_H

#include <QMutex>
#include "transferio.h"

namespace Unison {

class DeviceDataSource;

/**
 * @brief File access that reads device files through a data source
 *
 * Source paths built with devicePath() name a file on a device, e.g.
 * "device://phone-1/DCIM/IMG_0001.JPG". Reads and checksums of such
 * paths go through DeviceDataSource::openReadStream(); everything else,
 * destinations included, is a local file.
 *
 * Device files are read-only: remove() on a device path fails, so
 * auto-delete of an imported source only logs a warning.
 *
 * The data source is not thread-safe, so calls into it are serialized.
 * It must outlive this object.
 */
class DeviceTransferIo : public TransferIo
{
public:
    explicit DeviceTransferIo(DeviceDataSource *source);

    static QString devicePath(const QString &deviceId, const QString &path);
    static bool isDevicePath(const QString &path);

    QIODevice* openRead(const QString &path) override;
    qint64 size(const QString &path) override;
    bool exists(const QString &path) override;
    bool remove(const QString &path) override;

private:
    static bool split(const QString &path, QString *deviceId, QString *filePath);

    DeviceDataSource *m_source;
    QMutex m_mutex;
};

} // namespace Unison

#endif // DEVICETRANSFERIO_H
