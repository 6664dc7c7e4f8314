#ifndef DEVICEDATASOURCE_H
#define DEVICEDATASOURCE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include "records.h"

class QIODevice;

namespace Unison {

/**
 * @brief Abstract provider of device-side data
 *
 * A data source hands out snapshots of what a device (or an extracted
 * backup of it) holds. It never writes to the device.
 *
 * Extraction methods return false when the device data cannot be read;
 * lastError() then describes why.
 *
 * Implementations:
 *   - BackupDataSource: reads an extracted backup directory
 */
class DeviceDataSource : public QObject
{
    Q_OBJECT

public:
    explicit DeviceDataSource(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~DeviceDataSource() = default;

    /**
     * @brief Unique identifier for this source type
     */
    virtual QString sourceId() const = 0;

    /**
     * @brief Devices currently available
     */
    virtual QList<DeviceDescriptor> scanDevices() = 0;

    virtual bool extractContacts(const QString &deviceId, QList<RemoteContact> &contacts) = 0;
    virtual bool extractMessages(const QString &deviceId, QList<RemoteMessage> &messages) = 0;
    virtual bool extractCallLogs(const QString &deviceId, QList<RemoteCallLog> &calls) = 0;

    /**
     * @brief Files the device exposes for import, as paths usable by openReadStream()
     */
    virtual QStringList listFiles(const QString &deviceId) { Q_UNUSED(deviceId); return {}; }

    /**
     * @brief Open a raw byte stream for a device file
     * @return Open device, or nullptr on failure (caller owns)
     */
    virtual QIODevice* openReadStream(const QString &deviceId, const QString &path) = 0;

    QString lastError() const { return m_lastError; }

signals:
    void errorOccurred(const QString &error);

protected:
    bool fail(const QString &error)
    {
        m_lastError = error;
        emit errorOccurred(error);
        return false;
    }

    QString m_lastError;
};

} // namespace Unison

#endif // DEVICEDATASOURCE_H
