#ifndef BACKUPDATASOURCE_H
#define BACKUPDATASOURCE_H

#include "devicedatasource.h"
#include <QJsonArray>

namespace Unison {

/**
 * @brief Data source backed by extracted device backups
 *
 * Directory structure:
 *   <rootPath>/
 *   └── <deviceId>/
 *       ├── device.json      (name, model, osVersion, lastBackup)
 *       ├── contacts.json    (array of contacts)
 *       ├── messages.json    (array of messages)
 *       ├── calls.json       (array of call log entries)
 *       └── files/           (raw files offered for import)
 *
 * A device folder without device.json is still listed, named after
 * the folder. A missing record document is an empty snapshot; an
 * unreadable or malformed one is an error.
 */
class BackupDataSource : public DeviceDataSource
{
    Q_OBJECT

public:
    explicit BackupDataSource(const QString &rootPath, QObject *parent = nullptr);

    QString sourceId() const override { return "backup"; }
    QString rootPath() const { return m_rootPath; }

    QList<DeviceDescriptor> scanDevices() override;

    bool extractContacts(const QString &deviceId, QList<RemoteContact> &contacts) override;
    bool extractMessages(const QString &deviceId, QList<RemoteMessage> &messages) override;
    bool extractCallLogs(const QString &deviceId, QList<RemoteCallLog> &calls) override;

    QStringList listFiles(const QString &deviceId) override;
    QIODevice* openReadStream(const QString &deviceId, const QString &path) override;

private:
    QString devicePath(const QString &deviceId) const;
    bool readArray(const QString &deviceId, const QString &fileName, QJsonArray &array);

    QString m_rootPath;
};

} // namespace Unison

#endif // BACKUPDATASOURCE_H
