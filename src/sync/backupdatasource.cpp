#include "backupdatasource.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QDebug>

namespace Unison {

BackupDataSource::BackupDataSource(const QString &rootPath, QObject *parent)
    : DeviceDataSource(parent)
    , m_rootPath(rootPath)
{
}

QString BackupDataSource::devicePath(const QString &deviceId) const
{
    return QDir(m_rootPath).filePath(deviceId);
}

QList<DeviceDescriptor> BackupDataSource::scanDevices()
{
    QList<DeviceDescriptor> devices;

    QDir root(m_rootPath);
    if (!root.exists()) {
        qDebug() << "[BackupDataSource] Backup root does not exist:" << m_rootPath;
        return devices;
    }

    const QStringList entries = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString &entry : entries) {
        DeviceDescriptor device;

        QFile file(QDir(root.filePath(entry)).filePath("device.json"));
        if (file.open(QIODevice::ReadOnly)) {
            QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
            device = deviceFromJson(doc.object());
        }

        // The folder name is the identity the other calls use
        device.id = entry;
        if (device.name.isEmpty()) {
            device.name = entry;
        }
        device.backupPath = root.filePath(entry);
        devices.append(device);
    }

    qDebug() << "[BackupDataSource] Found" << devices.size() << "device(s) in" << m_rootPath;
    return devices;
}

bool BackupDataSource::readArray(const QString &deviceId, const QString &fileName, QJsonArray &array)
{
    array = QJsonArray();

    QDir dir(devicePath(deviceId));
    if (deviceId.isEmpty() || !dir.exists()) {
        return fail(QString("Unknown device: %1").arg(deviceId));
    }

    QFile file(dir.filePath(fileName));
    if (!file.exists()) {
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        return fail(QString("Cannot read %1: %2").arg(file.fileName(), file.errorString()));
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        return fail(QString("Malformed %1: %2").arg(file.fileName(),
            parseError.error != QJsonParseError::NoError ? parseError.errorString()
                                                          : QString("expected an array")));
    }

    array = doc.array();
    return true;
}

bool BackupDataSource::extractContacts(const QString &deviceId, QList<RemoteContact> &contacts)
{
    QJsonArray array;
    if (!readArray(deviceId, "contacts.json", array)) {
        return false;
    }

    contacts.clear();
    for (const QJsonValue &val : array) {
        RemoteContact contact = remoteContactFromJson(val.toObject());
        if (contact.id.isEmpty()) {
            qWarning() << "[BackupDataSource] Skipping contact without id";
            continue;
        }
        contacts.append(contact);
    }
    return true;
}

bool BackupDataSource::extractMessages(const QString &deviceId, QList<RemoteMessage> &messages)
{
    QJsonArray array;
    if (!readArray(deviceId, "messages.json", array)) {
        return false;
    }

    messages.clear();
    for (const QJsonValue &val : array) {
        RemoteMessage message = remoteMessageFromJson(val.toObject());
        if (message.id.isEmpty()) {
            qWarning() << "[BackupDataSource] Skipping message without id";
            continue;
        }
        messages.append(message);
    }
    return true;
}

bool BackupDataSource::extractCallLogs(const QString &deviceId, QList<RemoteCallLog> &calls)
{
    QJsonArray array;
    if (!readArray(deviceId, "calls.json", array)) {
        return false;
    }

    calls.clear();
    for (const QJsonValue &val : array) {
        RemoteCallLog call = remoteCallLogFromJson(val.toObject());
        if (call.id.isEmpty()) {
            qWarning() << "[BackupDataSource] Skipping call log without id";
            continue;
        }
        calls.append(call);
    }
    return true;
}

QStringList BackupDataSource::listFiles(const QString &deviceId)
{
    QStringList files;
    QDir filesDir(QDir(devicePath(deviceId)).filePath("files"));
    if (!filesDir.exists()) {
        return files;
    }

    QDirIterator it(filesDir.path(), QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files.append(it.next());
    }
    files.sort();
    return files;
}

QIODevice* BackupDataSource::openReadStream(const QString &deviceId, const QString &path)
{
    QString resolved = path;
    if (QFileInfo(path).isRelative()) {
        resolved = QDir(QDir(devicePath(deviceId)).filePath("files")).filePath(path);
    }

    auto *file = new QFile(resolved);
    if (!file->open(QIODevice::ReadOnly)) {
        fail(QString("Cannot open %1: %2").arg(resolved, file->errorString()));
        delete file;
        return nullptr;
    }
    return file;
}

} // namespace Unison
