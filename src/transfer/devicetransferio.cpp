#include "devicetransferio.h"
#include "../sync/devicedatasource.h"

#include <QIODevice>
#include <QMutexLocker>
#include <QDebug>
#include <memory>

namespace Unison {

namespace {
const QString DEVICE_SCHEME = "device://";
}

DeviceTransferIo::DeviceTransferIo(DeviceDataSource *source)
    : m_source(source)
{
}

QString DeviceTransferIo::devicePath(const QString &deviceId, const QString &path)
{
    return DEVICE_SCHEME + deviceId + '/' + path;
}

bool DeviceTransferIo::isDevicePath(const QString &path)
{
    return path.startsWith(DEVICE_SCHEME);
}

bool DeviceTransferIo::split(const QString &path, QString *deviceId, QString *filePath)
{
    if (!isDevicePath(path)) {
        return false;
    }

    const QString rest = path.mid(DEVICE_SCHEME.size());
    const int slash = rest.indexOf('/');
    if (slash <= 0 || slash == rest.size() - 1) {
        return false;
    }

    *deviceId = rest.left(slash);
    *filePath = rest.mid(slash + 1);
    return true;
}

QIODevice* DeviceTransferIo::openRead(const QString &path)
{
    if (!isDevicePath(path)) {
        return TransferIo::openRead(path);
    }

    QString deviceId;
    QString filePath;
    if (!split(path, &deviceId, &filePath) || !m_source) {
        qWarning() << "[DeviceTransferIo] Malformed device path:" << path;
        return nullptr;
    }

    QMutexLocker locker(&m_mutex);
    QIODevice *stream = m_source->openReadStream(deviceId, filePath);
    if (!stream) {
        qDebug() << "[DeviceTransferIo] Cannot open" << path << "-" << m_source->lastError();
    }
    return stream;
}

qint64 DeviceTransferIo::size(const QString &path)
{
    if (!isDevicePath(path)) {
        return TransferIo::size(path);
    }

    std::unique_ptr<QIODevice> stream(openRead(path));
    if (!stream) {
        return -1;
    }
    if (!stream->isSequential()) {
        return stream->size();
    }

    // Sequential streams only know their size once drained
    qint64 total = 0;
    QByteArray buffer(64 * 1024, Qt::Uninitialized);
    forever {
        qint64 n = stream->read(buffer.data(), buffer.size());
        if (n < 0) return -1;
        if (n == 0 && !stream->waitForReadyRead(-1)) break;
        total += n;
    }
    return total;
}

bool DeviceTransferIo::exists(const QString &path)
{
    if (!isDevicePath(path)) {
        return TransferIo::exists(path);
    }
    std::unique_ptr<QIODevice> stream(openRead(path));
    return stream != nullptr;
}

bool DeviceTransferIo::remove(const QString &path)
{
    if (!isDevicePath(path)) {
        return TransferIo::remove(path);
    }
    qWarning() << "[DeviceTransferIo] Device files are read-only:" << path;
    return false;
}

} // namespace Unison
