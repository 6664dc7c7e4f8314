#include "transferio.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QCryptographicHash>
#include <memory>

namespace Unison {

QIODevice* TransferIo::openRead(const QString &path)
{
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::ReadOnly)) {
        return nullptr;
    }
    return file.release();
}

QIODevice* TransferIo::openWrite(const QString &path, bool append)
{
    QDir dir = QFileInfo(path).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        return nullptr;
    }

    auto file = std::make_unique<QFile>(path);
    QIODevice::OpenMode mode = QIODevice::WriteOnly;
    mode |= append ? QIODevice::Append : QIODevice::Truncate;
    if (!file->open(mode)) {
        return nullptr;
    }
    return file.release();
}

qint64 TransferIo::size(const QString &path)
{
    QFileInfo info(path);
    return info.exists() ? info.size() : -1;
}

bool TransferIo::exists(const QString &path)
{
    return QFile::exists(path);
}

bool TransferIo::remove(const QString &path)
{
    return !QFile::exists(path) || QFile::remove(path);
}

QString TransferIo::sha256(const QString &path, QString *error)
{
    std::unique_ptr<QIODevice> device(openRead(path));
    if (!device) {
        if (error) *error = QString("Cannot open %1 for hashing").arg(path);
        return QString();
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(device.get())) {
        if (error) *error = QString("Cannot read %1 for hashing").arg(path);
        return QString();
    }
    return QString::fromLatin1(hash.result().toHex());
}

} // namespace Unison
