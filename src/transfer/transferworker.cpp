#include "transferworker.h"
#include "transferengine.h"
#include "transferio.h"

#include <QFileDevice>
#include <QIODevice>
#include <QThread>
#include <QDebug>

namespace Unison {

namespace {
const qint64 PERSIST_BYTES = 1024 * 1024;
const double SPEED_SMOOTHING = 0.3;
}

TransferWorker::TransferWorker(TransferEngine *engine,
                               const TransferRecord &record,
                               std::shared_ptr<TransferControl> control,
                               std::shared_ptr<TransferIo> io,
                               const Options &options)
    : m_engine(engine)
    , m_record(record)
    , m_control(std::move(control))
    , m_io(std::move(io))
    , m_options(options)
{
    setAutoDelete(true);
    if (m_options.chunkSize <= 0) {
        m_options.chunkSize = 256 * 1024;
    }
}

void TransferWorker::run()
{
    qDebug() << "[TransferWorker] Starting" << m_record.filename
             << "at byte" << m_record.bytesTransferred;

    Outcome outcome = copy();

    // Skip verification when a request is already pending
    if (outcome == Completed && !stopRequested() && !verify()) {
        outcome = Failed;
    }

    outcome = commit(outcome);

    if (outcome == Completed) {
        postProcess();
    }

    m_engine->workerFinished(m_record, outcome);
}

bool TransferWorker::stopRequested() const
{
    return m_control->request.load() != TransferControl::None;
}

TransferWorker::Outcome TransferWorker::commit(Outcome outcome)
{
    // Swap whatever request is pending for Committed; later requests are refused
    int request = m_control->request.load();
    while (!m_control->request.compare_exchange_weak(request, TransferControl::Committed)) {
    }

    switch (request) {
        case TransferControl::Pause:
            if (outcome != Paused) {
                qDebug() << "[TransferWorker] Pause arrived after copy of" << m_record.filename;
            }
            return Paused;
        case TransferControl::Cancel:
            if (outcome != Cancelled) {
                qDebug() << "[TransferWorker] Cancel arrived after copy of" << m_record.filename;
            }
            return Cancelled;
        case TransferControl::Stop:
            return Stopped;
        default:
            return outcome;
    }
}

TransferWorker::Outcome TransferWorker::fail(SyncError error, const QString &message)
{
    m_record.error = error;
    m_record.errorMessage = message;
    return Failed;
}

void TransferWorker::updateSpeed(qint64 chunkBytes, qint64 chunkMs)
{
    double instant = chunkBytes * 1000.0 / qMax<qint64>(1, chunkMs);
    if (m_record.transferSpeed <= 0.0) {
        m_record.transferSpeed = instant;
    } else {
        m_record.transferSpeed = SPEED_SMOOTHING * instant
                               + (1.0 - SPEED_SMOOTHING) * m_record.transferSpeed;
    }
}

bool TransferWorker::throttle(qint64 sessionBytes, const QElapsedTimer &session)
{
    const qint64 expectedMs = sessionBytes * 1000 / m_options.bandwidthLimit;
    while (session.elapsed() < expectedMs) {
        if (stopRequested()) {
            return false;
        }
        QThread::msleep(static_cast<unsigned long>(qMin<qint64>(50, expectedMs - session.elapsed())));
    }
    return true;
}

TransferWorker::Outcome TransferWorker::copy()
{
    std::unique_ptr<QIODevice> source(m_io->openRead(m_record.sourcePath));
    if (!source) {
        return fail(SyncError::IOError,
                    QString("Cannot open source: %1").arg(m_record.sourcePath));
    }

    // Continue a partial copy only if the destination holds exactly what was recorded
    bool append = false;
    if (m_record.bytesTransferred > 0
        && m_io->size(m_record.destinationPath) == m_record.bytesTransferred
        && source->seek(m_record.bytesTransferred)) {
        append = true;
    } else {
        if (m_record.bytesTransferred > 0) {
            qDebug() << "[TransferWorker] Partial destination does not match, restarting"
                     << m_record.filename;
        }
        source->seek(0);
        m_record.bytesTransferred = 0;
        m_record.progress = 0;
    }

    std::unique_ptr<QIODevice> dest(m_io->openWrite(m_record.destinationPath, append));
    if (!dest) {
        return fail(SyncError::IOError,
                    QString("Cannot open destination: %1").arg(m_record.destinationPath));
    }

    QByteArray buffer(static_cast<int>(m_options.chunkSize), Qt::Uninitialized);
    QElapsedTimer session;
    QElapsedTimer tick;
    session.start();
    tick.start();

    qint64 sessionBytes = 0;
    qint64 lastPersistBytes = m_record.bytesTransferred;
    int lastPercent = m_record.progress;

    forever {
        switch (m_control->request.load()) {
            case TransferControl::Pause:  return Paused;
            case TransferControl::Cancel: return Cancelled;
            case TransferControl::Stop:   return Stopped;
            default: break;
        }

        qint64 n = source->read(buffer.data(), buffer.size());
        if (n < 0) {
            return fail(SyncError::IOError,
                        QString("Read error on %1: %2").arg(m_record.sourcePath, source->errorString()));
        }
        if (n == 0) {
            break;
        }

        if (dest->write(buffer.constData(), n) != n) {
            return fail(SyncError::IOError,
                        QString("Write error on %1: %2").arg(m_record.destinationPath, dest->errorString()));
        }

        m_record.bytesTransferred += n;
        sessionBytes += n;

        if (m_options.bandwidthLimit > 0 && !throttle(sessionBytes, session)) {
            continue;
        }
        updateSpeed(n, tick.restart());

        m_record.progress = m_record.fileSize > 0
            ? static_cast<int>(qMin<qint64>(100, m_record.bytesTransferred * 100 / m_record.fileSize))
            : 100;

        if (m_record.progress > lastPercent
            || m_record.bytesTransferred - lastPersistBytes >= PERSIST_BYTES) {
            lastPercent = m_record.progress;
            lastPersistBytes = m_record.bytesTransferred;
            m_engine->workerProgress(m_record);
        }
    }

    if (auto *file = qobject_cast<QFileDevice *>(dest.get())) {
        if (!file->flush()) {
            return fail(SyncError::IOError,
                        QString("Flush failed on %1: %2").arg(m_record.destinationPath, file->errorString()));
        }
    }
    dest->close();

    m_record.progress = 100;
    return Completed;
}

bool TransferWorker::verify()
{
    QString error;
    QString actual = m_io->sha256(m_record.destinationPath, &error);
    if (actual.isEmpty()) {
        fail(SyncError::IOError, error);
        return false;
    }

    if (actual != m_record.checksum) {
        qWarning() << "[TransferWorker] Checksum mismatch for" << m_record.filename
                   << "expected" << m_record.checksum << "got" << actual;
        fail(SyncError::ChecksumMismatch,
             QString("Checksum mismatch: expected %1, got %2").arg(m_record.checksum, actual));
        return false;
    }
    return true;
}

void TransferWorker::postProcess()
{
    if (m_record.autoDeleteSource && m_record.kind == TransferKind::Import) {
        if (m_io->remove(m_record.sourcePath)) {
            qDebug() << "[TransferWorker] Source deleted:" << m_record.sourcePath;
        } else {
            qWarning() << "[TransferWorker] Failed to delete source:" << m_record.sourcePath;
        }
    }

    // Best effort; the image plugins decode few video formats
    if (m_record.fileType == "image" || m_record.fileType == "video") {
        QString error;
        QString thumb = m_options.thumbnailer.create(m_record.destinationPath, m_record.id, &error);
        if (thumb.isEmpty()) {
            qWarning() << "[TransferWorker] No thumbnail for" << m_record.filename << "-" << error;
        } else {
            m_record.thumbnailPath = thumb;
        }
    }
}

} // namespace Unison
