/**
 * @file test_transferengine.cpp
 * @brief Unit tests for TransferEngine
 *
 * Tests queueing, bounded concurrency, integrity verification, the
 * transfer lifecycle, statistics, export, folders and restart recovery.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QFile>
#include <QDir>
#include <QImage>
#include <QJsonArray>
#include <QJsonDocument>
#include <QCryptographicHash>
#include <QSemaphore>
#include <atomic>
#include <memory>
#include "transfer/transferengine.h"
#include "transfer/transferio.h"
#include "transfer/filetypes.h"
#include "sync/localrecordstore.h"
#include "sync/eventbus.h"

using namespace Unison;

namespace {

/**
 * @brief File that flips the first byte of every write
 */
class CorruptingFile : public QFile
{
public:
    explicit CorruptingFile(const QString &name) : QFile(name) {}

protected:
    qint64 writeData(const char *data, qint64 len) override
    {
        QByteArray copy(data, static_cast<int>(len));
        if (!copy.isEmpty()) {
            copy[0] = static_cast<char>(~copy[0]);
        }
        return QFile::writeData(copy.constData(), len);
    }
};

/**
 * @brief File access that silently damages everything it writes
 */
class CorruptingIo : public TransferIo
{
public:
    QIODevice* openWrite(const QString &path, bool append) override
    {
        QDir().mkpath(QFileInfo(path).absolutePath());
        auto file = std::make_unique<CorruptingFile>(path);
        QIODevice::OpenMode mode = QIODevice::WriteOnly;
        mode |= append ? QIODevice::Append : QIODevice::Truncate;
        if (!file->open(mode)) {
            return nullptr;
        }
        return file.release();
    }
};

/**
 * @brief File access that stalls the first read of a destination
 *
 * The first read under the destination directory is the worker's
 * checksum pass, so the copy itself has already finished when the
 * test is told it may act.
 */
class StallingVerifyIo : public TransferIo
{
public:
    explicit StallingVerifyIo(const QString &destinationDir) : m_destinationDir(destinationDir) {}

    QIODevice* openRead(const QString &path) override
    {
        if (path.startsWith(m_destinationDir) && m_armed.exchange(false)) {
            reached.release();
            proceed.acquire();
        }
        return TransferIo::openRead(path);
    }

    QSemaphore reached;
    QSemaphore proceed;

private:
    QString m_destinationDir;
    std::atomic<bool> m_armed{true};
};

const int TIMEOUT_MS = 20000;

} // namespace

class TestTransferEngine : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Enqueue Tests ==========
    void testEnqueueRejectsMissingSource();
    void testEnqueueRequiresStart();
    void testEnqueueClassifiesFile();
    void testDestinationNeverOverwritten();

    // ========== Concurrency Tests ==========
    void testConcurrencyBound();
    void testQueueAdvancesWhenSlotFrees();

    // ========== Integrity Tests ==========
    void testCopyMatchesSource();
    void testCorruptedCopyFails();

    // ========== Lifecycle Tests ==========
    void testCancelPending();
    void testCancelInProgress();
    void testCancelCompletedRejected();
    void testPauseAndResume();
    void testCancelPausedRemovesPartial();
    void testResumeJoinsQueueTail();
    void testCancelDuringVerification();
    void testPauseDuringVerification();
    void testRetryFailed();
    void testAutoDeleteSource();
    void testThumbnailForImage();
    void testThumbnailAttemptedForVideo();
    void testBusEvents();
    void testProgressCadence();

    // ========== Recovery Tests ==========
    void testStartRequeuesInterrupted();
    void testShutdownLeavesInProgress();

    // ========== Statistics Tests ==========
    void testStatistics();
    void testExportFormats();
    void testExportUnsupportedFormat();

    // ========== Folder Tests ==========
    void testDefaultFolders();
    void testCustomFolder();

private:
    void createEngine(const TransferEngineConfig &config = TransferEngineConfig::defaults());
    QString createFile(const QString &name, qint64 size);
    QString destDir() const { return m_tempDir->filePath("dest") + '/'; }
    QString enqueueFile(const QString &source);
    TransferStatus statusOf(const QString &id);

    QTemporaryDir *m_tempDir;
    LocalRecordStore *m_store;
    EventBus *m_bus;
    TransferEngine *m_engine;
};

void TestTransferEngine::initTestCase()
{
    qDebug() << "Starting TransferEngine tests";
}

void TestTransferEngine::cleanupTestCase()
{
    qDebug() << "TransferEngine tests complete";
}

void TestTransferEngine::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_store = new LocalRecordStore(m_tempDir->filePath("store"));
    QVERIFY(m_store->load());
    m_bus = new EventBus();
    m_engine = nullptr;
}

void TestTransferEngine::cleanup()
{
    if (m_engine) {
        m_engine->shutdown();
    }
    delete m_engine;
    delete m_bus;
    delete m_store;
    delete m_tempDir;
    m_engine = nullptr;
    m_bus = nullptr;
    m_store = nullptr;
    m_tempDir = nullptr;
}

void TestTransferEngine::createEngine(const TransferEngineConfig &config)
{
    delete m_engine;
    m_engine = new TransferEngine(m_store, m_bus, config);
    QVERIFY(m_engine->start());
}

QString TestTransferEngine::createFile(const QString &name, qint64 size)
{
    const QString path = m_tempDir->filePath("src/" + name);
    QDir().mkpath(QFileInfo(path).absolutePath());

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return QString();
    }

    QByteArray block(64 * 1024, Qt::Uninitialized);
    quint32 seed = static_cast<quint32>(qHash(name));
    qint64 remaining = size;
    while (remaining > 0) {
        for (int i = 0; i < block.size(); ++i) {
            seed = seed * 1103515245u + 12345u;
            block[i] = static_cast<char>(seed >> 16);
        }
        qint64 n = qMin<qint64>(remaining, block.size());
        file.write(block.constData(), n);
        remaining -= n;
    }
    return path;
}

QString TestTransferEngine::enqueueFile(const QString &source)
{
    TransferRequest request;
    request.sourcePath = source;
    request.destinationPath = destDir();
    request.deviceId = "phone-1";
    return m_engine->enqueue(request);
}

TransferStatus TestTransferEngine::statusOf(const QString &id)
{
    auto record = m_engine->transfer(id);
    return record ? record->status : TransferStatus::Pending;
}

static QByteArray sha256Of(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    QCryptographicHash hash(QCryptographicHash::Sha256);
    hash.addData(&file);
    return hash.result().toHex();
}

// ========== Enqueue Tests ==========

void TestTransferEngine::testEnqueueRejectsMissingSource()
{
    createEngine();

    TransferRequest request;
    request.sourcePath = m_tempDir->filePath("src/missing.jpg");
    request.destinationPath = destDir();

    SyncError error = SyncError::None;
    QString message;
    QString id = m_engine->enqueue(request, &error, &message);

    QVERIFY(id.isEmpty());
    QCOMPARE(error, SyncError::IOError);
    QVERIFY(message.contains("missing.jpg"));
    QVERIFY(m_store->transfers().isEmpty());
}

void TestTransferEngine::testEnqueueRequiresStart()
{
    TransferEngine engine(m_store, m_bus);
    TransferRequest request;
    request.sourcePath = createFile("a.txt", 100);
    request.destinationPath = destDir();

    SyncError error = SyncError::None;
    QVERIFY(engine.enqueue(request, &error).isEmpty());
    QCOMPARE(error, SyncError::IOError);
}

void TestTransferEngine::testEnqueueClassifiesFile()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.bandwidthLimit = 1024;
    createEngine(config);

    const QString source = createFile("Report.PDF", 4096);
    QString id = enqueueFile(source);
    QVERIFY(!id.isEmpty());
    QVERIFY(id.startsWith("transfer-"));

    TransferRecord record = *m_engine->transfer(id);
    QCOMPARE(record.filename, QString("Report.PDF"));
    QCOMPARE(record.extension, QString(".pdf"));
    QCOMPARE(record.mimeType, QString("application/pdf"));
    QCOMPARE(record.fileType, QString("document"));
    QCOMPARE(record.folderId, QString("documents"));
    QCOMPARE(record.fileSize, qint64(4096));
    QCOMPARE(record.deviceId, QString("phone-1"));
    QCOMPARE(record.checksum.toUtf8(), sha256Of(source));
    QCOMPARE(record.destinationPath, destDir() + "Report.PDF");
    QCOMPARE(m_store->memberships(id).size(), 1);
}

void TestTransferEngine::testDestinationNeverOverwritten()
{
    createEngine();

    QDir().mkpath(destDir());
    QFile existing(destDir() + "photo.jpg");
    QVERIFY(existing.open(QIODevice::WriteOnly));
    existing.write("keep me");
    existing.close();

    QString id = enqueueFile(createFile("photo.jpg", 2048));
    QVERIFY(!id.isEmpty());
    QCOMPARE(m_engine->transfer(id)->destinationPath, destDir() + "photo (1).jpg");

    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Completed, TIMEOUT_MS);
    QVERIFY(existing.open(QIODevice::ReadOnly));
    QCOMPARE(existing.readAll(), QByteArray("keep me"));
}

// ========== Concurrency Tests ==========

void TestTransferEngine::testConcurrencyBound()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.maxConcurrency = 3;
    config.chunkSize = 64 * 1024;
    config.bandwidthLimit = 64 * 1024;
    createEngine(config);

    QStringList ids;
    for (int i = 0; i < 5; ++i) {
        QString id = enqueueFile(createFile(QString("clip%1.bin").arg(i), 1024 * 1024));
        QVERIFY(!id.isEmpty());
        ids << id;
    }

    TransferFilter inProgress;
    inProgress.statuses = {TransferStatus::InProgress};
    TransferFilter pending;
    pending.statuses = {TransferStatus::Pending};

    QCOMPARE(m_engine->transfers(inProgress).size(), 3);
    QCOMPARE(m_engine->transfers(pending).size(), 2);
    QCOMPARE(m_engine->activeCount(), 3);
    QCOMPARE(m_engine->queuedCount(), 2);

    // First in, first started
    QCOMPARE(statusOf(ids.at(0)), TransferStatus::InProgress);
    QCOMPARE(statusOf(ids.at(2)), TransferStatus::InProgress);
    QCOMPARE(statusOf(ids.at(3)), TransferStatus::Pending);
    QCOMPARE(m_engine->activeTransfers().size(), 3);
}

void TestTransferEngine::testQueueAdvancesWhenSlotFrees()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.maxConcurrency = 2;
    config.chunkSize = 64 * 1024;
    config.bandwidthLimit = 64 * 1024;
    createEngine(config);

    QString first = enqueueFile(createFile("one.bin", 1024 * 1024));
    QString second = enqueueFile(createFile("two.bin", 1024 * 1024));
    QString third = enqueueFile(createFile("three.bin", 1024 * 1024));
    QVERIFY(!second.isEmpty());
    QCOMPARE(statusOf(third), TransferStatus::Pending);

    QVERIFY(m_engine->cancel(first));
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(first), TransferStatus::Cancelled, TIMEOUT_MS);
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(third), TransferStatus::InProgress, TIMEOUT_MS);
    QVERIFY(m_engine->activeCount() <= 2);
}

// ========== Integrity Tests ==========

void TestTransferEngine::testCopyMatchesSource()
{
    createEngine();

    const QString source = createFile("archive.bin", 3 * 1024 * 1024 + 17);
    QString id = enqueueFile(source);
    QVERIFY(!id.isEmpty());

    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Completed, TIMEOUT_MS);

    TransferRecord record = *m_engine->transfer(id);
    QCOMPARE(record.progress, 100);
    QCOMPARE(record.bytesTransferred, record.fileSize);
    QVERIFY(record.completedAt.isValid());
    QCOMPARE(record.error, SyncError::None);
    QCOMPARE(sha256Of(record.destinationPath), sha256Of(source));
    QCOMPARE(QFileInfo(record.destinationPath).size(), QFileInfo(source).size());
}

void TestTransferEngine::testCorruptedCopyFails()
{
    createEngine();
    m_engine->setIo(std::make_shared<CorruptingIo>());

    QString id = enqueueFile(createFile("movie.bin", 10 * 1024 * 1024));
    QVERIFY(!id.isEmpty());

    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Failed, TIMEOUT_MS);

    TransferRecord record = *m_engine->transfer(id);
    QCOMPARE(record.error, SyncError::ChecksumMismatch);
    QVERIFY(record.errorMessage.startsWith("Checksum mismatch"));
    QVERIFY(!QFile::exists(record.destinationPath));
}

// ========== Lifecycle Tests ==========

void TestTransferEngine::testCancelPending()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.maxConcurrency = 1;
    config.bandwidthLimit = 64 * 1024;
    createEngine(config);

    QString active = enqueueFile(createFile("busy.bin", 1024 * 1024));
    QString waiting = enqueueFile(createFile("waiting.bin", 1024 * 1024));
    QCOMPARE(statusOf(waiting), TransferStatus::Pending);

    QVERIFY(m_engine->cancel(waiting));
    QCOMPARE(statusOf(waiting), TransferStatus::Cancelled);
    QCOMPARE(m_engine->queuedCount(), 0);
    QVERIFY(!QFile::exists(m_engine->transfer(waiting)->destinationPath));
    QCOMPARE(statusOf(active), TransferStatus::InProgress);
}

void TestTransferEngine::testCancelInProgress()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.chunkSize = 64 * 1024;
    config.bandwidthLimit = 128 * 1024;
    createEngine(config);

    QString id = enqueueFile(createFile("large.bin", 2 * 1024 * 1024));
    QCOMPARE(statusOf(id), TransferStatus::InProgress);

    QVERIFY(m_engine->cancel(id));
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Cancelled, TIMEOUT_MS);
    QVERIFY(!QFile::exists(m_engine->transfer(id)->destinationPath));
    QCOMPARE(m_engine->activeCount(), 0);
}

void TestTransferEngine::testCancelCompletedRejected()
{
    createEngine();

    QString id = enqueueFile(createFile("small.txt", 512));
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Completed, TIMEOUT_MS);

    QVERIFY(!m_engine->cancel(id));
    QVERIFY(!m_engine->pause(id));
    QVERIFY(!m_engine->resume(id));
    QVERIFY(!m_engine->retry(id));
    QCOMPARE(statusOf(id), TransferStatus::Completed);
    QVERIFY(QFile::exists(m_engine->transfer(id)->destinationPath));
}

void TestTransferEngine::testPauseAndResume()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.chunkSize = 64 * 1024;
    config.bandwidthLimit = 512 * 1024;
    createEngine(config);

    const QString source = createFile("resumable.bin", 2 * 1024 * 1024);
    QString id = enqueueFile(source);
    QVERIFY(m_engine->pause(id));

    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Paused, TIMEOUT_MS);
    QCOMPARE(m_engine->activeCount(), 0);
    QVERIFY(m_engine->transfer(id)->bytesTransferred < m_engine->transfer(id)->fileSize);

    QVERIFY(m_engine->resume(id));
    QVERIFY(!m_engine->resume(id));
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Completed, TIMEOUT_MS);
    QCOMPARE(sha256Of(m_engine->transfer(id)->destinationPath), sha256Of(source));
}

void TestTransferEngine::testCancelPausedRemovesPartial()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.chunkSize = 64 * 1024;
    config.bandwidthLimit = 128 * 1024;
    createEngine(config);

    QString id = enqueueFile(createFile("partial.bin", 2 * 1024 * 1024));
    QTRY_VERIFY_WITH_TIMEOUT(m_engine->transfer(id)->bytesTransferred > 0, TIMEOUT_MS);
    QVERIFY(m_engine->pause(id));
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Paused, TIMEOUT_MS);

    TransferRecord paused = *m_engine->transfer(id);
    QVERIFY(QFile::exists(paused.destinationPath));
    QCOMPARE(QFileInfo(paused.destinationPath).size(), paused.bytesTransferred);

    QVERIFY(m_engine->cancel(id));
    QCOMPARE(statusOf(id), TransferStatus::Cancelled);
    QVERIFY(!QFile::exists(paused.destinationPath));
    QVERIFY(!m_engine->resume(id));
}

void TestTransferEngine::testResumeJoinsQueueTail()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.maxConcurrency = 1;
    config.chunkSize = 64 * 1024;
    config.bandwidthLimit = 128 * 1024;
    createEngine(config);

    QString first = enqueueFile(createFile("first.bin", 2 * 1024 * 1024));
    QString second = enqueueFile(createFile("second.bin", 2 * 1024 * 1024));
    QCOMPARE(statusOf(first), TransferStatus::InProgress);
    QCOMPARE(statusOf(second), TransferStatus::Pending);

    QVERIFY(m_engine->pause(first));
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(first), TransferStatus::Paused, TIMEOUT_MS);
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(second), TransferStatus::InProgress, TIMEOUT_MS);

    QString third = enqueueFile(createFile("third.bin", 2 * 1024 * 1024));
    QCOMPARE(statusOf(third), TransferStatus::Pending);

    // Resumed work waits behind what was already queued
    QVERIFY(m_engine->resume(first));
    QCOMPARE(statusOf(first), TransferStatus::Pending);
    QCOMPARE(m_engine->queuedCount(), 2);

    QVERIFY(m_engine->cancel(second));
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(third), TransferStatus::InProgress, TIMEOUT_MS);
    QCOMPARE(statusOf(first), TransferStatus::Pending);
    QCOMPARE(m_engine->activeCount(), 1);
}

void TestTransferEngine::testCancelDuringVerification()
{
    createEngine();
    auto io = std::make_shared<StallingVerifyIo>(destDir());
    m_engine->setIo(io);

    const QString source = createFile("late.bin", 64 * 1024);
    TransferRequest request;
    request.sourcePath = source;
    request.destinationPath = destDir();
    request.autoDeleteSource = true;
    QString id = m_engine->enqueue(request);
    QVERIFY(!id.isEmpty());

    QVERIFY(io->reached.tryAcquire(1, TIMEOUT_MS));
    const bool cancelled = m_engine->cancel(id);
    io->proceed.release();
    QVERIFY(cancelled);

    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Cancelled, TIMEOUT_MS);
    QVERIFY(!QFile::exists(m_engine->transfer(id)->destinationPath));
    QVERIFY(QFile::exists(source));
    QCOMPARE(m_engine->activeCount(), 0);
}

void TestTransferEngine::testPauseDuringVerification()
{
    createEngine();
    auto io = std::make_shared<StallingVerifyIo>(destDir());
    m_engine->setIo(io);

    const QString source = createFile("almost.bin", 64 * 1024);
    QString id = enqueueFile(source);
    QVERIFY(!id.isEmpty());

    QVERIFY(io->reached.tryAcquire(1, TIMEOUT_MS));
    const bool paused = m_engine->pause(id);
    io->proceed.release();
    QVERIFY(paused);

    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Paused, TIMEOUT_MS);
    QVERIFY(!m_engine->transfer(id)->completedAt.isValid());

    QVERIFY(m_engine->resume(id));
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Completed, TIMEOUT_MS);
    QCOMPARE(sha256Of(m_engine->transfer(id)->destinationPath), sha256Of(source));
}

void TestTransferEngine::testRetryFailed()
{
    createEngine();
    m_engine->setIo(std::make_shared<CorruptingIo>());

    const QString source = createFile("flaky.bin", 256 * 1024);
    QString id = enqueueFile(source);
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Failed, TIMEOUT_MS);

    m_engine->setIo(std::make_shared<TransferIo>());
    QVERIFY(m_engine->retry(id));

    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Completed, TIMEOUT_MS);
    TransferRecord record = *m_engine->transfer(id);
    QCOMPARE(record.retryCount, 1);
    QCOMPARE(record.error, SyncError::None);
    QVERIFY(record.errorMessage.isEmpty());
    QCOMPARE(sha256Of(record.destinationPath), sha256Of(source));
}

void TestTransferEngine::testAutoDeleteSource()
{
    createEngine();

    const QString source = createFile("moveme.txt", 1000);
    TransferRequest request;
    request.sourcePath = source;
    request.destinationPath = destDir();
    request.autoDeleteSource = true;
    QString id = m_engine->enqueue(request);

    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Completed, TIMEOUT_MS);
    QVERIFY(!QFile::exists(source));
    QVERIFY(QFile::exists(m_engine->transfer(id)->destinationPath));
}

void TestTransferEngine::testThumbnailForImage()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.thumbnailDir = m_tempDir->filePath("thumbs");
    createEngine(config);

    const QString source = m_tempDir->filePath("src/sunset.png");
    QDir().mkpath(m_tempDir->filePath("src"));
    QImage image(640, 480, QImage::Format_RGB32);
    image.fill(Qt::darkBlue);
    QVERIFY(image.save(source, "PNG"));

    QString id = enqueueFile(source);
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Completed, TIMEOUT_MS);

    TransferRecord record = *m_engine->transfer(id);
    QCOMPARE(record.fileType, QString("image"));
    QCOMPARE(record.folderId, QString("photos"));
    QVERIFY(!record.thumbnailPath.isEmpty());

    QImage thumb(record.thumbnailPath);
    QVERIFY(!thumb.isNull());
    QCOMPARE(thumb.width(), 300);
    QCOMPARE(thumb.height(), 225);
}

void TestTransferEngine::testThumbnailAttemptedForVideo()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.thumbnailDir = m_tempDir->filePath("thumbs");
    createEngine(config);

    // A poster frame stored under a video name; the reader falls back to content sniffing
    const QString source = m_tempDir->filePath("src/clip.mp4");
    QDir().mkpath(m_tempDir->filePath("src"));
    QImage frame(400, 200, QImage::Format_RGB32);
    frame.fill(Qt::darkGreen);
    QVERIFY(frame.save(source, "PNG"));

    QString id = enqueueFile(source);
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Completed, TIMEOUT_MS);

    TransferRecord record = *m_engine->transfer(id);
    QCOMPARE(record.fileType, QString("video"));
    QCOMPARE(record.folderId, QString("videos"));
    QVERIFY(!record.thumbnailPath.isEmpty());
    QCOMPARE(QImage(record.thumbnailPath).width(), 300);

    // Undecodable video still completes, just without a thumbnail
    const QString movie = m_tempDir->filePath("src/movie.mkv");
    QFile movieFile(movie);
    QVERIFY(movieFile.open(QIODevice::WriteOnly));
    movieFile.write(QByteArray("not a decodable stream\n").repeated(512));
    movieFile.close();

    QString opaque = enqueueFile(movie);
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(opaque), TransferStatus::Completed, TIMEOUT_MS);
    QCOMPARE(m_engine->transfer(opaque)->fileType, QString("video"));
    QVERIFY(m_engine->transfer(opaque)->thumbnailPath.isEmpty());
}

void TestTransferEngine::testBusEvents()
{
    createEngine();

    QSignalSpy completedSpy(m_bus, &EventBus::transferCompleted);
    QSignalSpy progressSpy(m_bus, &EventBus::transferProgress);
    QSignalSpy failedSpy(m_bus, &EventBus::transferFailed);

    QString id = enqueueFile(createFile("events.bin", 512 * 1024));
    QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, TIMEOUT_MS);
    QCOMPARE(completedSpy.first().at(0).toString(), id);
    QVERIFY(progressSpy.count() > 0);

    m_engine->setIo(std::make_shared<CorruptingIo>());
    QString bad = enqueueFile(createFile("bad.bin", 1024));
    QTRY_COMPARE_WITH_TIMEOUT(failedSpy.count(), 1, TIMEOUT_MS);
    QCOMPARE(failedSpy.first().at(0).toString(), bad);
    QCOMPARE(failedSpy.first().at(1).value<SyncError>(), SyncError::ChecksumMismatch);
}

void TestTransferEngine::testProgressCadence()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.chunkSize = 4096;
    createEngine(config);

    QSignalSpy completedSpy(m_bus, &EventBus::transferCompleted);
    QSignalSpy progressSpy(m_bus, &EventBus::transferProgress);

    // 1024 chunks; every whole percent is crossed exactly once
    QString id = enqueueFile(createFile("steady.bin", 4 * 1024 * 1024));
    QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, TIMEOUT_MS);

    QCOMPARE(progressSpy.count(), 100);
    int last = 0;
    for (const QList<QVariant> &event : progressSpy) {
        QCOMPARE(event.at(0).toString(), id);
        QVERIFY(event.at(1).toInt() > last);
        last = event.at(1).toInt();
    }
    QCOMPARE(last, 100);
    QCOMPARE(m_engine->transfer(id)->progress, 100);
}

// ========== Recovery Tests ==========

void TestTransferEngine::testStartRequeuesInterrupted()
{
    const QString source = createFile("interrupted.bin", 700 * 1024);

    TransferRecord record;
    record.id = "transfer-interrupted";
    record.filename = "interrupted.bin";
    record.sourcePath = source;
    record.destinationPath = destDir() + "interrupted.bin";
    record.fileSize = QFileInfo(source).size();
    record.fileType = "other";
    record.status = TransferStatus::InProgress;
    record.bytesTransferred = 300 * 1024;   // no partial file on disk: restart from zero
    record.checksum = TransferIo().sha256(source);
    record.createdAt = QDateTime::currentDateTimeUtc().addSecs(-60);
    QVERIFY(m_store->upsertTransfer(record));

    createEngine();

    QTRY_COMPARE_WITH_TIMEOUT(statusOf(record.id), TransferStatus::Completed, TIMEOUT_MS);
    QCOMPARE(sha256Of(record.destinationPath), sha256Of(source));
}

void TestTransferEngine::testShutdownLeavesInProgress()
{
    TransferEngineConfig config = TransferEngineConfig::defaults();
    config.bandwidthLimit = 64 * 1024;
    createEngine(config);

    QString id = enqueueFile(createFile("slow.bin", 1024 * 1024));
    QCOMPARE(statusOf(id), TransferStatus::InProgress);

    m_engine->shutdown();
    QCOMPARE(m_engine->activeCount(), 0);
    QCOMPARE(statusOf(id), TransferStatus::InProgress);

    // Rejected while shut down
    SyncError error = SyncError::None;
    TransferRequest request;
    request.sourcePath = createFile("late.bin", 10);
    request.destinationPath = destDir();
    QVERIFY(m_engine->enqueue(request, &error).isEmpty());
    QCOMPARE(error, SyncError::IOError);
}

// ========== Statistics Tests ==========

void TestTransferEngine::testStatistics()
{
    createEngine();

    QString a = enqueueFile(createFile("a.txt", 1000));
    QString b = enqueueFile(createFile("b.txt", 3000));
    QString c = enqueueFile(createFile("c.qqq", 500));
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(a), TransferStatus::Completed, TIMEOUT_MS);
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(b), TransferStatus::Completed, TIMEOUT_MS);
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(c), TransferStatus::Completed, TIMEOUT_MS);

    TransferStatistics stats = m_engine->statistics();
    QCOMPARE(stats.totalTransfers, 3);
    QCOMPARE(stats.completedTransfers, 3);
    QCOMPARE(stats.failedTransfers, 0);
    QCOMPARE(stats.totalBytesTransferred, qint64(4500));
    QCOMPARE(stats.byType.value("document").count, 2);
    QCOMPARE(stats.byType.value("document").totalSize, qint64(4000));
    QCOMPARE(stats.byType.value("other").count, 1);
    QCOMPARE(stats.byDate.size(), 1);
    QCOMPARE(stats.recentTransfers.size(), 3);
    QVERIFY(stats.averageTransferSpeed > 0.0);
}

void TestTransferEngine::testExportFormats()
{
    createEngine();

    QString id = enqueueFile(createFile("notes, draft.txt", 2048));
    QTRY_COMPARE_WITH_TIMEOUT(statusOf(id), TransferStatus::Completed, TIMEOUT_MS);

    int exported = 0;
    QString error;

    const QString jsonPath = m_tempDir->filePath("export/transfers.json");
    QVERIFY(m_engine->exportTransfers("json", jsonPath, &exported, &error));
    QCOMPARE(exported, 1);
    QFile jsonFile(jsonPath);
    QVERIFY(jsonFile.open(QIODevice::ReadOnly));
    QJsonArray array = QJsonDocument::fromJson(jsonFile.readAll()).array();
    QCOMPARE(array.size(), 1);
    QCOMPARE(array.first().toObject()["id"].toString(), id);

    const QString csvPath = m_tempDir->filePath("export/transfers.csv");
    QVERIFY(m_engine->exportTransfers("CSV", csvPath, &exported, &error));
    QFile csvFile(csvPath);
    QVERIFY(csvFile.open(QIODevice::ReadOnly));
    QStringList lines = QString::fromUtf8(csvFile.readAll()).split('\n', Qt::SkipEmptyParts);
    QCOMPARE(lines.size(), 2);
    QVERIFY(lines.first().startsWith("id,filename,status"));
    QVERIFY(lines.at(1).contains("\"notes, draft.txt\""));
    QVERIFY(lines.at(1).contains("\"completed\""));

    const QString txtPath = m_tempDir->filePath("export/transfers.txt");
    QVERIFY(m_engine->exportTransfers("txt", txtPath, &exported, &error));
    QFile txtFile(txtPath);
    QVERIFY(txtFile.open(QIODevice::ReadOnly));
    QString text = QString::fromUtf8(txtFile.readAll());
    QVERIFY(text.contains("Transfer: notes, draft.txt"));
    QVERIFY(text.contains("Status: completed"));
    QVERIFY(text.contains("---"));
}

void TestTransferEngine::testExportUnsupportedFormat()
{
    createEngine();

    QString error;
    const QString path = m_tempDir->filePath("export/transfers.xml");
    QVERIFY(!m_engine->exportTransfers("xml", path, nullptr, &error));
    QVERIFY(error.contains("xml"));
    QVERIFY(!QFile::exists(path));
}

// ========== Folder Tests ==========

void TestTransferEngine::testDefaultFolders()
{
    createEngine();

    QList<FileFolder> folders = m_engine->folders();
    QCOMPARE(folders.size(), 5);

    QStringList ids;
    for (const FileFolder &folder : folders) {
        ids << folder.id;
        QVERIFY(folder.autoOrganize);
    }
    QVERIFY(ids.contains("photos"));
    QVERIFY(ids.contains("trash"));

    // Restarting does not duplicate them
    m_engine->shutdown();
    QVERIFY(m_engine->start());
    QCOMPARE(m_engine->folders().size(), 5);
}

void TestTransferEngine::testCustomFolder()
{
    createEngine();

    QString folderId = m_engine->createFolder("Holiday 2024", FolderType::Custom, "photos");
    QVERIFY(!folderId.isEmpty());
    QVERIFY(m_engine->createFolder("   ").isEmpty());

    QString id = enqueueFile(createFile("beach.qqq", 100));
    QCOMPARE(m_engine->transfer(id)->folderId, QString("downloads"));

    QVERIFY(m_engine->addToFolder(id, folderId));
    QVERIFY(m_engine->addToFolder(id, folderId));
    QVERIFY(!m_engine->addToFolder(id, "no-such-folder"));
    QVERIFY(!m_engine->addToFolder("no-such-transfer", folderId));

    QCOMPARE(m_store->memberships(id).size(), 2);
    QCOMPARE(m_store->folder(folderId)->parentId, QString("photos"));
}

QTEST_MAIN(TestTransferEngine)
#include "test_transferengine.moc"
