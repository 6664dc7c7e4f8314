#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLocale>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <QTextStream>
#include <QDir>
#include <QDebug>

#include "unisonsync_version.h"
#include "profile.h"
#include "sync/eventbus.h"
#include "sync/synccoordinator.h"
#include "sync/localrecordstore.h"
#include "sync/backupdatasource.h"
#include "sync/syncengine.h"
#include "sync/autosync.h"
#include "transfer/transferengine.h"

using namespace Unison;

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

void printResult(const SyncResult &result)
{
    out() << QString("%1: ").arg(domainName(result.domain), -8);
    if (!result.granted) {
        out() << "not admitted (" << errorName(result.error) << ")";
        if (result.retryAfterMs > 0) {
            out() << ", retry in " << (result.retryAfterMs + 999) / 1000 << "s";
        }
    } else if (result.success) {
        out() << result.stats.summary();
    } else {
        out() << "failed - " << result.errorMessage;
    }
    out() << Qt::endl;
}

void printDevices(const QList<DeviceDescriptor> &devices)
{
    if (devices.isEmpty()) {
        out() << "No devices found" << Qt::endl;
        return;
    }
    for (const DeviceDescriptor &device : devices) {
        out() << device.id << "  " << device.name;
        if (!device.model.isEmpty()) out() << " (" << device.model << ")";
        if (device.lastBackup.isValid()) {
            out() << "  last backup " << device.lastBackup.toString(Qt::ISODate);
        }
        out() << Qt::endl;
    }
}

void printStatistics(const TransferStatistics &stats)
{
    const QLocale locale = QLocale::c();
    out() << "Transfers: " << stats.totalTransfers
          << " (completed " << stats.completedTransfers
          << ", failed " << stats.failedTransfers
          << ", cancelled " << stats.cancelledTransfers << ")" << Qt::endl;
    out() << "Transferred: " << locale.formattedDataSize(stats.totalBytesTransferred)
          << ", average " << locale.formattedDataSize(static_cast<qint64>(stats.averageTransferSpeed))
          << "/s" << Qt::endl;
    for (auto it = stats.byType.constBegin(); it != stats.byType.constEnd(); ++it) {
        out() << "  " << it.key() << ": " << it.value().count << " file(s), "
              << locale.formattedDataSize(it.value().totalSize) << Qt::endl;
    }
}

void printConflicts(const QList<ConflictRecord> &conflicts)
{
    if (conflicts.isEmpty()) {
        out() << "No open conflicts" << Qt::endl;
        return;
    }
    for (const ConflictRecord &conflict : conflicts) {
        out() << conflict.id << "  " << conflict.localSnapshot.displayName
              << "  [" << conflict.fields.join(", ") << "]" << Qt::endl;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("UnisonSync");
    app.setApplicationVersion(UNISONSYNC_VERSION_STRING);
    app.setOrganizationName("UnisonSync");

    QCommandLineParser parser;
    parser.setApplicationDescription("Synchronize device contacts, messages, calls and files");
    parser.addHelpOption();
    parser.addVersionOption();

    const QString defaultProfile = QDir(QStandardPaths::writableLocation(QStandardPaths::HomeLocation))
                                       .filePath("UnisonSync");

    QCommandLineOption profileOption("profile", "Profile folder.", "dir", defaultProfile);
    QCommandLineOption deviceOption("device", "Device id (backup folder name).", "id");
    QCommandLineOption syncOption("sync", "Sync a domain: contacts, messages, calls, files or all.", "domain");
    QCommandLineOption importOption("import",
        "Import a device file, relative to the device's files folder (repeatable).", "file");
    QCommandLineOption destOption("dest", "Destination directory for imports.", "dir");
    QCommandLineOption listOption("list-devices", "List available devices.");
    QCommandLineOption statsOption("stats", "Show transfer statistics.");
    QCommandLineOption conflictsOption("conflicts", "List open contact conflicts.");
    QCommandLineOption resolveOption("resolve",
        "Resolve a conflict: <id>:<keep_local|keep_device|merge>.", "id:resolution");
    QCommandLineOption watchOption("watch",
        "Keep running and sync all domains periodically (also enabled by sync/autoSync).");
    QCommandLineOption intervalOption("interval",
        "Seconds between periodic syncs (overrides sync/interval).", "seconds");

    parser.addOptions({profileOption, deviceOption, syncOption, importOption, destOption,
                       listOption, statsOption, conflictsOption, resolveOption,
                       watchOption, intervalOption});
    parser.process(app);

    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} %{type}: %{message}");

    Profile profile(parser.value(profileOption));
    if (!profile.exists() && !profile.initialize()) {
        qCritical() << "[unisonsyncd] Cannot initialize profile at" << profile.profileFolderPath();
        return 1;
    }

    if (!profile.debugLogging()) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    qInfo() << "[unisonsyncd] UnisonSync" << UNISONSYNC_VERSION_STRING
            << "profile" << profile.profileFolderPath();

    LocalRecordStore store(profile.storePath());
    if (!store.load()) {
        qCritical() << "[unisonsyncd] Cannot load record store at" << profile.storePath();
        return 1;
    }

    EventBus bus;
    SyncCoordinator coordinator(profile.coordinatorConfig(), &bus);
    BackupDataSource source(profile.backupsPath());
    TransferEngine transfers(&store, &bus, profile.transferConfig());

    SyncEngine engine(&coordinator, &store, &source, &bus);
    engine.setMergeStrategy(profile.mergeStrategy());
    engine.setTransferEngine(&transfers);
    engine.setDownloadDirectory(profile.downloadsPath());

    QObject::connect(&bus, &EventBus::transferFailed,
                     [](const QString &id, SyncError error, const QString &message) {
        qWarning() << "[unisonsyncd] Transfer" << id << "failed:" << errorName(error) << message;
    });

    if (!transfers.start()) {
        qWarning() << "[unisonsyncd] Some interrupted transfers could not be requeued";
    }

    int exitCode = 0;

    if (parser.isSet(listOption)) {
        printDevices(source.scanDevices());
    }

    // Device selection: explicit, remembered, or the only one available
    QString deviceId = parser.value(deviceOption);
    if (deviceId.isEmpty()) {
        deviceId = profile.lastDeviceId();
    }
    if (deviceId.isEmpty()) {
        const QList<DeviceDescriptor> devices = source.scanDevices();
        if (devices.size() == 1) {
            deviceId = devices.first().id;
        }
    }

    const bool watch = parser.isSet(watchOption) || profile.autoSync();
    const bool needsDevice = parser.isSet(syncOption) || parser.isSet(importOption) || watch;
    if (needsDevice && deviceId.isEmpty()) {
        qCritical() << "[unisonsyncd] No device selected; use --device";
        return 1;
    }

    if (parser.isSet(syncOption)) {
        const QString target = parser.value(syncOption);
        QList<SyncResult> results;

        if (target == "all") {
            results = engine.syncAll(deviceId);
        } else {
            bool ok = false;
            SyncDomain domain = domainFromName(target, &ok);
            if (!ok) {
                qCritical() << "[unisonsyncd] Unknown domain:" << target;
                return 1;
            }
            results << engine.syncDomain(domain, deviceId);
        }

        for (const SyncResult &result : results) {
            printResult(result);
            if (result.granted && !result.success) {
                exitCode = 1;
            }
        }
    }

    if (parser.isSet(importOption)) {
        QStringList ids;
        SyncResult result = engine.importFiles(deviceId, parser.values(importOption),
                                               parser.value(destOption), &ids);
        printResult(result);
        if (!result.success) {
            exitCode = 1;
        }
    }

    if (parser.isSet(resolveOption)) {
        const QString request = parser.value(resolveOption);
        const int colon = request.lastIndexOf(':');
        bool ok = false;
        ConflictResolution resolution = resolutionFromName(request.mid(colon + 1), &ok);
        QString error;
        if (colon <= 0 || !ok) {
            qCritical() << "[unisonsyncd] Expected <id>:<keep_local|keep_device|merge>";
            exitCode = 1;
        } else if (!engine.resolveConflict(request.left(colon), resolution, &error)) {
            qCritical() << "[unisonsyncd]" << error;
            exitCode = 1;
        }
    }

    // Let queued transfers settle before reporting
    transfers.waitForDone();
    QCoreApplication::processEvents();

    if (parser.isSet(statsOption)) {
        printStatistics(transfers.statistics());
    }

    if (parser.isSet(conflictsOption)) {
        printConflicts(engine.openConflicts());
    }

    if (!deviceId.isEmpty() && deviceId != profile.lastDeviceId()) {
        profile.setLastDeviceId(deviceId);
        if (!profile.save()) {
            qWarning() << "[unisonsyncd] Could not save profile";
        }
    }

    if (watch) {
        int intervalMs = profile.syncInterval();
        if (parser.isSet(intervalOption)) {
            bool ok = false;
            const int seconds = parser.value(intervalOption).toInt(&ok);
            if (!ok || seconds <= 0) {
                qCritical() << "[unisonsyncd] Invalid interval:" << parser.value(intervalOption);
                transfers.shutdown();
                return 1;
            }
            intervalMs = seconds * 1000;
        }

        AutoSync autoSync(&engine);
        autoSync.setDeviceId(deviceId);
        autoSync.setInterval(intervalMs);
        QObject::connect(&autoSync, &AutoSync::passFinished,
                         [](const QList<SyncResult> &results) {
            for (const SyncResult &result : results) {
                if (result.granted) {
                    printResult(result);
                }
            }
        });

        autoSync.start();
        const int loopCode = app.exec();
        if (loopCode != 0) {
            exitCode = loopCode;
        }
        autoSync.stop();
    }

    transfers.shutdown();

    return exitCode;
}
