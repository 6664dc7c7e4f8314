#include "profile.h"
#include "sync/synccoordinator.h"
#include "sync/autosync.h"
#include "transfer/transferengine.h"
#include "transfer/filetypes.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>

using namespace Unison;

const QString Profile::CONFIG_FILE_NAME = "unisonsync.conf";
const QStringList Profile::ORGANIZED_TYPES = {"image", "video", "audio", "document", "app", "other"};

Profile::Profile(const QString &profileFolderPath)
    : m_profileFolderPath(profileFolderPath)
{
    const CoordinatorConfig coordinator = CoordinatorConfig::defaults();
    m_cooldowns = coordinator.cooldowns;
    m_mergeStrategy = MergeStrategy::PreferDevice;
    m_syncInterval = AutoSync::DEFAULT_INTERVAL_MS;
    m_emergencyThreshold = coordinator.emergencyThreshold;
    m_emergencyMultiplier = coordinator.emergencyMultiplier;
    m_spikeDelta = coordinator.spikeDelta;

    const TransferEngineConfig transfer = TransferEngineConfig::defaults();
    m_maxConcurrency = transfer.maxConcurrency;
    m_chunkSize = transfer.chunkSize;
    m_bandwidthLimit = transfer.bandwidthLimit;
    m_organize = transfer.organizeMap;

    // Try to load existing settings if path is set
    if (!m_profileFolderPath.isEmpty()) {
        load();
    }
}

void Profile::setProfileFolderPath(const QString &path)
{
    m_profileFolderPath = path;
}

QString Profile::name() const
{
    if (!m_name.isEmpty()) {
        return m_name;
    }
    // Default to folder name
    if (!m_profileFolderPath.isEmpty()) {
        return QFileInfo(m_profileFolderPath).fileName();
    }
    return QString();
}

void Profile::setName(const QString &name)
{
    m_name = name;
}

bool Profile::isValid() const
{
    if (m_profileFolderPath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_profileFolderPath);
    return info.exists() && info.isDir() && info.isWritable();
}

bool Profile::exists() const
{
    return QFile::exists(configFilePath());
}

// ========== Settings ==========

qint64 Profile::cooldown(SyncDomain domain) const
{
    return m_cooldowns.value(domain, 0);
}

void Profile::setCooldown(SyncDomain domain, qint64 ms)
{
    m_cooldowns[domain] = ms;
}

QString Profile::organizeFolder(const QString &fileType) const
{
    return FileTypes::folderForFileType(m_organize, fileType);
}

void Profile::setOrganizeFolder(const QString &fileType, const QString &folderId)
{
    m_organize[fileType] = folderId;
}

CoordinatorConfig Profile::coordinatorConfig() const
{
    CoordinatorConfig config;
    config.cooldowns = m_cooldowns;
    config.emergencyThreshold = m_emergencyThreshold;
    config.emergencyMultiplier = m_emergencyMultiplier;
    config.spikeDelta = m_spikeDelta;
    return config;
}

TransferEngineConfig Profile::transferConfig() const
{
    TransferEngineConfig config;
    config.maxConcurrency = m_maxConcurrency;
    config.chunkSize = m_chunkSize;
    config.bandwidthLimit = m_bandwidthLimit;
    config.organizeMap = m_organize;
    config.thumbnailDir = thumbnailsPath();
    return config;
}

// ========== Persistence ==========

bool Profile::load()
{
    QString configPath = configFilePath();
    if (!QFile::exists(configPath)) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    // Profile identity
    m_name = settings.value("profile/name", QString()).toString();
    m_lastDeviceId = settings.value("profile/lastDevice", QString()).toString();

    // Sync settings
    const CoordinatorConfig defaults = CoordinatorConfig::defaults();
    for (SyncDomain domain : allDomains()) {
        m_cooldowns[domain] = settings.value(
            QString("sync/cooldown/%1").arg(domainName(domain)),
            defaults.cooldowns.value(domain)).toLongLong();
    }
    m_mergeStrategy = mergeStrategyFromName(
        settings.value("sync/mergeStrategy", "prefer_device").toString());
    m_autoSync = settings.value("sync/autoSync", false).toBool();
    m_syncInterval = settings.value("sync/interval", AutoSync::DEFAULT_INTERVAL_MS).toInt();

    // Emergency settings
    m_emergencyThreshold = settings.value("emergency/threshold", defaults.emergencyThreshold).toInt();
    m_emergencyMultiplier = settings.value("emergency/multiplier", defaults.emergencyMultiplier).toInt();
    m_spikeDelta = settings.value("emergency/spikeDelta", defaults.spikeDelta).toInt();

    // Transfer settings
    const TransferEngineConfig transfer = TransferEngineConfig::defaults();
    m_maxConcurrency = settings.value("transfer/maxConcurrency", transfer.maxConcurrency).toInt();
    m_chunkSize = settings.value("transfer/chunkSize", transfer.chunkSize).toLongLong();
    m_bandwidthLimit = settings.value("transfer/bandwidthLimit", transfer.bandwidthLimit).toLongLong();

    m_organize = transfer.organizeMap;
    settings.beginGroup("organize");
    for (const QString &fileType : settings.childKeys()) {
        m_organize[fileType] = settings.value(fileType).toString();
    }
    settings.endGroup();

    // Paths
    m_storePath = settings.value("paths/store", QString()).toString();
    m_backupsPath = settings.value("paths/backups", QString()).toString();
    m_downloadsPath = settings.value("paths/downloads", QString()).toString();

    m_debugLogging = settings.value("advanced/debugLogging", false).toBool();

    return true;
}

bool Profile::save()
{
    if (m_profileFolderPath.isEmpty()) {
        return false;
    }

    // Ensure directory exists
    QDir dir(m_profileFolderPath);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    QSettings settings(configFilePath(), QSettings::IniFormat);

    // Profile identity
    if (!m_name.isEmpty()) {
        settings.setValue("profile/name", m_name);
    }
    if (!m_lastDeviceId.isEmpty()) {
        settings.setValue("profile/lastDevice", m_lastDeviceId);
    }

    // Sync settings
    for (SyncDomain domain : allDomains()) {
        settings.setValue(QString("sync/cooldown/%1").arg(domainName(domain)), cooldown(domain));
    }
    settings.setValue("sync/mergeStrategy", mergeStrategyName(m_mergeStrategy));
    settings.setValue("sync/autoSync", m_autoSync);
    settings.setValue("sync/interval", m_syncInterval);

    // Emergency settings
    settings.setValue("emergency/threshold", m_emergencyThreshold);
    settings.setValue("emergency/multiplier", m_emergencyMultiplier);
    settings.setValue("emergency/spikeDelta", m_spikeDelta);

    // Transfer settings
    settings.setValue("transfer/maxConcurrency", m_maxConcurrency);
    settings.setValue("transfer/chunkSize", m_chunkSize);
    settings.setValue("transfer/bandwidthLimit", m_bandwidthLimit);

    QStringList organized = ORGANIZED_TYPES;
    for (const QString &fileType : m_organize.keys()) {
        if (!organized.contains(fileType)) organized << fileType;
    }
    for (const QString &fileType : organized) {
        settings.setValue(QString("organize/%1").arg(fileType), organizeFolder(fileType));
    }

    // Paths are only written when overridden
    if (!m_storePath.isEmpty()) settings.setValue("paths/store", m_storePath);
    if (!m_backupsPath.isEmpty()) settings.setValue("paths/backups", m_backupsPath);
    if (!m_downloadsPath.isEmpty()) settings.setValue("paths/downloads", m_downloadsPath);

    settings.setValue("advanced/debugLogging", m_debugLogging);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool Profile::initialize()
{
    if (m_profileFolderPath.isEmpty()) {
        return false;
    }

    QDir dir(m_profileFolderPath);

    // Create main directory
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    // Create subdirectories
    QDir().mkpath(storePath());
    QDir().mkpath(backupsPath());
    QDir().mkpath(downloadsPath());
    QDir().mkpath(thumbnailsPath());

    // Save default settings
    return save();
}

// ========== Paths ==========

QString Profile::resolvePath(const QString &configured, const QString &fallback) const
{
    if (!configured.isEmpty()) {
        return QDir(m_profileFolderPath).absoluteFilePath(configured);
    }
    if (m_profileFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_profileFolderPath).filePath(fallback);
}

QString Profile::configFilePath() const
{
    if (m_profileFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_profileFolderPath).filePath(CONFIG_FILE_NAME);
}

QString Profile::storePath() const
{
    return resolvePath(m_storePath, "store");
}

QString Profile::backupsPath() const
{
    return resolvePath(m_backupsPath, "backups");
}

QString Profile::downloadsPath() const
{
    return resolvePath(m_downloadsPath, "downloads");
}

QString Profile::thumbnailsPath() const
{
    return resolvePath(QString(), ".thumbnails");
}
