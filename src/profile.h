#ifndef PROFILE_H
#define PROFILE_H

#include <QString>
#include <QStringList>
#include <QMap>
#include "sync/synctypes.h"

namespace Unison {
struct CoordinatorConfig;
struct TransferEngineConfig;
}

/**
 * @brief Profile represents a sync profile with its settings
 *
 * Profile settings are stored in the profile folder itself as
 * unisonsync.conf, making profiles portable - you can move the entire
 * folder and the settings travel with it.
 *
 * Each profile corresponds to:
 *   - A record store (store/)
 *   - A backup root the device data is read from (backups/)
 *   - A download folder imported files land in (downloads/)
 *   - Cooldown, emergency and transfer tuning
 */
class Profile
{
public:
    /**
     * @brief Create a profile for the given folder path
     * @param profileFolderPath Path to the profile folder (e.g., ~/UnisonSync)
     */
    explicit Profile(const QString &profileFolderPath = QString());

    // Profile location
    QString profileFolderPath() const { return m_profileFolderPath; }
    void setProfileFolderPath(const QString &path);

    // Profile identity
    QString name() const;
    void setName(const QString &name);

    // Check if profile is valid (folder exists and is writable)
    bool isValid() const;

    // Check if profile config file exists
    bool exists() const;

    // ========== Sync Settings ==========

    qint64 cooldown(Unison::SyncDomain domain) const;
    void setCooldown(Unison::SyncDomain domain, qint64 ms);

    Unison::MergeStrategy mergeStrategy() const { return m_mergeStrategy; }
    void setMergeStrategy(Unison::MergeStrategy strategy) { m_mergeStrategy = strategy; }

    QString lastDeviceId() const { return m_lastDeviceId; }
    void setLastDeviceId(const QString &deviceId) { m_lastDeviceId = deviceId; }

    // Periodic syncAll() while the daemon runs
    bool autoSync() const { return m_autoSync; }
    void setAutoSync(bool enabled) { m_autoSync = enabled; }

    int syncInterval() const { return m_syncInterval; }
    void setSyncInterval(int ms) { m_syncInterval = ms; }

    // ========== Emergency Settings ==========

    int emergencyThreshold() const { return m_emergencyThreshold; }
    void setEmergencyThreshold(int threshold) { m_emergencyThreshold = threshold; }

    int emergencyMultiplier() const { return m_emergencyMultiplier; }
    void setEmergencyMultiplier(int multiplier) { m_emergencyMultiplier = multiplier; }

    int spikeDelta() const { return m_spikeDelta; }
    void setSpikeDelta(int delta) { m_spikeDelta = delta; }

    // ========== Transfer Settings ==========

    int maxConcurrency() const { return m_maxConcurrency; }
    void setMaxConcurrency(int count) { m_maxConcurrency = count; }

    qint64 chunkSize() const { return m_chunkSize; }
    void setChunkSize(qint64 bytes) { m_chunkSize = bytes; }

    // Bytes per second per transfer, 0 = unlimited
    qint64 bandwidthLimit() const { return m_bandwidthLimit; }
    void setBandwidthLimit(qint64 bytesPerSecond) { m_bandwidthLimit = bytesPerSecond; }

    // Folder id a file type is organized into
    QString organizeFolder(const QString &fileType) const;
    void setOrganizeFolder(const QString &fileType, const QString &folderId);

    // ========== Advanced ==========

    bool debugLogging() const { return m_debugLogging; }
    void setDebugLogging(bool enabled) { m_debugLogging = enabled; }

    // ========== Paths ==========

    QString configFilePath() const;
    QString storePath() const;
    void setStorePath(const QString &path) { m_storePath = path; }
    QString backupsPath() const;
    void setBackupsPath(const QString &path) { m_backupsPath = path; }
    QString downloadsPath() const;
    void setDownloadsPath(const QString &path) { m_downloadsPath = path; }
    QString thumbnailsPath() const;

    // ========== Derived Configuration ==========

    Unison::CoordinatorConfig coordinatorConfig() const;
    Unison::TransferEngineConfig transferConfig() const;

    // ========== Persistence ==========

    // Load settings from unisonsync.conf in the profile folder
    bool load();

    // Save settings to unisonsync.conf in the profile folder
    bool save();

    // Initialize a new profile (create directories and default config)
    bool initialize();

private:
    QString resolvePath(const QString &configured, const QString &fallback) const;

    QString m_profileFolderPath;
    QString m_name;

    // Sync settings
    QMap<Unison::SyncDomain, qint64> m_cooldowns;
    Unison::MergeStrategy m_mergeStrategy;
    QString m_lastDeviceId;
    bool m_autoSync = false;
    int m_syncInterval;

    // Emergency settings
    int m_emergencyThreshold;
    int m_emergencyMultiplier;
    int m_spikeDelta;

    // Transfer settings
    int m_maxConcurrency;
    qint64 m_chunkSize;
    qint64 m_bandwidthLimit;
    QMap<QString, QString> m_organize;

    bool m_debugLogging = false;

    // Paths (empty = default under the profile folder)
    QString m_storePath;
    QString m_backupsPath;
    QString m_downloadsPath;

    // Default values
    static const QString CONFIG_FILE_NAME;
    static const QStringList ORGANIZED_TYPES;
};

#endif // PROFILE_H
