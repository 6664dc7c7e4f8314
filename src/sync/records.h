#ifndef RECORDS_H
#define RECORDS_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <optional>
#include "synctypes.h"

/**
 * @file records.h
 * @brief Schema'd entities persisted by the record store and
 *        snapshots reported by the device data source
 */

namespace Unison {

// ========== Device-side snapshots ==========

/**
 * @brief A device known to the data source
 */
struct DeviceDescriptor {
    QString id;             ///< Stable device identifier (UDID, serial, backup folder)
    QString name;           ///< User-visible device name
    QString model;
    QString osVersion;
    QString backupPath;     ///< Where the extracted data lives, if any
    QDateTime lastBackup;
};

/**
 * @brief Contact as reported by the device
 */
struct RemoteContact {
    QString id;
    QString firstName;
    QString lastName;
    QStringList phoneNumbers;
    QStringList emailAddresses;
};

enum class MessageDirection {
    Incoming,
    Outgoing
};

/**
 * @brief Message as reported by the device
 */
struct RemoteMessage {
    QString id;
    QString threadId;
    QString address;        ///< Phone number or handle of the other party
    QString body;
    QString service;        ///< "sms", "imessage", "rcs"
    MessageDirection direction = MessageDirection::Incoming;
    QDateTime timestamp;
    bool read = false;
};

enum class CallDirection {
    Incoming,
    Outgoing,
    Missed,
    Blocked,
    Voicemail
};

/**
 * @brief Call log entry as reported by the device
 */
struct RemoteCallLog {
    QString id;
    QString phoneNumber;
    QString contactName;
    CallDirection direction = CallDirection::Incoming;
    QString callType;       ///< "voice", "video", "facetime"
    int durationSec = 0;
    QDateTime startTime;
};

// ========== Local entities ==========

struct Contact {
    QString id;
    QString firstName;
    QString lastName;
    QString displayName;
    QStringList phoneNumbers;
    QStringList emailAddresses;
    bool favorite = false;
    QDateTime createdAt;
    QDateTime updatedAt;

    /**
     * @brief "First Last", falling back to the first phone number
     */
    QString composeDisplayName() const;

    static Contact fromRemote(const RemoteContact &remote);
    RemoteContact toRemote() const;
};

struct Message {
    QString id;
    QString threadId;
    QString address;
    QString body;
    QString service;
    MessageDirection direction = MessageDirection::Incoming;
    QDateTime timestamp;
    bool read = false;
    QDateTime createdAt;
    QDateTime updatedAt;
};

struct MessageThread {
    QString id;
    QStringList participants;
    QString lastMessageId;
    QString lastMessagePreview;
    QDateTime lastMessageAt;
    int messageCount = 0;
    int unreadCount = 0;
    QDateTime createdAt;
    QDateTime updatedAt;
};

struct CallLogEntry {
    QString id;
    QString phoneNumber;
    QString contactName;
    CallDirection direction = CallDirection::Incoming;
    QString callType;
    int durationSec = 0;
    QDateTime startTime;
    QDateTime createdAt;
};

/**
 * @brief A divergence between a local contact and its device counterpart
 *
 * Once recorded, the conflict stays open until a caller sets a resolution.
 */
struct ConflictRecord {
    QString id;
    QString localId;
    QString deviceId;
    Contact localSnapshot;
    RemoteContact remoteSnapshot;
    QStringList fields;                         ///< Diverging field names
    std::optional<ConflictResolution> resolution;
    QDateTime createdAt;
    QDateTime resolvedAt;

    bool isOpen() const { return !resolution.has_value(); }
};

// ========== JSON mapping ==========

QString directionName(MessageDirection direction);
MessageDirection messageDirectionFromName(const QString &name);
QString directionName(CallDirection direction);
CallDirection callDirectionFromName(const QString &name);

QJsonObject deviceToJson(const DeviceDescriptor &device);
DeviceDescriptor deviceFromJson(const QJsonObject &json);

QJsonObject remoteContactToJson(const RemoteContact &contact);
RemoteContact remoteContactFromJson(const QJsonObject &json);
RemoteMessage remoteMessageFromJson(const QJsonObject &json);
RemoteCallLog remoteCallLogFromJson(const QJsonObject &json);

QJsonObject contactToJson(const Contact &contact);
Contact contactFromJson(const QJsonObject &json);

QJsonObject messageToJson(const Message &message);
Message messageFromJson(const QJsonObject &json);

QJsonObject threadToJson(const MessageThread &thread);
MessageThread threadFromJson(const QJsonObject &json);

QJsonObject callLogToJson(const CallLogEntry &entry);
CallLogEntry callLogFromJson(const QJsonObject &json);

QJsonObject conflictToJson(const ConflictRecord &conflict);
ConflictRecord conflictFromJson(const QJsonObject &json);

} // namespace Unison

Q_DECLARE_METATYPE(Unison::ConflictRecord)

#endif // RECORDS_H
