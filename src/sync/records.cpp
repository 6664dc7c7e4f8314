#include "records.h"

#include <QJsonArray>

namespace Unison {

namespace {

QString isoString(const QDateTime &dt)
{
    return dt.isValid() ? dt.toString(Qt::ISODateWithMs) : QString();
}

QDateTime fromIso(const QJsonValue &value)
{
    return QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
}

QStringList stringList(const QJsonValue &value)
{
    QStringList list;
    for (const QJsonValue &v : value.toArray()) {
        list << v.toString();
    }
    return list;
}

} // namespace

// ========== Contact helpers ==========

QString Contact::composeDisplayName() const
{
    QString name = QString("%1 %2").arg(firstName, lastName).trimmed();
    if (name.isEmpty() && !phoneNumbers.isEmpty()) {
        name = phoneNumbers.first();
    }
    if (name.isEmpty()) {
        name = "Unknown";
    }
    return name;
}

Contact Contact::fromRemote(const RemoteContact &remote)
{
    Contact contact;
    contact.id = remote.id;
    contact.firstName = remote.firstName;
    contact.lastName = remote.lastName;
    contact.phoneNumbers = remote.phoneNumbers;
    contact.emailAddresses = remote.emailAddresses;
    contact.displayName = contact.composeDisplayName();
    return contact;
}

RemoteContact Contact::toRemote() const
{
    RemoteContact remote;
    remote.id = id;
    remote.firstName = firstName;
    remote.lastName = lastName;
    remote.phoneNumbers = phoneNumbers;
    remote.emailAddresses = emailAddresses;
    return remote;
}

// ========== Enum names ==========

QString directionName(MessageDirection direction)
{
    return direction == MessageDirection::Outgoing ? "outgoing" : "incoming";
}

MessageDirection messageDirectionFromName(const QString &name)
{
    return name == "outgoing" ? MessageDirection::Outgoing : MessageDirection::Incoming;
}

QString directionName(CallDirection direction)
{
    switch (direction) {
        case CallDirection::Incoming:  return "incoming";
        case CallDirection::Outgoing:  return "outgoing";
        case CallDirection::Missed:    return "missed";
        case CallDirection::Blocked:   return "blocked";
        case CallDirection::Voicemail: return "voicemail";
    }
    return "incoming";
}

CallDirection callDirectionFromName(const QString &name)
{
    if (name == "outgoing") return CallDirection::Outgoing;
    if (name == "missed") return CallDirection::Missed;
    if (name == "blocked") return CallDirection::Blocked;
    if (name == "voicemail") return CallDirection::Voicemail;
    return CallDirection::Incoming;
}

// ========== Device snapshots ==========

QJsonObject deviceToJson(const DeviceDescriptor &device)
{
    QJsonObject obj;
    obj["id"] = device.id;
    obj["name"] = device.name;
    obj["model"] = device.model;
    obj["osVersion"] = device.osVersion;
    obj["backupPath"] = device.backupPath;
    obj["lastBackup"] = isoString(device.lastBackup);
    return obj;
}

DeviceDescriptor deviceFromJson(const QJsonObject &json)
{
    DeviceDescriptor device;
    device.id = json["id"].toString();
    device.name = json["name"].toString();
    device.model = json["model"].toString();
    device.osVersion = json["osVersion"].toString();
    device.backupPath = json["backupPath"].toString();
    device.lastBackup = fromIso(json["lastBackup"]);
    return device;
}

QJsonObject remoteContactToJson(const RemoteContact &contact)
{
    QJsonObject obj;
    obj["id"] = contact.id;
    obj["firstName"] = contact.firstName;
    obj["lastName"] = contact.lastName;
    obj["phoneNumbers"] = QJsonArray::fromStringList(contact.phoneNumbers);
    obj["emailAddresses"] = QJsonArray::fromStringList(contact.emailAddresses);
    return obj;
}

RemoteContact remoteContactFromJson(const QJsonObject &json)
{
    RemoteContact contact;
    contact.id = json["id"].toString();
    contact.firstName = json["firstName"].toString();
    contact.lastName = json["lastName"].toString();
    contact.phoneNumbers = stringList(json["phoneNumbers"]);
    contact.emailAddresses = stringList(json["emailAddresses"]);
    return contact;
}

RemoteMessage remoteMessageFromJson(const QJsonObject &json)
{
    RemoteMessage message;
    message.id = json["id"].toString();
    message.threadId = json["threadId"].toString();
    message.address = json["address"].toString();
    message.body = json["body"].toString();
    message.service = json["service"].toString("sms");
    message.direction = messageDirectionFromName(json["direction"].toString());
    message.timestamp = fromIso(json["timestamp"]);
    message.read = json["read"].toBool();
    return message;
}

RemoteCallLog remoteCallLogFromJson(const QJsonObject &json)
{
    RemoteCallLog call;
    call.id = json["id"].toString();
    call.phoneNumber = json["phoneNumber"].toString();
    call.contactName = json["contactName"].toString();
    call.direction = callDirectionFromName(json["direction"].toString());
    call.callType = json["callType"].toString("voice");
    call.durationSec = json["duration"].toInt();
    call.startTime = fromIso(json["startTime"]);
    return call;
}

// ========== Local entities ==========

QJsonObject contactToJson(const Contact &contact)
{
    QJsonObject obj;
    obj["id"] = contact.id;
    obj["firstName"] = contact.firstName;
    obj["lastName"] = contact.lastName;
    obj["displayName"] = contact.displayName;
    obj["phoneNumbers"] = QJsonArray::fromStringList(contact.phoneNumbers);
    obj["emailAddresses"] = QJsonArray::fromStringList(contact.emailAddresses);
    obj["favorite"] = contact.favorite;
    obj["createdAt"] = isoString(contact.createdAt);
    obj["updatedAt"] = isoString(contact.updatedAt);
    return obj;
}

Contact contactFromJson(const QJsonObject &json)
{
    Contact contact;
    contact.id = json["id"].toString();
    contact.firstName = json["firstName"].toString();
    contact.lastName = json["lastName"].toString();
    contact.displayName = json["displayName"].toString();
    contact.phoneNumbers = stringList(json["phoneNumbers"]);
    contact.emailAddresses = stringList(json["emailAddresses"]);
    contact.favorite = json["favorite"].toBool();
    contact.createdAt = fromIso(json["createdAt"]);
    contact.updatedAt = fromIso(json["updatedAt"]);
    return contact;
}

QJsonObject messageToJson(const Message &message)
{
    QJsonObject obj;
    obj["id"] = message.id;
    obj["threadId"] = message.threadId;
    obj["address"] = message.address;
    obj["body"] = message.body;
    obj["service"] = message.service;
    obj["direction"] = directionName(message.direction);
    obj["timestamp"] = isoString(message.timestamp);
    obj["read"] = message.read;
    obj["createdAt"] = isoString(message.createdAt);
    obj["updatedAt"] = isoString(message.updatedAt);
    return obj;
}

Message messageFromJson(const QJsonObject &json)
{
    Message message;
    message.id = json["id"].toString();
    message.threadId = json["threadId"].toString();
    message.address = json["address"].toString();
    message.body = json["body"].toString();
    message.service = json["service"].toString();
    message.direction = messageDirectionFromName(json["direction"].toString());
    message.timestamp = fromIso(json["timestamp"]);
    message.read = json["read"].toBool();
    message.createdAt = fromIso(json["createdAt"]);
    message.updatedAt = fromIso(json["updatedAt"]);
    return message;
}

QJsonObject threadToJson(const MessageThread &thread)
{
    QJsonObject obj;
    obj["id"] = thread.id;
    obj["participants"] = QJsonArray::fromStringList(thread.participants);
    obj["lastMessageId"] = thread.lastMessageId;
    obj["lastMessagePreview"] = thread.lastMessagePreview;
    obj["lastMessageAt"] = isoString(thread.lastMessageAt);
    obj["messageCount"] = thread.messageCount;
    obj["unreadCount"] = thread.unreadCount;
    obj["createdAt"] = isoString(thread.createdAt);
    obj["updatedAt"] = isoString(thread.updatedAt);
    return obj;
}

MessageThread threadFromJson(const QJsonObject &json)
{
    MessageThread thread;
    thread.id = json["id"].toString();
    thread.participants = stringList(json["participants"]);
    thread.lastMessageId = json["lastMessageId"].toString();
    thread.lastMessagePreview = json["lastMessagePreview"].toString();
    thread.lastMessageAt = fromIso(json["lastMessageAt"]);
    thread.messageCount = json["messageCount"].toInt();
    thread.unreadCount = json["unreadCount"].toInt();
    thread.createdAt = fromIso(json["createdAt"]);
    thread.updatedAt = fromIso(json["updatedAt"]);
    return thread;
}

QJsonObject callLogToJson(const CallLogEntry &entry)
{
    QJsonObject obj;
    obj["id"] = entry.id;
    obj["phoneNumber"] = entry.phoneNumber;
    obj["contactName"] = entry.contactName;
    obj["direction"] = directionName(entry.direction);
    obj["callType"] = entry.callType;
    obj["duration"] = entry.durationSec;
    obj["startTime"] = isoString(entry.startTime);
    obj["createdAt"] = isoString(entry.createdAt);
    return obj;
}

CallLogEntry callLogFromJson(const QJsonObject &json)
{
    CallLogEntry entry;
    entry.id = json["id"].toString();
    entry.phoneNumber = json["phoneNumber"].toString();
    entry.contactName = json["contactName"].toString();
    entry.direction = callDirectionFromName(json["direction"].toString());
    entry.callType = json["callType"].toString();
    entry.durationSec = json["duration"].toInt();
    entry.startTime = fromIso(json["startTime"]);
    entry.createdAt = fromIso(json["createdAt"]);
    return entry;
}

QJsonObject conflictToJson(const ConflictRecord &conflict)
{
    QJsonObject obj;
    obj["id"] = conflict.id;
    obj["localId"] = conflict.localId;
    obj["deviceId"] = conflict.deviceId;
    obj["local"] = contactToJson(conflict.localSnapshot);
    obj["remote"] = remoteContactToJson(conflict.remoteSnapshot);
    obj["fields"] = QJsonArray::fromStringList(conflict.fields);
    if (conflict.resolution) {
        obj["resolution"] = resolutionName(*conflict.resolution);
    }
    obj["createdAt"] = isoString(conflict.createdAt);
    obj["resolvedAt"] = isoString(conflict.resolvedAt);
    return obj;
}

ConflictRecord conflictFromJson(const QJsonObject &json)
{
    ConflictRecord conflict;
    conflict.id = json["id"].toString();
    conflict.localId = json["localId"].toString();
    conflict.deviceId = json["deviceId"].toString();
    conflict.localSnapshot = contactFromJson(json["local"].toObject());
    conflict.remoteSnapshot = remoteContactFromJson(json["remote"].toObject());
    conflict.fields = stringList(json["fields"]);

    bool ok = false;
    ConflictResolution resolution = resolutionFromName(json["resolution"].toString(), &ok);
    if (ok) {
        conflict.resolution = resolution;
    }

    conflict.createdAt = fromIso(json["createdAt"]);
    conflict.resolvedAt = fromIso(json["resolvedAt"]);
    return conflict;
}

} // namespace Unison
