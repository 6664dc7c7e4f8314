#include "conflictresolver.h"

#include <QSet>
#include <QUuid>
#include <QDebug>

namespace Unison {

const QString ConflictResolver::FieldFirstName = "first_name";
const QString ConflictResolver::FieldLastName = "last_name";
const QString ConflictResolver::FieldPhoneNumbers = "phone_numbers";
const QString ConflictResolver::FieldEmailAddresses = "email_addresses";

QStringList ConflictResolver::unionOf(const QStringList &a, const QStringList &b)
{
    QStringList result;
    QSet<QString> seen;
    for (const QString &item : a) {
        if (!seen.contains(item)) {
            seen.insert(item);
            result.append(item);
        }
    }
    for (const QString &item : b) {
        if (!seen.contains(item)) {
            seen.insert(item);
            result.append(item);
        }
    }
    return result;
}

bool ConflictResolver::sameSet(const QStringList &a, const QStringList &b)
{
    return QSet<QString>(a.begin(), a.end()) == QSet<QString>(b.begin(), b.end());
}

QStringList ConflictResolver::diff(const Contact &local, const RemoteContact &remote)
{
    QStringList fields;
    if (local.firstName != remote.firstName) {
        fields << FieldFirstName;
    }
    if (local.lastName != remote.lastName) {
        fields << FieldLastName;
    }
    if (!sameSet(local.phoneNumbers, remote.phoneNumbers)) {
        fields << FieldPhoneNumbers;
    }
    if (!sameSet(local.emailAddresses, remote.emailAddresses)) {
        fields << FieldEmailAddresses;
    }
    return fields;
}

Contact ConflictResolver::merge(const Contact &local, const RemoteContact &remote, bool preferDevice)
{
    Contact merged = local;

    // An empty device value never blanks a local one
    if (preferDevice) {
        if (!remote.firstName.isEmpty()) merged.firstName = remote.firstName;
        if (!remote.lastName.isEmpty()) merged.lastName = remote.lastName;
    }

    merged.phoneNumbers = unionOf(local.phoneNumbers, remote.phoneNumbers);
    merged.emailAddresses = unionOf(local.emailAddresses, remote.emailAddresses);
    merged.displayName = merged.composeDisplayName();
    return merged;
}

ResolveOutcome ConflictResolver::resolve(const Contact &local, const RemoteContact &remote,
                                         MergeStrategy strategy, const QString &deviceId)
{
    ResolveOutcome outcome;
    outcome.fields = diff(local, remote);

    if (outcome.fields.isEmpty()) {
        return outcome;
    }

    const bool scalarsDiffer = outcome.fields.contains(FieldFirstName)
                            || outcome.fields.contains(FieldLastName);

    if (scalarsDiffer && strategy == MergeStrategy::KeepBoth) {
        outcome.action = ResolveOutcome::Deferred;

        ConflictRecord &conflict = outcome.conflict;
        conflict.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        conflict.localId = local.id;
        conflict.deviceId = deviceId;
        conflict.localSnapshot = local;
        conflict.remoteSnapshot = remote;
        conflict.fields = outcome.fields;
        conflict.createdAt = QDateTime::currentDateTimeUtc();
        return outcome;
    }

    const bool preferDevice = scalarsDiffer && strategy == MergeStrategy::PreferDevice;
    Contact merged = merge(local, remote, preferDevice);

    if (merged.firstName == local.firstName
        && merged.lastName == local.lastName
        && merged.phoneNumbers == local.phoneNumbers
        && merged.emailAddresses == local.emailAddresses) {
        // Local already holds everything the strategy lets through
        return outcome;
    }

    outcome.action = ResolveOutcome::Merged;
    outcome.merged = merged;
    return outcome;
}

Contact ConflictResolver::applyResolution(const ConflictRecord &conflict, const Contact &current,
                                          ConflictResolution resolution)
{
    switch (resolution) {
        case ConflictResolution::KeepLocal:
            return current;

        case ConflictResolution::KeepDevice: {
            Contact replaced = current;
            replaced.firstName = conflict.remoteSnapshot.firstName;
            replaced.lastName = conflict.remoteSnapshot.lastName;
            replaced.phoneNumbers = conflict.remoteSnapshot.phoneNumbers;
            replaced.emailAddresses = conflict.remoteSnapshot.emailAddresses;
            replaced.displayName = replaced.composeDisplayName();
            return replaced;
        }

        case ConflictResolution::Merge:
            return merge(current, conflict.remoteSnapshot, true);
    }

    qWarning() << "[ConflictResolver] Unknown resolution for conflict" << conflict.id;
    return current;
}

} // namespace Unison
