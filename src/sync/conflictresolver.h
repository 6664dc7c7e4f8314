#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QString>
#include <QStringList>
#include "synctypes.h"
#include "records.h"

namespace Unison {

/**
 * @brief Outcome of comparing a local contact with its device counterpart
 */
struct ResolveOutcome {
    enum Action {
        Unchanged,  ///< Nothing to write
        Merged,     ///< Write merged
        Deferred    ///< Record conflict, write nothing
    };

    Action action = Unchanged;
    QStringList fields;     ///< Diverging field names
    Contact merged;         ///< Valid when action == Merged
    ConflictRecord conflict;///< Valid when action == Deferred
};

/**
 * @brief Stateless contact diff and merge rules
 *
 * Field names used in diffs and conflict records:
 *   first_name, last_name, phone_numbers, email_addresses
 *
 * Array fields are compared as sets and always merged by union, so no
 * phone number or email present on either side is ever lost. Scalar
 * fields follow the merge strategy.
 */
class ConflictResolver
{
public:
    static const QString FieldFirstName;
    static const QString FieldLastName;
    static const QString FieldPhoneNumbers;
    static const QString FieldEmailAddresses;

    /**
     * @brief Names of the fields that differ
     */
    static QStringList diff(const Contact &local, const RemoteContact &remote);

    /**
     * @brief Decide what to do with a (local, remote) pair
     * @param deviceId Stored on the conflict record when deferring
     */
    static ResolveOutcome resolve(const Contact &local, const RemoteContact &remote,
                                  MergeStrategy strategy, const QString &deviceId = QString());

    /**
     * @brief Apply an explicit resolution to a recorded conflict
     * @param current The local record as it is now
     * @return The record to store
     */
    static Contact applyResolution(const ConflictRecord &conflict, const Contact &current,
                                   ConflictResolution resolution);

    /**
     * @brief Items of a in order, then items of b not already present
     */
    static QStringList unionOf(const QStringList &a, const QStringList &b);

    /**
     * @brief Whether two lists hold the same items, ignoring order and repeats
     */
    static bool sameSet(const QStringList &a, const QStringList &b);

private:
    static Contact merge(const Contact &local, const RemoteContact &remote, bool preferDevice);
};

} // namespace Unison

#endif // CONFLICTRESOLVER_H
