#include "contactconduit.h"
#include "../conflictresolver.h"
#include "../recordstore.h"
#include "../devicedatasource.h"
#include "../eventbus.h"

#include <QDebug>

namespace Unison {

void ContactConduit::syncRecords(SyncContext *context, SyncResult &result)
{
    QList<RemoteContact> remoteContacts;
    if (!context->source->extractContacts(context->deviceId, remoteContacts)) {
        fail(result, SyncError::DeviceDataUnavailable,
             QString("Cannot read contacts: %1").arg(context->source->lastError()));
        return;
    }

    result.stats.fetched = remoteContacts.size();
    emit logMessage(QString("Device reports %1 contacts").arg(remoteContacts.size()));

    int index = 0;
    for (const RemoteContact &remote : remoteContacts) {
        if (isCancelled()) {
            interrupt(result);
            return;
        }
        emit progressUpdated(++index, remoteContacts.size(), remote.id);

        const QDateTime now = QDateTime::currentDateTimeUtc();
        std::optional<Contact> local = context->store->contact(remote.id);

        if (!local) {
            Contact created = Contact::fromRemote(remote);
            created.createdAt = now;
            created.updatedAt = now;
            if (context->store->upsertContact(created)) {
                result.stats.created++;
            } else {
                result.stats.errors++;
            }
            continue;
        }

        // Never auto-merge over a pending manual decision
        if (context->store->openConflictFor(local->id)) {
            qDebug() << "[ContactConduit] Skipping" << local->id << "- open conflict";
            result.stats.conflicts++;
            continue;
        }

        ResolveOutcome outcome = ConflictResolver::resolve(*local, remote, context->strategy,
                                                           context->deviceId);
        switch (outcome.action) {
            case ResolveOutcome::Unchanged:
                result.stats.unchanged++;
                break;

            case ResolveOutcome::Merged:
                outcome.merged.updatedAt = now;
                if (context->store->upsertContact(outcome.merged)) {
                    result.stats.updated++;
                } else {
                    result.stats.errors++;
                }
                break;

            case ResolveOutcome::Deferred:
                if (context->store->upsertConflict(outcome.conflict)) {
                    result.stats.conflicts++;
                    qInfo() << "[ContactConduit] Conflict on" << local->id
                            << "fields:" << outcome.fields.join(", ");
                    emit conflictDetected(outcome.conflict.id);
                    if (context->bus) {
                        context->bus->publishConflictDetected(outcome.conflict.id);
                    }
                } else {
                    result.stats.errors++;
                }
                break;
        }
    }
}

} // namespace Unison
