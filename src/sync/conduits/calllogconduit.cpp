#include "calllogconduit.h"
#include "../recordstore.h"
#include "../devicedatasource.h"

namespace Unison {

void CallLogConduit::syncRecords(SyncContext *context, SyncResult &result)
{
    QList<RemoteCallLog> remoteCalls;
    if (!context->source->extractCallLogs(context->deviceId, remoteCalls)) {
        fail(result, SyncError::DeviceDataUnavailable,
             QString("Cannot read call history: %1").arg(context->source->lastError()));
        return;
    }

    result.stats.fetched = remoteCalls.size();

    int index = 0;
    for (const RemoteCallLog &remote : remoteCalls) {
        if (isCancelled()) {
            interrupt(result);
            return;
        }
        emit progressUpdated(++index, remoteCalls.size(), remote.id);

        if (context->store->callLog(remote.id)) {
            result.stats.unchanged++;
            continue;
        }

        CallLogEntry entry;
        entry.id = remote.id;
        entry.phoneNumber = remote.phoneNumber;
        entry.contactName = remote.contactName;
        entry.direction = remote.direction;
        entry.callType = remote.callType;
        entry.durationSec = remote.durationSec;
        entry.startTime = remote.startTime;
        entry.createdAt = QDateTime::currentDateTimeUtc();

        if (context->store->upsertCallLog(entry)) {
            result.stats.created++;
        } else {
            result.stats.errors++;
        }
    }
}

} // namespace Unison
