#include "conduit.h"
#include "recordstore.h"
#include "devicedatasource.h"

#include <QDebug>

namespace Unison {

bool Conduit::canSync(const SyncContext *context) const
{
    if (!context) return false;
    if (!context->store) return false;
    if (!context->source) return false;
    if (context->deviceId.isEmpty()) return false;
    return true;
}

void Conduit::fail(SyncResult &result, SyncError error, const QString &message)
{
    result.success = false;
    result.error = error;
    result.errorMessage = message;
    emit errorOccurred(message);
}

void Conduit::interrupt(SyncResult &result)
{
    qWarning() << "[Conduit]" << conduitId() << "grant revoked, stopping pass";
    fail(result, SyncError::EmergencyThrottled,
         QString("%1 sync interrupted by emergency mode").arg(displayName()));
}

SyncResult Conduit::sync(SyncContext *context)
{
    SyncResult result;
    result.domain = domain();
    result.granted = true;
    result.startTime = QDateTime::currentDateTime();

    if (!canSync(context)) {
        result.success = false;
        result.error = SyncError::DeviceDataUnavailable;
        result.errorMessage = "Sync prerequisites not met";
        result.endTime = QDateTime::currentDateTime();
        return result;
    }

    emit logMessage(QString("Starting %1 sync...").arg(displayName()));

    result.success = true;
    context->store->beginBatch();
    syncRecords(context, result);

    if (!context->store->commitBatch()) {
        fail(result, SyncError::IOError,
             QString("Failed to write %1 to the record store").arg(displayName()));
    }

    result.endTime = QDateTime::currentDateTime();

    if (result.success) {
        m_lastRunTime = result.endTime;
        emit logMessage(QString("%1 sync complete: %2").arg(displayName(), result.stats.summary()));
    }
    return result;
}

} // namespace Unison
