#ifndef EVENTBUS_H
#define EVENTBUS_H

#include <QObject>
#include <QString>
#include "synctypes.h"

namespace Unison {

/**
 * @brief Publish/subscribe hub for sync and transfer events
 *
 * Injected into the coordinator, the sync engine and the transfer engine.
 * Subscribers connect to the signals. Publishing is queued onto the bus's
 * thread, so a publisher never runs subscriber code on its own stack and
 * never waits for it.
 *
 * Workers on pool threads may publish safely.
 */
class EventBus : public QObject
{
    Q_OBJECT

public:
    explicit EventBus(QObject *parent = nullptr);

    // ========== Publishing ==========

    void publishSyncStarted(SyncDomain domain);
    void publishSyncCompleted(SyncDomain domain, const SyncStats &stats);
    void publishSyncFailed(SyncDomain domain, SyncError error, const QString &message);

    void publishTransferProgress(const QString &transferId, int progress, double speed);
    void publishTransferCompleted(const QString &transferId);
    void publishTransferFailed(const QString &transferId, SyncError error, const QString &message);

    void publishConflictDetected(const QString &conflictId);
    void publishEmergencyModeChanged(bool active);

signals:
    void syncStarted(Unison::SyncDomain domain);
    void syncCompleted(Unison::SyncDomain domain, const Unison::SyncStats &stats);
    void syncFailed(Unison::SyncDomain domain, Unison::SyncError error, const QString &message);

    void transferProgress(const QString &transferId, int progress, double speed);
    void transferCompleted(const QString &transferId);
    void transferFailed(const QString &transferId, Unison::SyncError error, const QString &message);

    void conflictDetected(const QString &conflictId);
    void emergencyModeChanged(bool active);
};

} // namespace Unison

#endif // EVENTBUS_H
