#include "eventbus.h"

#include <QMetaObject>

namespace Unison {

EventBus::EventBus(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<Unison::SyncDomain>("Unison::SyncDomain");
    qRegisterMetaType<Unison::SyncError>("Unison::SyncError");
    qRegisterMetaType<Unison::SyncStats>("Unison::SyncStats");
}

// ========== Sync events ==========

void EventBus::publishSyncStarted(SyncDomain domain)
{
    QMetaObject::invokeMethod(this, [this, domain]() {
        emit syncStarted(domain);
    }, Qt::QueuedConnection);
}

void EventBus::publishSyncCompleted(SyncDomain domain, const SyncStats &stats)
{
    QMetaObject::invokeMethod(this, [this, domain, stats]() {
        emit syncCompleted(domain, stats);
    }, Qt::QueuedConnection);
}

void EventBus::publishSyncFailed(SyncDomain domain, SyncError error, const QString &message)
{
    QMetaObject::invokeMethod(this, [this, domain, error, message]() {
        emit syncFailed(domain, error, message);
    }, Qt::QueuedConnection);
}

// ========== Transfer events ==========

void EventBus::publishTransferProgress(const QString &transferId, int progress, double speed)
{
    QMetaObject::invokeMethod(this, [this, transferId, progress, speed]() {
        emit transferProgress(transferId, progress, speed);
    }, Qt::QueuedConnection);
}

void EventBus::publishTransferCompleted(const QString &transferId)
{
    QMetaObject::invokeMethod(this, [this, transferId]() {
        emit transferCompleted(transferId);
    }, Qt::QueuedConnection);
}

void EventBus::publishTransferFailed(const QString &transferId, SyncError error, const QString &message)
{
    QMetaObject::invokeMethod(this, [this, transferId, error, message]() {
        emit transferFailed(transferId, error, message);
    }, Qt::QueuedConnection);
}

// ========== Other ==========

void EventBus::publishConflictDetected(const QString &conflictId)
{
    QMetaObject::invokeMethod(this, [this, conflictId]() {
        emit conflictDetected(conflictId);
    }, Qt::QueuedConnection);
}

void EventBus::publishEmergencyModeChanged(bool active)
{
    QMetaObject::invokeMethod(this, [this, active]() {
        emit emergencyModeChanged(active);
    }, Qt::QueuedConnection);
}

} // namespace Unison
