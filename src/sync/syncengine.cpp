#include "syncengine.h"
#include "synccoordinator.h"
#include "recordstore.h"
#include "devicedatasource.h"
#include "eventbus.h"
#include "conflictresolver.h"
#include "conduits/contactconduit.h"
#include "conduits/messageconduit.h"
#include "conduits/calllogconduit.h"
#include "../transfer/transferengine.h"
#include "../transfer/devicetransferio.h"

#include <QDir>
#include <QFileInfo>
#include <QDebug>

namespace Unison {

SyncEngine::SyncEngine(SyncCoordinator *coordinator, RecordStore *store,
                       DeviceDataSource *source, EventBus *bus, QObject *parent)
    : QObject(parent)
    , m_coordinator(coordinator)
    , m_store(store)
    , m_source(source)
    , m_bus(bus)
{
    qRegisterMetaType<Unison::SyncResult>("Unison::SyncResult");

    registerConduit(new ContactConduit());
    registerConduit(new MessageConduit());
    registerConduit(new CallLogConduit());
}

SyncEngine::~SyncEngine()
{
    // Conduits are children and deleted with the engine
}

// ========== Conduit Management ==========

void SyncEngine::registerConduit(Conduit *conduit)
{
    if (!conduit) return;

    // Replace an existing conduit for the same domain
    if (Conduit *old = m_conduits.value(conduit->domain())) {
        delete old;
    }

    m_conduits[conduit->domain()] = conduit;
    conduit->setParent(this);
    connectConduitSignals(conduit);

    qDebug() << "[SyncEngine] Registered conduit:" << conduit->displayName();
}

Conduit* SyncEngine::conduit(SyncDomain domain) const
{
    return m_conduits.value(domain);
}

void SyncEngine::connectConduitSignals(Conduit *conduit)
{
    connect(conduit, &Conduit::logMessage, this, &SyncEngine::logMessage);
    connect(conduit, &Conduit::errorOccurred, this, &SyncEngine::errorOccurred);
    connect(conduit, &Conduit::progressUpdated, this, &SyncEngine::progressUpdated);
    connect(conduit, &Conduit::conflictDetected, this, &SyncEngine::conflictDetected);
}

void SyncEngine::setTransferEngine(TransferEngine *engine)
{
    m_transferEngine = engine;
    if (m_transferEngine && m_source) {
        m_transferEngine->setIo(std::make_shared<DeviceTransferIo>(m_source));
    }
}

// ========== Sync Operations ==========

SyncResult SyncEngine::denied(SyncDomain domain, SyncError reason, qint64 retryAfterMs) const
{
    SyncResult result;
    result.domain = domain;
    result.granted = false;
    result.success = false;
    result.error = reason;
    result.retryAfterMs = retryAfterMs;
    result.errorMessage = QString("%1 sync not admitted: %2").arg(domainName(domain), errorName(reason));
    result.startTime = QDateTime::currentDateTime();
    result.endTime = result.startTime;

    qDebug() << "[SyncEngine]" << result.errorMessage;
    return result;
}

void SyncEngine::finish(SyncResult &result)
{
    if (!result.endTime.isValid()) {
        result.endTime = QDateTime::currentDateTime();
    }

    if (m_bus) {
        if (result.success) {
            m_bus->publishSyncCompleted(result.domain, result.stats);
        } else {
            m_bus->publishSyncFailed(result.domain, result.error, result.errorMessage);
        }
    }

    if (result.success) {
        qInfo() << "[SyncEngine]" << domainName(result.domain) << "done -" << result.stats.summary();
    } else {
        qWarning() << "[SyncEngine]" << domainName(result.domain) << "failed -" << result.errorMessage;
    }

    emit syncFinished(result);
}

SyncResult SyncEngine::syncDomain(SyncDomain domain, const QString &deviceId)
{
    if (domain == SyncDomain::Files) {
        return importFiles(deviceId);
    }

    Conduit *cond = m_conduits.value(domain);
    if (!cond) {
        SyncResult result;
        result.domain = domain;
        result.error = SyncError::DeviceDataUnavailable;
        result.errorMessage = QString("No conduit registered for %1").arg(domainName(domain));
        emit errorOccurred(result.errorMessage);
        return result;
    }

    SyncGuard guard(m_coordinator, domain);
    if (!guard.isGranted()) {
        return denied(domain, guard.denial(), guard.retryAfterMs());
    }

    emit syncStarted(domain);
    if (m_bus) {
        m_bus->publishSyncStarted(domain);
    }

    SyncContext context;
    context.store = m_store;
    context.source = m_source;
    context.bus = m_bus;
    context.deviceId = deviceId;
    context.strategy = m_strategy;

    cond->setCancelCheck([&guard]() { return !guard.isValid(); });
    SyncResult result = cond->sync(&context);
    cond->setCancelCheck(nullptr);

    guard.release();

    if (result.success) {
        m_coordinator->reportRecordCount(result.stats.fetched);
    }

    finish(result);
    return result;
}

QList<SyncResult> SyncEngine::syncAll(const QString &deviceId)
{
    QList<SyncResult> results;
    const QList<SyncDomain> order = {SyncDomain::Contacts, SyncDomain::Messages, SyncDomain::Calls};

    int index = 0;
    for (SyncDomain domain : order) {
        emit progressUpdated(index++, order.size(),
            QString("Syncing %1...").arg(domainName(domain)));
        results.append(syncDomain(domain, deviceId));
    }
    return results;
}

SyncResult SyncEngine::importFiles(const QString &deviceId, const QStringList &files,
                                   const QString &destinationDir, QStringList *transferIds)
{
    const SyncDomain domain = SyncDomain::Files;

    if (!m_transferEngine) {
        SyncResult result;
        result.domain = domain;
        result.error = SyncError::IOError;
        result.errorMessage = "No transfer engine configured";
        emit errorOccurred(result.errorMessage);
        return result;
    }

    SyncGuard guard(m_coordinator, domain);
    if (!guard.isGranted()) {
        return denied(domain, guard.denial(), guard.retryAfterMs());
    }

    emit syncStarted(domain);
    if (m_bus) {
        m_bus->publishSyncStarted(domain);
    }

    SyncResult result;
    result.domain = domain;
    result.granted = true;
    result.success = true;
    result.startTime = QDateTime::currentDateTime();

    QStringList sources = files;
    if (sources.isEmpty() && m_source) {
        sources = m_source->listFiles(deviceId);
    }
    result.stats.fetched = sources.size();

    QString destination = destinationDir.isEmpty() ? m_downloadDirectory : destinationDir;
    if (destination.isEmpty()) {
        result.success = false;
        result.error = SyncError::IOError;
        result.errorMessage = "No destination directory for imported files";
    } else if (!destination.endsWith('/')) {
        destination += '/';
    }

    for (const QString &source : sources) {
        if (!result.success) break;
        if (!guard.isValid()) {
            result.success = false;
            result.error = SyncError::EmergencyThrottled;
            result.errorMessage = "File import interrupted by emergency mode";
            break;
        }

        TransferRequest request;
        request.sourcePath = DeviceTransferIo::devicePath(deviceId, source);
        request.filename = QFileInfo(source).fileName();
        request.destinationPath = destination;
        request.deviceId = deviceId;
        request.kind = TransferKind::Import;

        SyncError error = SyncError::None;
        QString message;
        QString id = m_transferEngine->enqueue(request, &error, &message);
        if (id.isEmpty()) {
            result.stats.errors++;
            qWarning() << "[SyncEngine] Could not import" << source << "-" << message;
            continue;
        }

        result.stats.created++;
        if (transferIds) {
            transferIds->append(id);
        }
    }

    guard.release();
    result.endTime = QDateTime::currentDateTime();
    finish(result);
    return result;
}

// ========== Conflicts ==========

bool SyncEngine::resolveConflict(const QString &conflictId, ConflictResolution resolution,
                                 QString *error)
{
    std::optional<ConflictRecord> conflict = m_store->conflict(conflictId);
    if (!conflict) {
        if (error) *error = QString("Unknown conflict: %1").arg(conflictId);
        return false;
    }
    if (!conflict->isOpen()) {
        if (error) *error = QString("Conflict %1 is already resolved").arg(conflictId);
        return false;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    Contact current = m_store->contact(conflict->localId).value_or(conflict->localSnapshot);
    Contact resolved = ConflictResolver::applyResolution(*conflict, current, resolution);

    if (resolution != ConflictResolution::KeepLocal) {
        resolved.updatedAt = now;
        if (!m_store->upsertContact(resolved)) {
            if (error) *error = QString("Cannot write contact %1").arg(resolved.id);
            return false;
        }
    }

    conflict->resolution = resolution;
    conflict->resolvedAt = now;
    if (!m_store->upsertConflict(*conflict)) {
        if (error) *error = QString("Cannot update conflict %1").arg(conflictId);
        return false;
    }

    qInfo() << "[SyncEngine] Conflict" << conflictId << "resolved:" << resolutionName(resolution);
    return true;
}

QList<ConflictRecord> SyncEngine::openConflicts()
{
    return m_store->conflicts(true);
}

} // namespace Unison
