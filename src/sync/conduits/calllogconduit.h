#ifndef CALLLOGCONDUIT_H
#define CALLLOGCONDUIT_H

#include "../conduit.h"

namespace Unison {

/**
 * @brief Conduit for device call history
 *
 * Call log entries never change once recorded; only unknown ids are inserted.
 */
class CallLogConduit : public Conduit
{
    Q_OBJECT

public:
    explicit CallLogConduit(QObject *parent = nullptr) : Conduit(parent) {}

    QString conduitId() const override { return "calls"; }
    QString displayName() const override { return "Call Log"; }
    SyncDomain domain() const override { return SyncDomain::Calls; }

protected:
    void syncRecords(SyncContext *context, SyncResult &result) override;
};

} // namespace Unison

#endif // CALLLOGCONDUIT_H
