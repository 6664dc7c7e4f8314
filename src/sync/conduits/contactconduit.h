#ifndef CONTACTCONDUIT_H
#define CONTACTCONDUIT_H

#include "../conduit.h"

namespace Unison {

/**
 * @brief Conduit for device contacts
 *
 * New device contacts are created locally. Existing ones go through
 * ConflictResolver with the context's merge strategy; a deferred
 * outcome is stored as a ConflictRecord and the local contact is left
 * untouched. A contact with an open conflict is skipped until the
 * conflict is resolved.
 */
class ContactConduit : public Conduit
{
    Q_OBJECT

public:
    explicit ContactConduit(QObject *parent = nullptr) : Conduit(parent) {}

    // ========== Conduit Identity ==========

    QString conduitId() const override { return "contacts"; }
    QString displayName() const override { return "Contacts"; }
    SyncDomain domain() const override { return SyncDomain::Contacts; }

protected:
    void syncRecords(SyncContext *context, SyncResult &result) override;
};

} // namespace Unison

#endif // CONTACTCONDUIT_H
