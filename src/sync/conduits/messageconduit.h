#ifndef MESSAGECONDUIT_H
#define MESSAGECONDUIT_H

#include "../conduit.h"
#include <QSet>

namespace Unison {

class RecordStore;

/**
 * @brief Conduit for device messages
 *
 * Messages are immutable except for their read flag: unknown ids are
 * inserted, known ones only pick up read state changes. Thread
 * summaries are rebuilt for every thread that changed.
 */
class MessageConduit : public Conduit
{
    Q_OBJECT

public:
    explicit MessageConduit(QObject *parent = nullptr) : Conduit(parent) {}

    // ========== Conduit Identity ==========

    QString conduitId() const override { return "messages"; }
    QString displayName() const override { return "Messages"; }
    SyncDomain domain() const override { return SyncDomain::Messages; }

    /**
     * @brief Recompute the summary of one thread from its messages
     */
    static bool rebuildThread(RecordStore *store, const QString &threadId);

protected:
    void syncRecords(SyncContext *context, SyncResult &result) override;
};

} // namespace Unison

#endif // MESSAGECONDUIT_H
