#ifndef TRANSFERWORKER_H
#define TRANSFERWORKER_H

#include <QRunnable>
#include <QElapsedTimer>
#include <atomic>
#include <memory>
#include "transfertypes.h"
#include "thumbnailer.h"

namespace Unison {

class TransferEngine;
class TransferIo;

/**
 * @brief Control channel between the engine and one running worker
 *
 * The engine writes a request; the worker reads it between chunks.
 * Before finishing, the worker swaps the current request for Committed.
 * A request accepted before that swap is honored even if the copy
 * already completed; any later one is refused.
 */
struct TransferControl {
    enum Request {
        None,
        Pause,
        Cancel,
        Stop,       ///< Engine shutdown; leave the record resumable
        Committed   ///< Set by the worker once its outcome is final
    };

    std::atomic<int> request{None};
};

/**
 * @brief Copies one file on a pool thread
 *
 * Streams the source to the destination in chunks, reporting progress
 * back to the engine, then verifies the destination against the
 * checksum taken at enqueue time. Pause, cancel and stop requests are
 * honored at chunk boundaries.
 *
 * The worker only touches its own copy of the record; the engine
 * persists whatever the worker reports.
 */
class TransferWorker : public QRunnable
{
public:
    enum Outcome {
        Completed,
        Failed,
        Paused,
        Cancelled,
        Stopped
    };

    struct Options {
        qint64 chunkSize = 256 * 1024;
        qint64 bandwidthLimit = 0;      ///< Bytes per second, 0 = unlimited
        Thumbnailer thumbnailer{QString()};
    };

    TransferWorker(TransferEngine *engine,
                   const TransferRecord &record,
                   std::shared_ptr<TransferControl> control,
                   std::shared_ptr<TransferIo> io,
                   const Options &options);

    void run() override;

private:
    Outcome copy();
    bool verify();

    /**
     * @brief Make the outcome final
     * @return The outcome of the last accepted request, else outcome
     */
    Outcome commit(Outcome outcome);

    void postProcess();

    /**
     * @brief Sleep as needed to stay under the bandwidth limit
     * @return false if a control request arrived while waiting
     */
    bool throttle(qint64 sessionBytes, const QElapsedTimer &session);

    void updateSpeed(qint64 chunkBytes, qint64 chunkMs);
    bool stopRequested() const;
    Outcome fail(SyncError error, const QString &message);

    TransferEngine *m_engine;
    TransferRecord m_record;
    std::shared_ptr<TransferControl> m_control;
    std::shared_ptr<TransferIo> m_io;
    Options m_options;
};

} // namespace Unison

#endif // TRANSFERWORKER_H
