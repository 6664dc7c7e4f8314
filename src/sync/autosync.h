#ifndef AUTOSYNC_H
#define AUTOSYNC_H

#include <QObject>
#include <QList>
#include <QString>
#include "synctypes.h"

class QTimer;

namespace Unison {

class SyncEngine;

/**
 * @brief Runs SyncEngine::syncAll() for one device on a fixed interval
 *
 * Every tick asks the engine for a full pass. Nothing here bypasses
 * admission: when the interval is shorter than a domain's cooldown, or
 * emergency mode has stretched the cooldowns, that domain is simply
 * denied on this tick and tried again on the next one.
 *
 * The first pass runs one interval after start().
 */
class AutoSync : public QObject
{
    Q_OBJECT

public:
    static const int DEFAULT_INTERVAL_MS = 300000;

    explicit AutoSync(SyncEngine *engine, QObject *parent = nullptr);
    ~AutoSync() override;

    void setDeviceId(const QString &deviceId) { m_deviceId = deviceId; }
    QString deviceId() const { return m_deviceId; }

    /**
     * @brief Set the interval between passes in milliseconds
     *
     * Takes effect immediately when running.
     */
    void setInterval(int intervalMs);
    int interval() const { return m_intervalMs; }

    bool isRunning() const { return m_running; }
    int passCount() const { return m_passCount; }

public slots:
    void start();
    void stop();

    /**
     * @brief Run one pass now
     */
    void runPass();

signals:
    void passFinished(const QList<Unison::SyncResult> &results);

private:
    SyncEngine *m_engine;
    QTimer *m_timer = nullptr;
    QString m_deviceId;
    int m_intervalMs = DEFAULT_INTERVAL_MS;
    int m_passCount = 0;
    bool m_running = false;
};

} // namespace Unison

#endif // AUTOSYNC_H
