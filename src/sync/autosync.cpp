#include "autosync.h"
#include "syncengine.h"

#include <QTimer>
#include <QDebug>

namespace Unison {

const int AutoSync::DEFAULT_INTERVAL_MS;

AutoSync::AutoSync(SyncEngine *engine, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
{
    qRegisterMetaType<QList<Unison::SyncResult>>("QList<Unison::SyncResult>");

    m_timer = new QTimer(this);
    connect(m_timer, &QTimer::timeout, this, &AutoSync::runPass);
}

AutoSync::~AutoSync()
{
    stop();
}

void AutoSync::setInterval(int intervalMs)
{
    if (intervalMs <= 0) {
        qWarning() << "[AutoSync] Invalid interval" << intervalMs << "- keeping" << m_intervalMs;
        return;
    }

    m_intervalMs = intervalMs;
    if (m_timer->isActive()) {
        m_timer->setInterval(intervalMs);
    }
}

void AutoSync::start()
{
    if (m_running) {
        return;
    }

    if (m_deviceId.isEmpty()) {
        qWarning() << "[AutoSync] Cannot start - no device";
        return;
    }

    m_running = true;
    m_timer->start(m_intervalMs);
    qInfo() << "[AutoSync] Started for" << m_deviceId << "every" << m_intervalMs << "ms";
}

void AutoSync::stop()
{
    if (!m_running) {
        return;
    }

    m_running = false;
    m_timer->stop();
    qInfo() << "[AutoSync] Stopped after" << m_passCount << "pass(es)";
}

void AutoSync::runPass()
{
    if (!m_engine || m_deviceId.isEmpty()) {
        return;
    }

    m_passCount++;
    QList<SyncResult> results = m_engine->syncAll(m_deviceId);

    int granted = 0;
    for (const SyncResult &result : results) {
        if (result.granted) granted++;
    }
    qDebug() << "[AutoSync] Pass" << m_passCount << "-" << granted << "of" << results.size()
             << "domain(s) admitted";

    emit passFinished(results);
}

} // namespace Unison
