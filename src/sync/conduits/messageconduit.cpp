#include "messageconduit.h"
#include "../recordstore.h"
#include "../devicedatasource.h"

#include <QDebug>

namespace Unison {

namespace {
const int PREVIEW_LENGTH = 100;
}

bool MessageConduit::rebuildThread(RecordStore *store, const QString &threadId)
{
    const QList<Message> messages = store->messages(threadId);
    if (messages.isEmpty()) {
        return true;
    }

    MessageThread thread;
    if (std::optional<MessageThread> existing = store->thread(threadId)) {
        thread = *existing;
    } else {
        thread.id = threadId;
        thread.createdAt = QDateTime::currentDateTimeUtc();
    }

    thread.participants.clear();
    thread.unreadCount = 0;
    for (const Message &message : messages) {
        if (!message.address.isEmpty() && !thread.participants.contains(message.address)) {
            thread.participants.append(message.address);
        }
        if (message.direction == MessageDirection::Incoming && !message.read) {
            thread.unreadCount++;
        }
    }

    // messages() is ordered by timestamp
    const Message &last = messages.last();
    thread.lastMessageId = last.id;
    thread.lastMessagePreview = last.body.left(PREVIEW_LENGTH);
    thread.lastMessageAt = last.timestamp;
    thread.messageCount = messages.size();
    thread.updatedAt = QDateTime::currentDateTimeUtc();

    return store->upsertThread(thread);
}

void MessageConduit::syncRecords(SyncContext *context, SyncResult &result)
{
    QList<RemoteMessage> remoteMessages;
    if (!context->source->extractMessages(context->deviceId, remoteMessages)) {
        fail(result, SyncError::DeviceDataUnavailable,
             QString("Cannot read messages: %1").arg(context->source->lastError()));
        return;
    }

    result.stats.fetched = remoteMessages.size();
    emit logMessage(QString("Device reports %1 messages").arg(remoteMessages.size()));

    QSet<QString> touchedThreads;
    int index = 0;

    for (const RemoteMessage &remote : remoteMessages) {
        if (isCancelled()) {
            interrupt(result);
            break;
        }
        emit progressUpdated(++index, remoteMessages.size(), remote.id);

        const QDateTime now = QDateTime::currentDateTimeUtc();
        std::optional<Message> existing = context->store->message(remote.id);

        if (!existing) {
            Message message;
            message.id = remote.id;
            message.threadId = remote.threadId.isEmpty()
                ? QString("thread-%1").arg(remote.address) : remote.threadId;
            message.address = remote.address;
            message.body = remote.body;
            message.service = remote.service;
            message.direction = remote.direction;
            message.timestamp = remote.timestamp;
            message.read = remote.read;
            message.createdAt = now;
            message.updatedAt = now;

            if (context->store->upsertMessage(message)) {
                result.stats.created++;
                touchedThreads.insert(message.threadId);
            } else {
                result.stats.errors++;
            }
            continue;
        }

        if (existing->read != remote.read) {
            existing->read = remote.read;
            existing->updatedAt = now;
            if (context->store->upsertMessage(*existing)) {
                result.stats.updated++;
                touchedThreads.insert(existing->threadId);
            } else {
                result.stats.errors++;
            }
        } else {
            result.stats.unchanged++;
        }
    }

    // Keep summaries consistent with what was written, even after an interruption
    for (const QString &threadId : touchedThreads) {
        if (!rebuildThread(context->store, threadId)) {
            qWarning() << "[MessageConduit] Failed to update thread" << threadId;
            result.stats.errors++;
        }
    }
}

} // namespace Unison
