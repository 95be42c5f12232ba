/**
 * Voidrat - Scheduler Inbox
 *
 * Completion messages posted by refresh tasks and drained by the
 * scheduler loop once per tick.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <deque>
#include <iterator>
#include <vector>

#include <QMutex>
#include <QMutexLocker>
#include <QString>

namespace voidrat {

struct SchedulerMessage {
    enum class Kind {
        Initialized,     // Start-up data loaded
        Updated,         // Fresh data stored (one per successful source)
        RefreshFailed    // No source delivered anything this attempt
    };

    Kind kind;
    QString detail;
};

/**
 * Unbounded multi-producer, single-consumer queue
 */
class MessageInbox {
public:
    void post(SchedulerMessage message) {
        QMutexLocker locker(&m_mutex);
        m_messages.push_back(std::move(message));
    }

    void post(SchedulerMessage::Kind kind, const QString& detail = {}) {
        post(SchedulerMessage{kind, detail});
    }

    /**
     * Take every pending message without blocking
     */
    std::vector<SchedulerMessage> drain() {
        QMutexLocker locker(&m_mutex);
        std::vector<SchedulerMessage> messages(
            std::make_move_iterator(m_messages.begin()),
            std::make_move_iterator(m_messages.end()));
        m_messages.clear();
        return messages;
    }

    bool isEmpty() const {
        QMutexLocker locker(&m_mutex);
        return m_messages.empty();
    }

private:
    mutable QMutex m_mutex;
    std::deque<SchedulerMessage> m_messages;
};

} // namespace voidrat
