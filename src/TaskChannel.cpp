#include "TaskChannel.h"

#include <QDebug>
#include <QMutexLocker>

const char *taskKindName(TaskKind kind) {
    switch (kind) {
    case TaskKind::DecompileArchive:  return "decompile-archive";
    case TaskKind::ExportToDirectory: return "export-to-directory";
    case TaskKind::ExportToArchive:   return "export-to-archive";
    }
    return "unknown";
}

bool TaskChannel::pushProgress(int completed, int total, const QString &message) {
    TaskEvent event;
    event.type = TaskEvent::Type::Progress;
    event.progress.completed = total > 0 ? completed : 0;
    event.progress.total     = qMax(total, 0);
    event.progress.message = message;
    return push(std::move(event));
}

bool TaskChannel::pushOutcome(const TaskOutcome &outcome) {
    TaskEvent event;
    event.type    = TaskEvent::Type::Outcome;
    event.outcome = outcome;
    return push(std::move(event));
}

bool TaskChannel::push(TaskEvent &&event) {
    QMutexLocker locker(&m_mutex);
    if (m_closed) {
        qWarning() << "[Pipeline]" << taskKindName(m_kind) << "event after outcome dropped";
        return false;
    }
    if (event.isOutcome()) {
        m_closed = true;
    } else if (event.progress.total > 0) {
        // keep 0 <= completed <= total and never go backwards
        event.progress.completed = qMin(qMax(event.progress.completed, m_lastCompleted), event.progress.total);
        m_lastCompleted = event.progress.completed;
    }
    m_events.enqueue(std::move(event));
    m_ready.wakeAll();
    return true;
}

bool TaskChannel::tryTake(TaskEvent &out) {
    QMutexLocker locker(&m_mutex);
    if (m_events.isEmpty()) return false;
    out = m_events.dequeue();
    return true;
}

bool TaskChannel::waitTake(TaskEvent &out, unsigned long timeoutMs) {
    QMutexLocker locker(&m_mutex);
    while (m_events.isEmpty()) {
        if (m_closed) return false;
        if (!m_ready.wait(&m_mutex, timeoutMs)) return false;
    }
    out = m_events.dequeue();
    return true;
}

bool TaskChannel::isClosed() const {
    QMutexLocker locker(&m_mutex);
    return m_closed;
}

bool TaskChannel::isFinished() const {
    QMutexLocker locker(&m_mutex);
    return m_closed && m_events.isEmpty();
}
