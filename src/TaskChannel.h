#pragma once

#include <QMetaType>
#include <QMutex>
#include <QQueue>
#include <QString>
#include <QWaitCondition>
#include <memory>
#include "NamespaceTree.h"

enum class TaskKind {
    DecompileArchive,
    ExportToDirectory,
    ExportToArchive
};

const char *taskKindName(TaskKind kind);

// total == 0 means the amount of work is not known (decompile).
struct ProgressEvent {
    int     completed = 0;
    int     total     = 0;
    QString message;

    bool isIndeterminate() const { return total == 0; }
};

struct TaskOutcome {
    bool             success = false;
    QString          reason;        // set on failure
    NamespaceTreePtr tree;          // set by a successful decompile

    static TaskOutcome ok(NamespaceTreePtr tree = {}) {
        TaskOutcome o;
        o.success = true;
        o.tree = std::move(tree);
        return o;
    }
    static TaskOutcome failure(const QString &reason) {
        TaskOutcome o;
        o.reason = reason;
        return o;
    }
};

struct TaskEvent {
    enum class Type { Progress, Outcome };

    Type          type = Type::Progress;
    ProgressEvent progress;
    TaskOutcome   outcome;

    bool isOutcome() const { return type == Type::Outcome; }
};

// Hand-off from the worker to whoever consumes a task's events.
// Events come out in the order they were pushed; once the outcome is pushed
// the channel is closed and later pushes are dropped.
class TaskChannel {
public:
    explicit TaskChannel(TaskKind kind) : m_kind(kind) {}

    TaskKind kind() const { return m_kind; }

    // Producer side
    bool pushProgress(int completed, int total, const QString &message);
    bool pushOutcome(const TaskOutcome &outcome);

    // Consumer side. Both return false when nothing is available.
    bool tryTake(TaskEvent &out);
    bool waitTake(TaskEvent &out, unsigned long timeoutMs);

    bool isClosed() const;
    bool isFinished() const;  // closed and fully drained

private:
    bool push(TaskEvent &&event);

    const TaskKind   m_kind;
    mutable QMutex   m_mutex;
    QWaitCondition   m_ready;
    QQueue<TaskEvent> m_events;
    bool             m_closed = false;
    int              m_lastCompleted = 0;
};

using TaskChannelPtr = std::shared_ptr<TaskChannel>;

Q_DECLARE_METATYPE(TaskChannelPtr)
