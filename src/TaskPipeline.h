#pragma once

#include <QObject>
#include <QString>
#include <QThread>
#include <QVariantMap>
#include "DecompilerEngine.h"
#include "ResultStore.h"
#include "TaskChannel.h"

class PipelineWorker;

// Entry point for background work. Each run() returns the channel on which the
// task's progress events and single outcome arrive. Only one task runs at a time.
class TaskPipeline : public QObject {
    Q_OBJECT
public:
    TaskPipeline(ResultStore &store, EngineFactory engineFactory, QObject *parent = nullptr);
    ~TaskPipeline() override;

    // input: archive to decompile, output folder, or output zip path
    TaskChannelPtr run(TaskKind kind, const QString &input);

    void setEngineOptions(const QVariantMap &options) { m_engineOptions = options; }
    QVariantMap engineOptions() const { return m_engineOptions; }

    // Takes effect for the next decompile. Export keeps re-rendering through the
    // engine that produced the current results.
    void setEngineFactory(EngineFactory engineFactory);

    bool isBusy() const;
    // Stops a running export before its next entry; decompiles always run to the end.
    void requestCancel();

signals:
    // Emitted in the pipeline's thread whenever a channel received an event.
    void eventsAvailable();

private:
    ResultStore    &m_store;
    QThread        *m_thread = nullptr;
    PipelineWorker *m_worker = nullptr;
    QVariantMap     m_engineOptions;
};
