#pragma once

#include <QMutex>
#include <QObject>
#include <QString>
#include <QVariantMap>
#include <atomic>
#include <functional>
#include <memory>
#include "DecompilerEngine.h"
#include "ExportWriter.h"
#include "ResultStore.h"
#include "TaskChannel.h"

// Runs decompile and export tasks in a background thread.
// Lives in the pipeline's QThread; its slots are only invoked through queued calls.
class PipelineWorker : public QObject {
    Q_OBJECT
public:
    PipelineWorker(ResultStore &store, EngineFactory factory, QObject *parent = nullptr);
    ~PipelineWorker() override;

    // Called from the GUI thread. False when a task is already running.
    bool tryBeginTask();
    void abandonTask() { m_busy.store(false); }
    bool isBusy() const { return m_busy.load(); }
    void requestCancel() { m_cancel.store(true); }

    // Used by the next decompile; the engine behind the current store is kept.
    void setEngineFactory(EngineFactory factory);

public slots:
    void decompileArchive(TaskChannelPtr channel, QString archivePath, QVariantMap engineOptions);
    void exportToDirectory(TaskChannelPtr channel, QString rootDir);
    void exportToArchive(TaskChannelPtr channel, QString archivePath);

signals:
    void eventPushed();

private:
    void runGuarded(const TaskChannelPtr &channel, const std::function<void()> &body);
    void exportAll(const TaskChannelPtr &channel, ExportWriter &writer);
    void progress(const TaskChannelPtr &channel, int completed, int total, const QString &message);
    void finish(const TaskChannelPtr &channel, const TaskOutcome &outcome);

    ResultStore                      &m_store;
    QMutex                            m_factoryMutex;
    EngineFactory                     m_engineFactory;
    std::unique_ptr<DecompilerEngine> m_engine;   // engine of the archive currently in the store
    std::atomic<bool>                 m_busy{false};
    std::atomic<bool>                 m_cancel{false};
};
