#include "TaskPipeline.h"
#include "PipelineWorker.h"

#include <QDebug>
#include <QMetaObject>

TaskPipeline::TaskPipeline(ResultStore &store, EngineFactory engineFactory, QObject *parent)
    : QObject(parent)
    , m_store(store) {
    qRegisterMetaType<TaskChannelPtr>("TaskChannelPtr");

    m_thread = new QThread(this);
    m_thread->setObjectName("PipelineWorker");
    m_worker = new PipelineWorker(m_store, std::move(engineFactory));
    m_worker->moveToThread(m_thread);
    m_thread->start();

    connect(m_worker, &PipelineWorker::eventPushed, this, &TaskPipeline::eventsAvailable);
}

TaskPipeline::~TaskPipeline() {
    m_worker->requestCancel();
    m_thread->quit();
    m_thread->wait();
    delete m_worker;
}

void TaskPipeline::setEngineFactory(EngineFactory engineFactory) {
    m_worker->setEngineFactory(std::move(engineFactory));
}

bool TaskPipeline::isBusy() const {
    return m_worker->isBusy();
}

void TaskPipeline::requestCancel() {
    if (m_worker->isBusy()) m_worker->requestCancel();
}

TaskChannelPtr TaskPipeline::run(TaskKind kind, const QString &input) {
    auto channel = std::make_shared<TaskChannel>(kind);

    if (!m_worker->tryBeginTask()) {
        qWarning() << "[Pipeline] Refusing" << taskKindName(kind) << "while another task runs";
        channel->pushOutcome(TaskOutcome::failure("Another task is still running"));
        return channel;
    }

    qDebug() << "[Pipeline] Starting" << taskKindName(kind) << input;

    bool queued = false;
    switch (kind) {
    case TaskKind::DecompileArchive:
        queued = QMetaObject::invokeMethod(m_worker, "decompileArchive", Qt::QueuedConnection,
            Q_ARG(TaskChannelPtr, channel),
            Q_ARG(QString, input),
            Q_ARG(QVariantMap, m_engineOptions));
        break;
    case TaskKind::ExportToDirectory:
        queued = QMetaObject::invokeMethod(m_worker, "exportToDirectory", Qt::QueuedConnection,
            Q_ARG(TaskChannelPtr, channel),
            Q_ARG(QString, input));
        break;
    case TaskKind::ExportToArchive:
        queued = QMetaObject::invokeMethod(m_worker, "exportToArchive", Qt::QueuedConnection,
            Q_ARG(TaskChannelPtr, channel),
            Q_ARG(QString, input));
        break;
    }

    if (!queued) {
        // Nothing was queued, so the worker will never release the task itself.
        m_worker->abandonTask();
        channel->pushOutcome(TaskOutcome::failure(
            QString("Cannot start %1").arg(taskKindName(kind))));
    }
    return channel;
}
