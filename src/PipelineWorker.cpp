#include "PipelineWorker.h"

#include <QDebug>
#include <QFileInfo>
#include <exception>

PipelineWorker::PipelineWorker(ResultStore &store, EngineFactory factory, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_engineFactory(std::move(factory)) {}

PipelineWorker::~PipelineWorker() = default;

bool PipelineWorker::tryBeginTask() {
    bool expected = false;
    if (!m_busy.compare_exchange_strong(expected, true)) return false;
    m_cancel.store(false);
    return true;
}

void PipelineWorker::setEngineFactory(EngineFactory factory) {
    QMutexLocker locker(&m_factoryMutex);
    m_engineFactory = std::move(factory);
}

void PipelineWorker::progress(const TaskChannelPtr &channel, int completed, int total, const QString &message) {
    if (channel->pushProgress(completed, total, message))
        emit eventPushed();
}

void PipelineWorker::finish(const TaskChannelPtr &channel, const TaskOutcome &outcome) {
    if (outcome.success)
        qDebug() << "[Pipeline]" << taskKindName(channel->kind()) << "succeeded";
    else
        qWarning() << "[Pipeline]" << taskKindName(channel->kind()) << "failed:" << outcome.reason;

    // Released before the outcome is visible so the consumer can start the next task.
    m_busy.store(false);
    if (channel->pushOutcome(outcome))
        emit eventPushed();
}

// Errors never leave the worker thread: they become the task's outcome.
void PipelineWorker::runGuarded(const TaskChannelPtr &channel, const std::function<void()> &body) {
    try {
        body();
    } catch (const std::exception &e) {
        if (!channel->isClosed())
            finish(channel, TaskOutcome::failure(QString("Unexpected error: %1").arg(e.what())));
    } catch (...) {
        if (!channel->isClosed())
            finish(channel, TaskOutcome::failure("Unexpected error"));
    }
    if (!channel->isClosed())
        finish(channel, TaskOutcome::failure("Task ended without a result"));
}

// ── Decompile ─────────────────────────────────────────────────────

void PipelineWorker::decompileArchive(TaskChannelPtr channel, QString archivePath, QVariantMap engineOptions) {
    runGuarded(channel, [&]() {
        m_store.clear();
        progress(channel, 0, 0, QString("Decompiling %1...").arg(QFileInfo(archivePath).fileName()));

        EngineFactory factory;
        {
            QMutexLocker locker(&m_factoryMutex);
            factory = m_engineFactory;
        }
        std::unique_ptr<DecompilerEngine> engine = factory ? factory() : nullptr;
        if (!engine) {
            finish(channel, TaskOutcome::failure("No decompiler engine available"));
            return;
        }
        engine->setOptions(engineOptions);

        QString err;
        if (!engine->addSource(archivePath, err)) {
            finish(channel, TaskOutcome::failure(err));
            return;
        }
        // From here on the store holds this engine's units.
        m_engine = std::move(engine);

        int units = 0;
        auto onResult = [&](const QString &qualifiedName, const QString &source) {
            QString name = qualifiedName;
            name.replace(QChar('.'), QChar('/'));
            m_store.put(name, source);
            ++units;
            progress(channel, 0, 0, QString("Decompiled %1").arg(name));
        };
        auto onLog = [&](DecompilerEngine::Severity severity, const QString &message) {
            if (severity == DecompilerEngine::Severity::Warn || severity == DecompilerEngine::Severity::Error)
                progress(channel, 0, 0, message);
            else
                qDebug() << "[Engine]" << message;
        };

        if (!m_engine->decompileContext(onResult, onLog, err)) {
            finish(channel, TaskOutcome::failure(err));
            return;
        }

        NamespaceTreePtr tree = buildNamespaceTree(m_store.allNames());
        qDebug() << "[Pipeline] Decompiled" << units << "unit(s) from" << archivePath;
        finish(channel, TaskOutcome::ok(tree));
    });
}

// ── Export ────────────────────────────────────────────────────────

void PipelineWorker::exportToDirectory(TaskChannelPtr channel, QString rootDir) {
    runGuarded(channel, [&]() {
        DirectoryExportWriter writer(rootDir);
        exportAll(channel, writer);
    });
}

void PipelineWorker::exportToArchive(TaskChannelPtr channel, QString archivePath) {
    runGuarded(channel, [&]() {
        ArchiveExportWriter writer(archivePath);
        exportAll(channel, writer);
    });
}

void PipelineWorker::exportAll(const TaskChannelPtr &channel, ExportWriter &writer) {
    const QStringList names = m_store.allNames();
    const int total = names.size();
    if (total == 0) {
        finish(channel, TaskOutcome::failure("No decompiled classes to save"));
        return;
    }

    QString err;
    if (!writer.open(err)) {
        finish(channel, TaskOutcome::failure(err));
        return;
    }

    int count = 0;
    for (const QString &name : names) {
        if (m_cancel.load()) {
            QString closeErr;
            if (!writer.close(closeErr)) qWarning() << "[Export]" << closeErr;
            finish(channel, TaskOutcome::failure(
                QString("Export cancelled after %1 of %2 classes").arg(count).arg(total)));
            return;
        }

        QString text = m_store.get(name);
        if (text.isNull() && m_engine)
            text = m_engine->classContent(name);

        if (text.isNull()) {
            qDebug() << "[Export] No content for" << name << "- skipped";
        } else if (!writer.write(name, text, err)) {
            // Entries already written stay where they are.
            QString closeErr;
            if (!writer.close(closeErr)) qWarning() << "[Export]" << closeErr;
            finish(channel, TaskOutcome::failure(err));
            return;
        }

        ++count;
        progress(channel, count, total, QString("Saved %1 of %2 classes").arg(count).arg(total));
    }

    if (!writer.close(err)) {
        finish(channel, TaskOutcome::failure(err));
        return;
    }
    qDebug() << "[Export] Saved" << total << "class(es) to" << writer.target();
    finish(channel, TaskOutcome::ok());
}
