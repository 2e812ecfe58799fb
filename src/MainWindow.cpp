#include "MainWindow.h"
#include "FernflowerEngine.h"

#include <QApplication>
#include <QFileDialog>
#include <QMessageBox>
#include <QVBoxLayout>
#include <QToolBar>
#include <QStatusBar>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QMimeData>
#include <QInputDialog>
#include <QGroupBox>
#include <QHeaderView>
#include <QCloseEvent>
#include <QFileInfo>
#include <QDir>
#include <QFontDatabase>
#include <QTextDocument>
#include <QSettings>
#include <QStyle>
#include <QTime>

static constexpr int QUALIFIED_NAME_ROLE = Qt::UserRole;
static constexpr int LOG_MAX_LINES       = 5000;

MainWindow::MainWindow(const AppConfig &config, QWidget *parent)
    : QMainWindow(parent)
    , m_config(config) {
    setWindowTitle("ClassLens — Java Decompiler");
    setMinimumSize(1200, 800);
    setAcceptDrops(true);

    // ── Toolbar ──────────────────────────────────────────────────
    QToolBar *tb = addToolBar("Main");
    tb->setMovable(false);

    m_btnOpen = new QPushButton("📂 Open archive");
    m_btnOpen->setToolTip("Open a .jar / .zip of compiled classes");
    tb->addWidget(m_btnOpen);
    tb->addSeparator();

    m_btnSaveFolder = new QPushButton("📁 Save to folder");
    m_btnSaveFolder->setEnabled(false);
    tb->addWidget(m_btnSaveFolder);

    m_btnSaveZip = new QPushButton("🗜 Save to ZIP");
    m_btnSaveZip->setEnabled(false);
    tb->addWidget(m_btnSaveZip);

    m_btnCancel = new QPushButton("✖ Cancel");
    m_btnCancel->setToolTip("Stop the running export after the current class");
    m_btnCancel->setEnabled(false);
    tb->addWidget(m_btnCancel);
    tb->addSeparator();

    m_btnGoTo = new QPushButton("→ Go to line");
    m_btnGoTo->setEnabled(false);
    tb->addWidget(m_btnGoTo);

    m_btnFind = new QPushButton("🔍 Find");
    m_btnFind->setEnabled(false);
    tb->addWidget(m_btnFind);
    tb->addSeparator();

    m_btnDecompiler = new QPushButton("⚙ Decompiler...");
    m_btnDecompiler->setToolTip("Choose the Fernflower decompiler jar");
    tb->addWidget(m_btnDecompiler);

    // ── Central layout ────────────────────────────────────────────
    QWidget *central = new QWidget;
    setCentralWidget(central);
    QVBoxLayout *mainLayout = new QVBoxLayout(central);
    mainLayout->setSpacing(4);
    mainLayout->setContentsMargins(6, 6, 6, 6);

    // Top splitter: class tree | source
    m_splitter = new QSplitter(Qt::Horizontal);

    QGroupBox *treeGroup = new QGroupBox("Classes");
    QVBoxLayout *treeLayout = new QVBoxLayout(treeGroup);
    m_classTree = new QTreeWidget;
    m_classTree->setHeaderHidden(true);
    m_classTree->setMinimumWidth(250);
    treeLayout->addWidget(m_classTree);
    m_splitter->addWidget(treeGroup);

    QGroupBox *sourceGroup = new QGroupBox("Decompiled source");
    QVBoxLayout *sourceLayout = new QVBoxLayout(sourceGroup);
    m_sourceView = new SourceView;
    sourceLayout->addWidget(m_sourceView);
    m_splitter->addWidget(sourceGroup);

    m_splitter->setStretchFactor(0, 0);
    m_splitter->setStretchFactor(1, 1);
    m_splitter->setSizes({350, 850});

    m_logView = new QTextEdit;
    m_logView->setReadOnly(true);
    m_logView->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    m_logView->document()->setMaximumBlockCount(LOG_MAX_LINES);

    // Vertical splitter so the log can be resized against the browser
    QSplitter *outer = new QSplitter(Qt::Vertical);
    outer->addWidget(m_splitter);
    QGroupBox *logGroup = new QGroupBox("Log");
    QVBoxLayout *logLayout = new QVBoxLayout(logGroup);
    logLayout->setContentsMargins(4, 4, 4, 4);
    logLayout->addWidget(m_logView);
    outer->addWidget(logGroup);
    outer->setStretchFactor(0, 1);
    outer->setSizes({640, 140});
    mainLayout->addWidget(outer, 1);

    m_statusLabel = new QLabel("Drop an archive here or click Open.");
    m_progress = new QProgressBar;
    m_progress->setVisible(false);
    m_progress->setMaximumWidth(220);
    m_progress->setTextVisible(true);
    statusBar()->addWidget(m_statusLabel, 1);
    statusBar()->addPermanentWidget(m_progress);

    createPipeline();

    // ── Connections ───────────────────────────────────────────────
    connect(m_btnOpen,       &QPushButton::clicked, this, &MainWindow::openFile);
    connect(m_btnSaveFolder, &QPushButton::clicked, this, &MainWindow::saveToFolder);
    connect(m_btnSaveZip,    &QPushButton::clicked, this, &MainWindow::saveToZip);
    connect(m_btnCancel,     &QPushButton::clicked, this, &MainWindow::cancelTask);
    connect(m_btnDecompiler, &QPushButton::clicked, this, &MainWindow::chooseDecompiler);
    connect(m_btnGoTo,       &QPushButton::clicked, this, &MainWindow::goToLine);
    connect(m_btnFind,       &QPushButton::clicked, this, &MainWindow::findText);

    connect(m_classTree, &QTreeWidget::currentItemChanged, this, &MainWindow::onClassSelected);

    log("ClassLens ready. Drop or open a .jar file.");
    if (m_config.decompilerJar.isEmpty())
        log("No decompiler jar configured yet — use ⚙ Decompiler... or --decompiler.");
}

MainWindow::~MainWindow() {
    delete m_pipeline;
}

void MainWindow::createPipeline() {
    m_pipeline = new TaskPipeline(m_store,
        fernflowerEngineFactory(m_config.javaExecutable, m_config.decompilerJar));
    m_pipeline->setEngineOptions(m_config.engineOptions);
    connect(m_pipeline, &TaskPipeline::eventsAvailable, this, &MainWindow::drainTaskEvents);
}

// ── Drag & Drop ───────────────────────────────────────────────────

void MainWindow::dragEnterEvent(QDragEnterEvent *event) {
    if (event->mimeData()->hasUrls()) event->acceptProposedAction();
}

void MainWindow::dropEvent(QDropEvent *event) {
    const auto urls = event->mimeData()->urls();
    if (!urls.isEmpty()) openArchive(urls.first().toLocalFile());
}

// ── Decompile ─────────────────────────────────────────────────────

void MainWindow::openFile() {
    QString path = QFileDialog::getOpenFileName(this, "Open archive", {},
        "Java archives (*.jar *.zip *.war);;All files (*)");
    if (!path.isEmpty()) openArchive(path);
}

void MainWindow::openArchive(const QString &path) {
    if (m_pipeline->isBusy()) {
        QMessageBox::information(this, "Busy", "Wait for the current task to finish.");
        return;
    }

    m_archivePath = path;
    m_tree.reset();
    m_classTree->clear();
    m_sourceView->clear();

    log(QString("Decompiling %1 ...").arg(QFileInfo(path).fileName()));
    setWindowTitle(QString("ClassLens — %1").arg(QFileInfo(path).fileName()));
    startTask(TaskKind::DecompileArchive, path);
}

void MainWindow::populateClassTree() {
    m_classTree->clear();
    if (!m_tree) return;
    addTreeItems(m_classTree->invisibleRootItem(), *m_tree);
}

void MainWindow::addTreeItems(QTreeWidgetItem *parentItem, const PackageNode &package) {
    for (int i = 0; i < package.childCount(); ++i) {
        const NamespaceNode *child = package.childAt(i);
        auto *item = new QTreeWidgetItem(parentItem, QStringList{child->label()});

        if (const PackageNode *pkg = child->asPackage()) {
            item->setIcon(0, style()->standardIcon(QStyle::SP_DirIcon));
            addTreeItems(item, *pkg);
        } else if (const MemberNode *member = child->asMember()) {
            item->setIcon(0, style()->standardIcon(QStyle::SP_FileIcon));
            item->setData(0, QUALIFIED_NAME_ROLE, member->qualifiedName());
            item->setToolTip(0, member->qualifiedName());
        }
    }
}

void MainWindow::onClassSelected() {
    QTreeWidgetItem *item = m_classTree->currentItem();
    const QString name = item ? item->data(0, QUALIFIED_NAME_ROLE).toString() : QString();
    if (name.isEmpty()) {
        m_sourceView->clear();
        m_btnGoTo->setEnabled(false);
        m_btnFind->setEnabled(false);
        return;
    }

    m_sourceView->setSource(m_store.textForDisplay(name));
    m_btnGoTo->setEnabled(true);
    m_btnFind->setEnabled(true);
    m_statusLabel->setText(QString("%1 | %2 lines").arg(name).arg(m_sourceView->lineCount()));
}

// ── Export ────────────────────────────────────────────────────────

void MainWindow::saveToFolder() {
    if (m_store.size() == 0) {
        QMessageBox::warning(this, "Warning", "No decompiled classes to save");
        return;
    }

    QString dir = QFileDialog::getExistingDirectory(this, "Select Output Folder");
    if (dir.isEmpty()) return;

    m_exportTarget = dir;
    log(QString("Saving classes to folder %1 ...").arg(dir));
    startTask(TaskKind::ExportToDirectory, dir);
}

void MainWindow::saveToZip() {
    if (m_store.size() == 0) {
        QMessageBox::warning(this, "Warning", "No decompiled classes to save");
        return;
    }

    QString defaultName = m_archivePath.isEmpty()
        ? QString("decompiled.zip")
        : QFileInfo(m_archivePath).dir().filePath(QFileInfo(m_archivePath).completeBaseName() + "_decompiled.zip");

    QString path = QFileDialog::getSaveFileName(this, "Save as ZIP", defaultName,
        "ZIP archives (*.zip);;All files (*)");
    if (path.isEmpty()) return;

    m_exportTarget = path;
    log(QString("Saving classes to ZIP %1 ...").arg(path));
    startTask(TaskKind::ExportToArchive, path);
}

void MainWindow::cancelTask() {
    m_pipeline->requestCancel();
    log("Cancel requested.");
}

// ── Background task events ────────────────────────────────────────

void MainWindow::startTask(TaskKind kind, const QString &input) {
    // A refused run would replace the channel of the task still running.
    if (m_pipeline->isBusy() || m_channel) {
        log("Another task is still running.");
        return;
    }
    setUiBusy(true);
    m_progress->setRange(0, kind == TaskKind::DecompileArchive ? 0 : 100);
    m_progress->setValue(0);
    m_channel = m_pipeline->run(kind, input);
    drainTaskEvents();
}

void MainWindow::drainTaskEvents() {
    if (!m_channel) return;

    TaskEvent event;
    while (m_channel->tryTake(event)) {
        if (!event.isOutcome()) {
            onTaskProgress(event.progress);
            continue;
        }
        TaskKind kind = m_channel->kind();
        m_channel.reset();
        onTaskFinished(kind, event.outcome);
        break;
    }
}

void MainWindow::onTaskProgress(const ProgressEvent &event) {
    if (event.isIndeterminate()) {
        m_progress->setRange(0, 0);
        log(event.message);
    } else {
        m_progress->setRange(0, event.total);
        m_progress->setValue(event.completed);
    }
    m_statusLabel->setText(event.message);
}

void MainWindow::onTaskFinished(TaskKind kind, const TaskOutcome &outcome) {
    setUiBusy(false);

    if (kind == TaskKind::DecompileArchive) {
        // On failure the store still holds whatever was decompiled before it.
        m_tree = outcome.tree ? outcome.tree : NamespaceTreePtr(buildNamespaceTree(m_store.allNames()));
        populateClassTree();
    }

    if (!outcome.success) {
        log("ERROR: " + outcome.reason);
        m_statusLabel->setText("Error — see log.");
        QString what = kind == TaskKind::DecompileArchive ? "Error decompiling archive"
                     : kind == TaskKind::ExportToArchive  ? "Error saving ZIP"
                                                          : "Error saving classes";
        QMessageBox::critical(this, "Error", QString("%1: %2").arg(what, outcome.reason));
        return;
    }

    if (kind == TaskKind::DecompileArchive) {
        log(QString("Decompiled %1 class(es).").arg(m_store.size()));
        m_statusLabel->setText(QString("File: %1 | %2 class(es)")
            .arg(QFileInfo(m_archivePath).fileName()).arg(m_store.size()));
    } else {
        log(QString("Saved all classes to %1").arg(m_exportTarget));
        m_statusLabel->setText("Saved all classes to " + QFileInfo(m_exportTarget).absoluteFilePath());
        QMessageBox::information(this, "Success", "All classes saved successfully!");
    }
}

// ── Settings ──────────────────────────────────────────────────────

void MainWindow::chooseDecompiler() {
    QString path = QFileDialog::getOpenFileName(this, "Select Fernflower decompiler jar",
        QFileInfo(m_config.decompilerJar).absolutePath(), "Java archives (*.jar);;All files (*)");
    if (path.isEmpty()) return;

    m_config.decompilerJar = path;
    QSettings settings;
    m_config.save(settings);
    // Classes already loaded keep re-rendering through the engine that produced them.
    m_pipeline->setEngineFactory(fernflowerEngineFactory(m_config.javaExecutable, m_config.decompilerJar));
    log(QString("Decompiler set to %1; used from the next archive on.").arg(path));
}

// ── Source view helpers ───────────────────────────────────────────

void MainWindow::goToLine() {
    bool ok;
    int line = QInputDialog::getInt(this, "Go to line",
        QString("Line (1-%1):").arg(m_sourceView->lineCount()),
        m_sourceView->cursorLine(), 1, qMax(1, m_sourceView->lineCount()), 1, &ok);
    if (!ok) return;
    m_sourceView->goToLine(line);
}

void MainWindow::findText() {
    bool ok;
    QString text = QInputDialog::getText(this, "Find",
        "Text to find:", QLineEdit::Normal, "", &ok);
    if (!ok || text.isEmpty()) return;

    int found = m_sourceView->find(text);
    if (found < 0) {
        log(QString("Not found: %1").arg(text));
        return;
    }
    log(QString("Found at line %1").arg(m_sourceView->cursorLine()));
}

// ── Misc ──────────────────────────────────────────────────────────

void MainWindow::setUiBusy(bool busy) {
    const bool hasClasses = m_store.size() > 0;
    m_btnOpen->setEnabled(!busy);
    m_btnDecompiler->setEnabled(!busy);
    m_btnSaveFolder->setEnabled(!busy && hasClasses);
    m_btnSaveZip->setEnabled(!busy && hasClasses);
    m_btnCancel->setEnabled(busy);
    m_classTree->setEnabled(!busy);
    m_progress->setVisible(busy);
}

void MainWindow::log(const QString &msg) {
    m_logView->append(QString("[%1] %2")
        .arg(QTime::currentTime().toString("HH:mm:ss"))
        .arg(msg));
}

void MainWindow::closeEvent(QCloseEvent *event) {
    if (m_pipeline->isBusy()) {
        auto reply = QMessageBox::question(this, "Task running",
            "A decompile or export is still running. Quit when it stops?",
            QMessageBox::Yes | QMessageBox::No);
        if (reply != QMessageBox::Yes) { event->ignore(); return; }
        m_pipeline->requestCancel();
    }
    QSettings settings;
    m_config.save(settings);
    event->accept();
}
