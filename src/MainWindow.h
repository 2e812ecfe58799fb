#pragma once

#include <QMainWindow>
#include <QLabel>
#include <QPushButton>
#include <QTreeWidget>
#include <QSplitter>
#include <QTextEdit>
#include <QProgressBar>
#include "AppConfig.h"
#include "NamespaceTree.h"
#include "ResultStore.h"
#include "SourceView.h"
#include "TaskChannel.h"
#include "TaskPipeline.h"

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(const AppConfig &config, QWidget *parent = nullptr);
    ~MainWindow();

public slots:
    void openArchive(const QString &path);

protected:
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dropEvent(QDropEvent *event) override;
    void closeEvent(QCloseEvent *event) override;

private slots:
    void openFile();
    void saveToFolder();
    void saveToZip();
    void cancelTask();
    void chooseDecompiler();
    void onClassSelected();
    void drainTaskEvents();
    void goToLine();
    void findText();

private:
    void createPipeline();
    void startTask(TaskKind kind, const QString &input);
    void onTaskProgress(const ProgressEvent &event);
    void onTaskFinished(TaskKind kind, const TaskOutcome &outcome);
    void populateClassTree();
    void addTreeItems(QTreeWidgetItem *parentItem, const PackageNode &package);
    void setUiBusy(bool busy);
    void log(const QString &msg);

    // Data
    AppConfig        m_config;
    ResultStore      m_store;
    NamespaceTreePtr m_tree;
    QString          m_archivePath;
    QString          m_exportTarget;

    // Background work
    TaskPipeline    *m_pipeline = nullptr;
    TaskChannelPtr   m_channel;

    // UI
    QSplitter    *m_splitter    = nullptr;
    QTreeWidget  *m_classTree   = nullptr;
    SourceView   *m_sourceView  = nullptr;
    QTextEdit    *m_logView     = nullptr;
    QLabel       *m_statusLabel = nullptr;
    QProgressBar *m_progress    = nullptr;

    QPushButton  *m_btnOpen       = nullptr;
    QPushButton  *m_btnSaveFolder = nullptr;
    QPushButton  *m_btnSaveZip    = nullptr;
    QPushButton  *m_btnCancel     = nullptr;
    QPushButton  *m_btnDecompiler = nullptr;
    QPushButton  *m_btnGoTo       = nullptr;
    QPushButton  *m_btnFind       = nullptr;
};
