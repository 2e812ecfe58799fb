#include <QApplication>
#include <QCommandLineParser>
#include <QMessageBox>
#include <QPalette>
#include <QStyleFactory>
#include <QSettings>
#include "AppConfig.h"
#include "MainWindow.h"

// Fusion with a dark palette; the source view paints its own colours on top.
static void applyDarkTheme(QApplication &app) {
    app.setStyle(QStyleFactory::create("Fusion"));

    const QColor text(215, 215, 215);
    const QColor muted(120, 120, 120);
    QPalette p;
    p.setColor(QPalette::Window,          QColor(43, 43, 43));
    p.setColor(QPalette::WindowText,      text);
    p.setColor(QPalette::Base,            QColor(30, 31, 34));
    p.setColor(QPalette::AlternateBase,   QColor(49, 51, 53));
    p.setColor(QPalette::Text,            text);
    p.setColor(QPalette::Button,          QColor(60, 63, 65));
    p.setColor(QPalette::ButtonText,      text);
    p.setColor(QPalette::ToolTipBase,     QColor(60, 63, 65));
    p.setColor(QPalette::ToolTipText,     text);
    p.setColor(QPalette::Highlight,       QColor(33, 66, 131));
    p.setColor(QPalette::HighlightedText, Qt::white);
    p.setColor(QPalette::Link,            QColor(88, 157, 246));
    p.setColor(QPalette::Disabled, QPalette::Text,       muted);
    p.setColor(QPalette::Disabled, QPalette::ButtonText, muted);
    p.setColor(QPalette::Disabled, QPalette::WindowText, muted);
    app.setPalette(p);
}

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("ClassLens");
    app.setApplicationVersion("1.0");
    app.setOrganizationName("classlens");
    applyDarkTheme(app);

    QCommandLineParser parser;
    parser.setApplicationDescription("Browse and export decompiled Java archives.");
    parser.addHelpOption();
    parser.addVersionOption();
    AppConfig::addCommandLineOptions(parser);
    parser.process(app);

    AppConfig config;
    QSettings settings;
    config.load(settings);

    QString err;
    if (!config.applyCommandLine(parser, err)) {
        QMessageBox::critical(nullptr, "ClassLens", err);
        return 1;
    }

    MainWindow w(config);
    w.show();

    // Support opening an archive from the command line
    if (!config.openOnStartup.isEmpty()) {
        QMetaObject::invokeMethod(&w, "openArchive",
            Qt::QueuedConnection,
            Q_ARG(QString, config.openOnStartup));
    }

    return app.exec();
}
