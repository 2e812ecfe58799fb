#pragma once

#include <QString>
#include <QStringList>
#include <QVariantMap>

class QCommandLineParser;
class QSettings;

// Decompiler location and the option map handed to the engine.
struct AppConfig {
    QString     javaExecutable = "java";
    QString     decompilerJar;
    QVariantMap engineOptions  = defaultEngineOptions();
    QString     openOnStartup;      // archive given on the command line

    static QVariantMap defaultEngineOptions();

    void load(QSettings &settings);
    void save(QSettings &settings) const;

    // Adds --java, --decompiler, --option and the positional archive.
    static void addCommandLineOptions(QCommandLineParser &parser);
    // Applies what the user passed. Returns false on a malformed --option.
    bool applyCommandLine(const QCommandLineParser &parser, QString &errorOut);
};
