#include "AppConfig.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QSettings>

QVariantMap AppConfig::defaultEngineOptions() {
    return {
        {"ind", "   "},   // indentation
        {"din", "1"},     // decompile inner classes
        {"dgs", "1"},     // decompile generic signatures
        {"hes", "1"},     // hide empty super()
        {"hdc", "1"},     // hide empty default constructor
    };
}

void AppConfig::load(QSettings &settings) {
    javaExecutable = settings.value("engine/java", javaExecutable).toString();
    decompilerJar  = settings.value("engine/decompiler", decompilerJar).toString();

    settings.beginGroup("engineOptions");
    const QStringList keys = settings.childKeys();
    for (const QString &key : keys)
        engineOptions.insert(key, settings.value(key));
    settings.endGroup();
}

void AppConfig::save(QSettings &settings) const {
    settings.setValue("engine/java", javaExecutable);
    settings.setValue("engine/decompiler", decompilerJar);

    settings.beginGroup("engineOptions");
    settings.remove("");
    for (auto it = engineOptions.constBegin(); it != engineOptions.constEnd(); ++it)
        settings.setValue(it.key(), it.value());
    settings.endGroup();
}

void AppConfig::addCommandLineOptions(QCommandLineParser &parser) {
    parser.addOption(QCommandLineOption("java",
        "Java executable used to run the decompiler.", "path"));
    parser.addOption(QCommandLineOption("decompiler",
        "Path to the Fernflower decompiler jar.", "jar"));
    parser.addOption(QCommandLineOption(QStringList{"o", "option"},
        "Decompiler option, repeatable (e.g. -o rsy=1).", "key=value"));
    parser.addPositionalArgument("archive", "Archive to decompile on start-up.", "[archive]");
}

bool AppConfig::applyCommandLine(const QCommandLineParser &parser, QString &errorOut) {
    if (parser.isSet("java"))       javaExecutable = parser.value("java");
    if (parser.isSet("decompiler")) decompilerJar  = parser.value("decompiler");

    for (const QString &opt : parser.values("option")) {
        const int eq = opt.indexOf('=');
        if (eq <= 0) {
            errorOut = QString("Invalid decompiler option '%1', expected key=value").arg(opt);
            return false;
        }
        engineOptions.insert(opt.left(eq), opt.mid(eq + 1));
    }

    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty()) openOnStartup = positional.first();
    return true;
}
