#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>
#include <QVariantMap>
#include <QVector>
#include <memory>
#include "DecompilerEngine.h"

// Drives the Fernflower command-line decompiler as a child process:
//   <java> -jar <decompiler.jar> -opt=value... <archive> <output dir>
// and collects the .java sources it leaves behind, either as plain files or
// as entries of the archive it re-packs.
class FernflowerEngine : public DecompilerEngine {
public:
    struct OutputUnit {
        QString qualifiedName;  // "com/example/Foo"
        QString file;           // .java file, or the archive holding it
        QString entry;          // archive entry name, empty for plain files
    };

    FernflowerEngine(const QString &javaExecutable, const QString &decompilerJar);

    void setOptions(const QVariantMap &options) override;
    bool addSource(const QString &archivePath, QString &errorOut) override;
    bool decompileContext(const ResultCallback &onResult,
                          const LogCallback    &onLog,
                          QString              &errorOut) override;
    QString classContent(const QString &qualifiedName) override;

    // Arguments passed to the java executable for the given output folder.
    QStringList commandArguments(const QString &outputDir) const;

    static QVector<OutputUnit> listOutput(const QString &outputDir, QString &errorOut);
    static QString readOutputUnit(const OutputUnit &unit, QString &errorOut);
    // Buffer size for an archive entry, or -1 when the size is unknown or too large.
    static int entryBufferSize(quint64 size, bool sizeKnown);

private:
    bool runDecompiler(const QString &outputDir, const LogCallback &onLog, QString &errorOut);

    QString                        m_javaExecutable;
    QString                        m_decompilerJar;
    QVariantMap                    m_options;
    QStringList                    m_sources;
    std::unique_ptr<QTemporaryDir> m_outputDir;
    QHash<QString, OutputUnit>     m_units;
};

// Factory producing a fresh engine per decompile, as the pipeline expects.
EngineFactory fernflowerEngineFactory(const QString &javaExecutable, const QString &decompilerJar);
