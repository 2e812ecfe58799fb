#pragma once

#include <QString>
#include <QVariantMap>
#include <functional>
#include <memory>

// The bytecode-to-source engine. One instance decompiles one archive.
// All calls happen on the pipeline worker thread.
class DecompilerEngine {
public:
    enum class Severity { Trace, Info, Warn, Error };

    // qualifiedName is '/'-separated ("com/example/Foo")
    using ResultCallback = std::function<void(const QString &qualifiedName, const QString &source)>;
    using LogCallback    = std::function<void(Severity severity, const QString &message)>;

    virtual ~DecompilerEngine() = default;

    // Named engine toggles, passed through untouched.
    virtual void setOptions(const QVariantMap &options) = 0;

    virtual bool addSource(const QString &archivePath, QString &errorOut) = 0;

    // Runs to completion, reporting every recovered unit through onResult.
    virtual bool decompileContext(const ResultCallback &onResult,
                                  const LogCallback    &onLog,
                                  QString              &errorOut) = 0;

    // Re-renders a unit on demand. Null QString when the engine has nothing for it.
    virtual QString classContent(const QString &qualifiedName) = 0;
};

using EngineFactory = std::function<std::unique_ptr<DecompilerEngine>()>;
