#include "FernflowerEngine.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <zip.h>
#include <limits>

static constexpr int  LOG_TAIL_LINES  = 10;
static constexpr int  READ_POLL_MS    = 250;
static const QString  JAVA_SUFFIX     = ".java";

FernflowerEngine::FernflowerEngine(const QString &javaExecutable, const QString &decompilerJar)
    : m_javaExecutable(javaExecutable)
    , m_decompilerJar(decompilerJar) {}

void FernflowerEngine::setOptions(const QVariantMap &options) {
    m_options = options;
}

bool FernflowerEngine::addSource(const QString &archivePath, QString &errorOut) {
    if (m_decompilerJar.isEmpty()) {
        errorOut = "No decompiler configured. Set the decompiler jar with --decompiler or in the settings.";
        return false;
    }
    if (!QFileInfo(m_decompilerJar).isFile()) {
        errorOut = QString("Decompiler not found: %1").arg(m_decompilerJar);
        return false;
    }
    QFileInfo source(archivePath);
    if (!source.exists() || !source.isReadable()) {
        errorOut = QString("Cannot open file: %1").arg(archivePath);
        return false;
    }
    m_sources.append(source.absoluteFilePath());
    return true;
}

QStringList FernflowerEngine::commandArguments(const QString &outputDir) const {
    QStringList args{"-jar", m_decompilerJar};
    for (auto it = m_options.constBegin(); it != m_options.constEnd(); ++it)
        args << QString("-%1=%2").arg(it.key(), it.value().toString());
    args << m_sources << outputDir;
    return args;
}

bool FernflowerEngine::runDecompiler(const QString &outputDir, const LogCallback &onLog, QString &errorOut) {
    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start(m_javaExecutable, commandArguments(outputDir));
    if (!proc.waitForStarted()) {
        errorOut = QString("Cannot start %1: %2").arg(m_javaExecutable, proc.errorString());
        return false;
    }

    QStringList tail;
    auto handleLine = [&](const QByteArray &raw) {
        const QString line = QString::fromLocal8Bit(raw).trimmed();
        if (line.isEmpty()) return;
        tail.append(line);
        if (tail.size() > LOG_TAIL_LINES) tail.removeFirst();

        if (line.startsWith("ERROR:"))
            onLog(Severity::Error, line.mid(6).trimmed());
        else if (line.startsWith("WARN:"))
            onLog(Severity::Warn, line.mid(5).trimmed());
        else if (line.startsWith("INFO:"))
            onLog(Severity::Info, line.mid(5).trimmed());
        else
            onLog(Severity::Trace, line);
    };

    while (proc.state() != QProcess::NotRunning) {
        proc.waitForReadyRead(READ_POLL_MS);
        while (proc.canReadLine()) handleLine(proc.readLine());
    }
    for (const QByteArray &raw : proc.readAll().split('\n')) handleLine(raw);

    if (proc.exitStatus() != QProcess::NormalExit) {
        errorOut = QString("Decompiler process crashed: %1").arg(proc.errorString());
        return false;
    }
    if (proc.exitCode() != 0) {
        errorOut = QString("Decompiler exited with code %1").arg(proc.exitCode());
        if (!tail.isEmpty()) errorOut += ":\n" + tail.join('\n');
        return false;
    }
    return true;
}

bool FernflowerEngine::decompileContext(const ResultCallback &onResult,
                                        const LogCallback    &onLog,
                                        QString              &errorOut) {
    if (m_sources.isEmpty()) {
        errorOut = "No archive to decompile";
        return false;
    }

    m_outputDir = std::make_unique<QTemporaryDir>();
    if (!m_outputDir->isValid()) {
        errorOut = QString("Cannot create temporary folder: %1").arg(m_outputDir->errorString());
        return false;
    }

    qDebug() << "[Engine]" << m_javaExecutable << commandArguments(m_outputDir->path());
    if (!runDecompiler(m_outputDir->path(), onLog, errorOut))
        return false;

    QString listErr;
    const QVector<OutputUnit> units = listOutput(m_outputDir->path(), listErr);
    if (!listErr.isEmpty()) {
        errorOut = listErr;
        return false;
    }

    m_units.clear();
    for (const OutputUnit &unit : units) {
        m_units.insert(unit.qualifiedName, unit);
        QString readErr;
        QString text = readOutputUnit(unit, readErr);
        if (!readErr.isEmpty())
            onLog(Severity::Warn, readErr);
        onResult(unit.qualifiedName, text);
    }
    qDebug() << "[Engine] Collected" << units.size() << "source file(s)";
    return true;
}

QString FernflowerEngine::classContent(const QString &qualifiedName) {
    auto it = m_units.constFind(qualifiedName);
    if (it == m_units.constEnd()) return QString();

    QString err;
    QString text = readOutputUnit(it.value(), err);
    if (!err.isEmpty()) qWarning() << "[Engine]" << err;
    return text;
}

// ── Output scanning ───────────────────────────────────────────────

// A null QString means "no content"; an empty source file is still content.
static QString nonNull(const QString &text) {
    return text.isNull() ? QString("") : text;
}

static bool listArchive(const QString &archivePath, QVector<FernflowerEngine::OutputUnit> &out, QString &errorOut) {
    int errorCode = 0;
    zip_t *archive = zip_open(QFile::encodeName(archivePath).constData(), ZIP_RDONLY, &errorCode);
    if (!archive) {
        zip_error_t error;
        zip_error_init_with_code(&error, errorCode);
        errorOut = QString("Cannot open decompiler output %1: %2")
                       .arg(archivePath, QString::fromLocal8Bit(zip_error_strerror(&error)));
        zip_error_fini(&error);
        return false;
    }

    zip_int64_t numEntries = zip_get_num_entries(archive, 0);
    for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(numEntries); ++i) {
        const char *rawName = zip_get_name(archive, i, 0);
        if (!rawName) continue;
        const QString entry = QString::fromUtf8(rawName);
        if (!entry.endsWith(JAVA_SUFFIX)) continue;

        FernflowerEngine::OutputUnit unit;
        unit.qualifiedName = entry.chopped(JAVA_SUFFIX.size());
        unit.file          = archivePath;
        unit.entry         = entry;
        out.append(unit);
    }

    zip_discard(archive);
    return true;
}

QVector<FernflowerEngine::OutputUnit> FernflowerEngine::listOutput(const QString &outputDir, QString &errorOut) {
    QVector<OutputUnit> units;
    const QDir root(outputDir);

    QDirIterator it(outputDir, QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const QString suffix = QFileInfo(path).suffix().toLower();

        if (suffix == "java") {
            OutputUnit unit;
            unit.qualifiedName = root.relativeFilePath(path).chopped(JAVA_SUFFIX.size());
            unit.file          = path;
            units.append(unit);
        } else if (suffix == "jar" || suffix == "zip") {
            if (!listArchive(path, units, errorOut)) return {};
        }
    }
    return units;
}

QString FernflowerEngine::readOutputUnit(const OutputUnit &unit, QString &errorOut) {
    if (unit.entry.isEmpty()) {
        QFile f(unit.file);
        if (!f.open(QIODevice::ReadOnly)) {
            errorOut = QString("Cannot read %1: %2").arg(unit.file, f.errorString());
            return QString();
        }
        return nonNull(QString::fromUtf8(f.readAll()));
    }

    int errorCode = 0;
    zip_t *archive = zip_open(QFile::encodeName(unit.file).constData(), ZIP_RDONLY, &errorCode);
    if (!archive) {
        errorOut = QString("Cannot open %1 (libzip error %2)").arg(unit.file).arg(errorCode);
        return QString();
    }

    const QByteArray entryName = unit.entry.toUtf8();
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(archive, entryName.constData(), 0, &st) != 0) {
        errorOut = QString("Entry not found: %1").arg(unit.entry);
        zip_discard(archive);
        return QString();
    }

    const int size = entryBufferSize(st.size, (st.valid & ZIP_STAT_SIZE) != 0);
    if (size < 0) {
        errorOut = QString("Entry too large or of unknown size: %1").arg(unit.entry);
        zip_discard(archive);
        return QString();
    }

    zip_file_t *zf = zip_fopen(archive, entryName.constData(), 0);
    if (!zf) {
        errorOut = QString("Cannot open entry %1: %2")
                       .arg(unit.entry, QString::fromLocal8Bit(zip_strerror(archive)));
        zip_discard(archive);
        return QString();
    }

    QByteArray data(size, '\0');
    zip_int64_t got = data.isEmpty() ? 0 : zip_fread(zf, data.data(), st.size);
    zip_fclose(zf);
    zip_discard(archive);

    if (got < 0 || static_cast<zip_uint64_t>(got) != st.size) {
        errorOut = QString("Short read of entry %1").arg(unit.entry);
        return QString();
    }
    return nonNull(QString::fromUtf8(data));
}

int FernflowerEngine::entryBufferSize(quint64 size, bool sizeKnown) {
    if (!sizeKnown || size > static_cast<quint64>(std::numeric_limits<int>::max()))
        return -1;
    return static_cast<int>(size);
}

EngineFactory fernflowerEngineFactory(const QString &javaExecutable, const QString &decompilerJar) {
    return [javaExecutable, decompilerJar]() -> std::unique_ptr<DecompilerEngine> {
        return std::make_unique<FernflowerEngine>(javaExecutable, decompilerJar);
    };
}
