#include "ExportWriter.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDateTime>
#include <archive.h>
#include <archive_entry.h>

static const char *SOURCE_EXTENSION = ".java";

// Qualified names are already '/'-separated, which is the separator both QDir
// and zip entries use.
QString exportEntryPath(const QString &qualifiedName) {
    return qualifiedName + SOURCE_EXTENSION;
}

// ── Directory ─────────────────────────────────────────────────────

DirectoryExportWriter::DirectoryExportWriter(const QString &rootDir) : m_rootDir(rootDir) {}

bool DirectoryExportWriter::open(QString &errorOut) {
    if (!QDir().mkpath(m_rootDir)) {
        errorOut = QString("Cannot create output folder: %1").arg(m_rootDir);
        return false;
    }
    return true;
}

bool DirectoryExportWriter::write(const QString &qualifiedName, const QString &text, QString &errorOut) {
    const QString filePath = QDir(m_rootDir).filePath(exportEntryPath(qualifiedName));
    const QString parentDir = QFileInfo(filePath).absolutePath();

    if (!QDir().mkpath(parentDir)) {
        errorOut = QString("Cannot create directory: %1").arg(parentDir);
        return false;
    }

    QFile f(filePath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        errorOut = QString("Cannot write to: %1 (%2)").arg(filePath, f.errorString());
        return false;
    }
    const QByteArray data = text.toUtf8();
    if (f.write(data) != data.size()) {
        errorOut = QString("Short write to: %1 (%2)").arg(filePath, f.errorString());
        return false;
    }
    f.close();
    return true;
}

bool DirectoryExportWriter::close(QString &) {
    return true;
}

// ── Zip archive ───────────────────────────────────────────────────

ArchiveExportWriter::ArchiveExportWriter(const QString &archivePath) : m_archivePath(archivePath) {}

ArchiveExportWriter::~ArchiveExportWriter() {
    if (m_archive) archive_write_free(m_archive);
}

static QString archiveError(archive *a) {
    const char *msg = archive_error_string(a);
    return msg ? QString::fromLocal8Bit(msg) : QString("unknown error");
}

bool ArchiveExportWriter::open(QString &errorOut) {
    const QString parentDir = QFileInfo(m_archivePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        errorOut = QString("Cannot create directory: %1").arg(parentDir);
        return false;
    }

    m_archive = archive_write_new();
    if (!m_archive) {
        errorOut = QString("Cannot create archive %1: out of memory").arg(m_archivePath);
        return false;
    }

    // No output blocking: every entry goes to the file as soon as it is finished.
    if (archive_write_set_format_zip(m_archive) != ARCHIVE_OK
        || archive_write_set_bytes_per_block(m_archive, 0) != ARCHIVE_OK
        || archive_write_open_filename(m_archive, QFile::encodeName(m_archivePath).constData()) != ARCHIVE_OK) {
        errorOut = QString("Cannot create archive %1: %2").arg(m_archivePath, archiveError(m_archive));
        archive_write_free(m_archive);
        m_archive = nullptr;
        return false;
    }
    return true;
}

bool ArchiveExportWriter::write(const QString &qualifiedName, const QString &text, QString &errorOut) {
    if (!m_archive) {
        errorOut = "Archive is not open";
        return false;
    }

    const QByteArray data = text.toUtf8();
    const QString entryName = exportEntryPath(qualifiedName);

    archive_entry *entry = archive_entry_new();
    archive_entry_set_pathname_utf8(entry, entryName.toUtf8().constData());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_size(entry, data.size());
    archive_entry_set_mtime(entry, QDateTime::currentSecsSinceEpoch(), 0);

    int status = archive_write_header(m_archive, entry);
    archive_entry_free(entry);
    if (status < ARCHIVE_WARN) {
        errorOut = QString("Cannot add entry %1: %2").arg(entryName, archiveError(m_archive));
        return false;
    }
    if (status == ARCHIVE_WARN)
        qWarning() << "[Export]" << entryName << archiveError(m_archive);

    if (!data.isEmpty()) {
        la_ssize_t written = archive_write_data(m_archive, data.constData(), data.size());
        if (written != data.size()) {
            errorOut = QString("Cannot write entry %1: %2").arg(entryName, archiveError(m_archive));
            return false;
        }
    }

    if (archive_write_finish_entry(m_archive) < ARCHIVE_WARN) {
        errorOut = QString("Cannot write entry %1: %2").arg(entryName, archiveError(m_archive));
        return false;
    }
    return true;
}

bool ArchiveExportWriter::close(QString &errorOut) {
    if (!m_archive) return true;

    const bool closed = archive_write_close(m_archive) >= ARCHIVE_WARN;
    if (!closed)
        errorOut = QString("Cannot finalize archive %1: %2").arg(m_archivePath, archiveError(m_archive));
    archive_write_free(m_archive);
    m_archive = nullptr;

    if (closed) qDebug() << "[Export] Archive written:" << m_archivePath;
    return closed;
}
