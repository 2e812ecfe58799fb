#pragma once

#include <QString>

struct archive;

// "pkg/sub/Name" -> "pkg/sub/Name.java", used for both files and zip entries
QString exportEntryPath(const QString &qualifiedName);

// Serializes decompiled units to an export target.
// Every call reports failure through its return value and `errorOut`.
class ExportWriter {
public:
    virtual ~ExportWriter() = default;

    virtual QString target() const = 0;
    virtual bool open(QString &errorOut) = 0;
    virtual bool write(const QString &qualifiedName, const QString &text, QString &errorOut) = 0;
    virtual bool close(QString &errorOut) = 0;
};

// One .java file per unit under a root directory; package segments become folders.
class DirectoryExportWriter : public ExportWriter {
public:
    explicit DirectoryExportWriter(const QString &rootDir);

    QString target() const override { return m_rootDir; }
    bool open(QString &errorOut) override;
    bool write(const QString &qualifiedName, const QString &text, QString &errorOut) override;
    bool close(QString &errorOut) override;

private:
    QString m_rootDir;
};

// One zip entry per unit, streamed to disk: each entry is complete before the
// next one starts, and close() appends the central directory.
class ArchiveExportWriter : public ExportWriter {
public:
    explicit ArchiveExportWriter(const QString &archivePath);
    ~ArchiveExportWriter() override;

    ArchiveExportWriter(const ArchiveExportWriter &) = delete;
    ArchiveExportWriter &operator=(const ArchiveExportWriter &) = delete;

    QString target() const override { return m_archivePath; }
    bool open(QString &errorOut) override;
    bool write(const QString &qualifiedName, const QString &text, QString &errorOut) override;
    bool close(QString &errorOut) override;

private:
    QString m_archivePath;
    archive *m_archive = nullptr;
};
