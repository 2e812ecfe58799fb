#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMap>
#include <QTemporaryDir>
#include <zip.h>
#include "ExportWriter.h"

namespace {

QString readFile(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QString();
    return QString::fromUtf8(f.readAll());
}

// entry name -> contents, in archive order
QVector<QPair<QString, QString>> readZip(const QString &path) {
    QVector<QPair<QString, QString>> entries;
    int errorCode = 0;
    zip_t *archive = zip_open(QFile::encodeName(path).constData(), ZIP_RDONLY, &errorCode);
    if (!archive) return entries;

    zip_int64_t n = zip_get_num_entries(archive, 0);
    for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(n); ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(archive, i, 0, &st) != 0) continue;
        QByteArray data(static_cast<int>(st.size), '\0');
        zip_file_t *zf = zip_fopen_index(archive, i, 0);
        if (!zf) continue;
        if (st.size > 0) zip_fread(zf, data.data(), st.size);
        zip_fclose(zf);
        entries.append({QString::fromUtf8(st.name), QString::fromUtf8(data)});
    }
    zip_discard(archive);
    return entries;
}

} // namespace

TEST(ExportWriterTest, EntryPathAppendsExtension) {
    EXPECT_EQ(exportEntryPath("com/example/Foo"), "com/example/Foo.java");
    EXPECT_EQ(exportEntryPath("Main"), "Main.java");
}

TEST(ExportWriterTest, DirectoryRoundTrip) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString root = tmp.filePath("out");

    QMap<QString, QString> units = {
        {"com/example/Foo", "package com.example;\nclass Foo {}\n"},
        {"com/example/sub/Bar", "package com.example.sub;\nclass Bar { String s = \"ü€\"; }\n"},
        {"Main", "class Main {}"},
        {"Empty", ""},
    };

    DirectoryExportWriter writer(root);
    QString err;
    ASSERT_TRUE(writer.open(err)) << err.toStdString();
    for (auto it = units.constBegin(); it != units.constEnd(); ++it)
        ASSERT_TRUE(writer.write(it.key(), it.value(), err)) << err.toStdString();
    ASSERT_TRUE(writer.close(err));

    for (auto it = units.constBegin(); it != units.constEnd(); ++it) {
        const QString path = QDir(root).filePath(exportEntryPath(it.key()));
        ASSERT_TRUE(QFileInfo::exists(path)) << path.toStdString();
        EXPECT_EQ(readFile(path), it.value());
    }
}

TEST(ExportWriterTest, DirectoryOverwritesExistingFile) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    DirectoryExportWriter writer(tmp.path());
    QString err;
    ASSERT_TRUE(writer.open(err));
    ASSERT_TRUE(writer.write("p/A", "a much longer first version of the file", err));
    ASSERT_TRUE(writer.write("p/A", "short", err));
    EXPECT_EQ(readFile(tmp.filePath("p/A.java")), "short");
}

TEST(ExportWriterTest, DirectoryFailsWhenPackagePathIsAFile) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    QFile blocker(tmp.filePath("p"));
    ASSERT_TRUE(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    DirectoryExportWriter writer(tmp.path());
    QString err;
    ASSERT_TRUE(writer.open(err));
    EXPECT_FALSE(writer.write("p/A", "class A {}", err));
    EXPECT_FALSE(err.isEmpty());
}

TEST(ExportWriterTest, ArchiveHoldsOneEntryPerNameInOrder) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString zipPath = tmp.filePath("nested/out_decompiled.zip");

    ArchiveExportWriter writer(zipPath);
    QString err;
    ASSERT_TRUE(writer.open(err)) << err.toStdString();
    ASSERT_TRUE(writer.write("a/A", "class A {}", err)) << err.toStdString();
    ASSERT_TRUE(writer.write("a/b/B", "class B {}", err)) << err.toStdString();
    ASSERT_TRUE(writer.write("Empty", "", err)) << err.toStdString();
    ASSERT_TRUE(writer.close(err)) << err.toStdString();

    const auto entries = readZip(zipPath);
    ASSERT_EQ(entries.size(), 3);
    EXPECT_EQ(entries[0].first, "a/A.java");
    EXPECT_EQ(entries[0].second, "class A {}");
    EXPECT_EQ(entries[1].first, "a/b/B.java");
    EXPECT_EQ(entries[1].second, "class B {}");
    EXPECT_EQ(entries[2].first, "Empty.java");
    EXPECT_TRUE(entries[2].second.isEmpty());
}

TEST(ExportWriterTest, ArchiveWriteBeforeOpenFails) {
    QTemporaryDir tmp;
    ArchiveExportWriter writer(tmp.filePath("x.zip"));
    QString err;
    EXPECT_FALSE(writer.write("A", "class A {}", err));
    EXPECT_FALSE(err.isEmpty());
}

TEST(ExportWriterTest, ArchiveEntriesReachDiskBeforeClose) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString zipPath = tmp.filePath("out.zip");

    ArchiveExportWriter writer(zipPath);
    QString err;
    ASSERT_TRUE(writer.open(err)) << err.toStdString();

    ASSERT_TRUE(writer.write("a/A", "class A { int x; }", err)) << err.toStdString();
    const qint64 afterFirst = QFileInfo(zipPath).size();
    EXPECT_GT(afterFirst, 0);

    ASSERT_TRUE(writer.write("a/B", "class B { int y; }", err)) << err.toStdString();
    const qint64 afterSecond = QFileInfo(zipPath).size();
    EXPECT_GT(afterSecond, afterFirst);

    ASSERT_TRUE(writer.close(err)) << err.toStdString();
    EXPECT_GT(QFileInfo(zipPath).size(), afterSecond);
    EXPECT_EQ(readZip(zipPath).size(), 2);
}

TEST(ExportWriterTest, ArchiveWriteFailureIsReportedForThatEntry) {
    if (!QFileInfo::exists("/dev/full")) GTEST_SKIP() << "no /dev/full";

    ArchiveExportWriter writer("/dev/full");
    QString err;
    ASSERT_TRUE(writer.open(err)) << err.toStdString();
    EXPECT_FALSE(writer.write("a/A", "class A {}", err));
    EXPECT_TRUE(err.contains("a/A.java")) << err.toStdString();

    QString closeErr;
    EXPECT_FALSE(writer.close(closeErr));
}
