#include <gtest/gtest.h>
#include <QCommandLineParser>
#include <QSettings>
#include <QTemporaryDir>
#include "AppConfig.h"

namespace {

bool parse(QCommandLineParser &parser, const QStringList &args) {
    AppConfig::addCommandLineOptions(parser);
    return parser.parse(QStringList{"classlens"} + args);
}

} // namespace

TEST(AppConfigTest, Defaults) {
    AppConfig config;
    EXPECT_EQ(config.javaExecutable, "java");
    EXPECT_TRUE(config.decompilerJar.isEmpty());
    EXPECT_TRUE(config.openOnStartup.isEmpty());
    EXPECT_EQ(config.engineOptions.value("ind").toString(), "   ");
    EXPECT_EQ(config.engineOptions.value("din").toString(), "1");
    EXPECT_EQ(config.engineOptions.value("dgs").toString(), "1");
}

TEST(AppConfigTest, CommandLineOverrides) {
    QCommandLineParser parser;
    ASSERT_TRUE(parse(parser, {"--java", "/usr/lib/jvm/bin/java",
                               "--decompiler", "/opt/ff.jar",
                               "-o", "rsy=1", "--option", "ind=\t",
                               "app.jar"}));

    AppConfig config;
    QString err;
    ASSERT_TRUE(config.applyCommandLine(parser, err)) << err.toStdString();
    EXPECT_EQ(config.javaExecutable, "/usr/lib/jvm/bin/java");
    EXPECT_EQ(config.decompilerJar, "/opt/ff.jar");
    EXPECT_EQ(config.engineOptions.value("rsy").toString(), "1");
    EXPECT_EQ(config.engineOptions.value("ind").toString(), "\t");
    EXPECT_EQ(config.engineOptions.value("din").toString(), "1");
    EXPECT_EQ(config.openOnStartup, "app.jar");
}

TEST(AppConfigTest, OptionValueMayContainEquals) {
    QCommandLineParser parser;
    ASSERT_TRUE(parse(parser, {"-o", "ban=a=b"}));
    AppConfig config;
    QString err;
    ASSERT_TRUE(config.applyCommandLine(parser, err));
    EXPECT_EQ(config.engineOptions.value("ban").toString(), "a=b");
}

TEST(AppConfigTest, MalformedOptionIsRejected) {
    QCommandLineParser parser;
    ASSERT_TRUE(parse(parser, {"-o", "=1"}));
    AppConfig config;
    QString err;
    EXPECT_FALSE(config.applyCommandLine(parser, err));
    EXPECT_EQ(err, "Invalid decompiler option '=1', expected key=value");

    QCommandLineParser second;
    ASSERT_TRUE(parse(second, {"-o", "noequals"}));
    EXPECT_FALSE(config.applyCommandLine(second, err));
}

TEST(AppConfigTest, SettingsRoundTrip) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString path = tmp.filePath("classlens.ini");

    AppConfig saved;
    saved.javaExecutable = "/opt/java/bin/java";
    saved.decompilerJar  = "/opt/ff.jar";
    saved.engineOptions  = {{"rsy", "1"}, {"ind", "  "}};
    {
        QSettings settings(path, QSettings::IniFormat);
        saved.save(settings);
        settings.sync();
        ASSERT_EQ(settings.status(), QSettings::NoError);
    }

    AppConfig loaded;
    QSettings settings(path, QSettings::IniFormat);
    loaded.load(settings);
    EXPECT_EQ(loaded.javaExecutable, "/opt/java/bin/java");
    EXPECT_EQ(loaded.decompilerJar, "/opt/ff.jar");
    EXPECT_EQ(loaded.engineOptions.value("rsy").toString(), "1");
    EXPECT_EQ(loaded.engineOptions.value("ind").toString(), "  ");
    // defaults not overridden by the file are kept
    EXPECT_EQ(loaded.engineOptions.value("din").toString(), "1");
}

TEST(AppConfigTest, EmptySettingsKeepDefaults) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    QSettings settings(tmp.filePath("empty.ini"), QSettings::IniFormat);
    AppConfig config;
    config.load(settings);
    EXPECT_EQ(config.javaExecutable, "java");
    EXPECT_EQ(config.engineOptions, AppConfig::defaultEngineOptions());
}
