#include <QtTest/QtTest>

#include <QDir>
#include <QSettings>
#include <QTemporaryDir>

#include "marksync/core/Config.hpp"

using namespace marksync;
using namespace marksync::core;

class ConfigTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void commandLineOverridesFile();
    void fileFillsMissingOptions();
    void defaultsApply();
    void rejectsInvalidInput();
    void helpAndVersion();
    void expandsHome();

private:
    QStringList arguments(const QStringList &rest) const;

    QTemporaryDir m_dir;
    QString m_configPath;
};

void ConfigTest::initTestCase()
{
    QVERIFY(m_dir.isValid());
    m_configPath = m_dir.filePath(QStringLiteral("config.ini"));

    QSettings settings(m_configPath, QSettings::IniFormat);
    settings.setValue(QStringLiteral("vault_path"), QStringLiteral("~/myVault"));
    settings.setValue(QStringLiteral("task_path"), QStringLiteral("/data/tasks"));
    settings.setValue(QStringLiteral("timezone"), QStringLiteral("Europe/Vienna"));
    settings.sync();
    QCOMPARE(settings.status(), QSettings::NoError);
}

QStringList ConfigTest::arguments(const QStringList &rest) const
{
    return QStringList { QStringLiteral("marksync") } + rest;
}

void ConfigTest::commandLineOverridesFile()
{
    ConfigLoader loader;
    const auto config = loader.load(arguments({ QStringLiteral("store-to-text"), QStringLiteral("-c"), m_configPath,
                                                QStringLiteral("--vault"), QStringLiteral("/notes"),
                                                QStringLiteral("-t"), QStringLiteral("/other/tasks"),
                                                QStringLiteral("--tz"), QStringLiteral("America/Chicago"),
                                                QStringLiteral("--verbose") }));
    QVERIFY2(config.has_value(), qPrintable(loader.errorString()));
    QVERIFY(config->direction == sync::SyncDirection::StoreToText);
    QCOMPARE(config->vaultPath, QStringLiteral("/notes"));
    QVERIFY(config->filePath.isEmpty());
    QCOMPARE(config->taskPath, QStringLiteral("/other/tasks"));
    QCOMPARE(config->timeZone.id(), QByteArray("America/Chicago"));
    QVERIFY(config->verbose);
}

void ConfigTest::fileFillsMissingOptions()
{
    ConfigLoader loader;
    const auto config = loader.load(arguments({ QStringLiteral("text-to-store"), QStringLiteral("--config"),
                                                m_configPath, QStringLiteral("-f"), QStringLiteral("/notes/a.md") }));
    QVERIFY2(config.has_value(), qPrintable(loader.errorString()));
    QVERIFY(config->direction == sync::SyncDirection::TextToStore);
    QCOMPARE(config->filePath, QStringLiteral("/notes/a.md"));
    QCOMPARE(config->vaultPath, QDir::homePath() + QStringLiteral("/myVault"));
    QCOMPARE(config->taskPath, QStringLiteral("/data/tasks"));
    QCOMPARE(config->timeZone.id(), QByteArray("Europe/Vienna"));
    QVERIFY(!config->verbose);
}

void ConfigTest::defaultsApply()
{
    ConfigLoader loader;
    const QString absent = m_dir.filePath(QStringLiteral("absent.ini"));
    const auto config = loader.load(arguments({ QStringLiteral("text-to-store"), QStringLiteral("-c"), absent,
                                                QStringLiteral("-v"), QStringLiteral("/notes") }));
    QVERIFY2(config.has_value(), qPrintable(loader.errorString()));
    QCOMPARE(config->taskPath, QDir::homePath() + QStringLiteral("/.task"));
    QVERIFY(config->timeZone.isValid());
    QCOMPARE(config->timeZone, ConfigLoader::defaultTimeZone());
}

void ConfigTest::rejectsInvalidInput()
{
    const QString absent = m_dir.filePath(QStringLiteral("absent.ini"));
    const QList<QStringList> cases {
        { QStringLiteral("-c"), absent, QStringLiteral("-v"), QStringLiteral("/notes") },
        { QStringLiteral("sideways"), QStringLiteral("-c"), absent, QStringLiteral("-v"), QStringLiteral("/notes") },
        { QStringLiteral("text-to-store"), QStringLiteral("-c"), absent },
        { QStringLiteral("text-to-store"), QStringLiteral("-c"), absent, QStringLiteral("-v"), QStringLiteral("/notes"),
          QStringLiteral("-f"), QStringLiteral("/notes/a.md") },
        { QStringLiteral("text-to-store"), QStringLiteral("-c"), absent, QStringLiteral("-v"), QStringLiteral("/notes"),
          QStringLiteral("--tz"), QStringLiteral("Mars/Olympus_Mons") },
        { QStringLiteral("text-to-store"), QStringLiteral("--unknown-option") },
    };
    for (const QStringList &rest : cases) {
        ConfigLoader loader;
        QVERIFY2(!loader.load(arguments(rest)).has_value(), qPrintable(rest.join(QLatin1Char(' '))));
        QVERIFY(!loader.errorString().isEmpty());
        QVERIFY(!loader.helpRequested());
    }
}

void ConfigTest::helpAndVersion()
{
    ConfigLoader help;
    QVERIFY(!help.load(arguments({ QStringLiteral("--help") })).has_value());
    QVERIFY(help.helpRequested());
    QVERIFY(help.errorString().isEmpty());
    QVERIFY(help.helpText().contains(QStringLiteral("--task-db")));

    ConfigLoader version;
    QVERIFY(!version.load(arguments({ QStringLiteral("--version") })).has_value());
    QVERIFY(version.versionRequested());
}

void ConfigTest::expandsHome()
{
    QCOMPARE(ConfigLoader::expandHome(QStringLiteral("~")), QDir::homePath());
    QCOMPARE(ConfigLoader::expandHome(QStringLiteral("~/.task")), QDir::homePath() + QStringLiteral("/.task"));
    QCOMPARE(ConfigLoader::expandHome(QStringLiteral("/abs/~/x")), QStringLiteral("/abs/~/x"));
    QVERIFY(ConfigLoader::defaultConfigPath().endsWith(QStringLiteral("marksync/config.ini")));
}

QTEST_GUILESS_MAIN(ConfigTest)
#include "ConfigTest.moc"
