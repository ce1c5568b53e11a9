#include "marksync/core/Config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

#include "marksync/core/Logging.hpp"

namespace marksync {
namespace core {

namespace {
constexpr auto CONFIG_DIRECTORY = "marksync";
constexpr auto CONFIG_FILE_NAME = "config.ini";
constexpr auto DEFAULT_TASK_PATH = "~/.task";

constexpr auto KEY_VAULT_PATH = "vault_path";
constexpr auto KEY_TASK_PATH = "task_path";
constexpr auto KEY_TIMEZONE = "timezone";
} // namespace

ConfigLoader::ConfigLoader() = default;

std::optional<SyncConfig> ConfigLoader::load(const QStringList &arguments)
{
    m_helpRequested = false;
    m_versionRequested = false;
    m_errorString.clear();

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Synchronizes checkbox task lines in markdown files with a task store."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption(QStringLiteral("version"), QStringLiteral("Displays version information."));
    const QCommandLineOption vaultOption({ QStringLiteral("v"), QStringLiteral("vault") },
                                         QStringLiteral("Vault directory scanned for markdown files."),
                                         QStringLiteral("dir"));
    const QCommandLineOption fileOption({ QStringLiteral("f"), QStringLiteral("file") },
                                        QStringLiteral("Single markdown file to synchronize."), QStringLiteral("file"));
    const QCommandLineOption taskDbOption({ QStringLiteral("t"), QStringLiteral("task-db") },
                                          QStringLiteral("Task store directory."), QStringLiteral("dir"));
    const QCommandLineOption configOption({ QStringLiteral("c"), QStringLiteral("config") },
                                          QStringLiteral("Configuration file."), QStringLiteral("file"));
    const QCommandLineOption timeZoneOption(QStringLiteral("tz"), QStringLiteral("IANA time zone for dates."),
                                            QStringLiteral("zone"));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QStringLiteral("Enables debug output."));
    parser.addOptions({ versionOption, vaultOption, fileOption, taskDbOption, configOption, timeZoneOption,
                        verboseOption });
    parser.addPositionalArgument(QStringLiteral("direction"),
                                 QStringLiteral("text-to-store or store-to-text."));
    m_helpText = parser.helpText();

    if (!parser.parse(arguments)) {
        fail(parser.errorText());
        return std::nullopt;
    }
    if (parser.isSet(helpOption)) {
        m_helpRequested = true;
        return std::nullopt;
    }
    if (parser.isSet(versionOption)) {
        m_versionRequested = true;
        return std::nullopt;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        fail(QStringLiteral("Expected exactly one direction (text-to-store or store-to-text)"));
        return std::nullopt;
    }
    const auto direction = sync::directionFromName(positional.first());
    if (!direction) {
        fail(QStringLiteral("Unknown direction '%1'").arg(positional.first()));
        return std::nullopt;
    }
    if (parser.isSet(vaultOption) && parser.isSet(fileOption)) {
        fail(QStringLiteral("--vault and --file cannot be combined"));
        return std::nullopt;
    }

    const QString configPath = parser.isSet(configOption) ? parser.value(configOption) : defaultConfigPath();
    const FileSettings settings = readSettings(expandHome(configPath));

    SyncConfig config;
    config.direction = *direction;
    config.verbose = parser.isSet(verboseOption);

    const QString vaultPath = parser.isSet(vaultOption) ? parser.value(vaultOption) : settings.vaultPath;
    if (!vaultPath.isEmpty()) {
        config.vaultPath = expandHome(vaultPath);
    }
    if (parser.isSet(fileOption)) {
        config.filePath = expandHome(parser.value(fileOption));
    }
    if (config.vaultPath.isEmpty() && config.filePath.isEmpty()) {
        fail(QStringLiteral("No target: pass --vault or --file, or set %1 in %2")
                 .arg(QLatin1String(KEY_VAULT_PATH), configPath));
        return std::nullopt;
    }

    QString taskPath = parser.isSet(taskDbOption) ? parser.value(taskDbOption) : settings.taskPath;
    if (taskPath.isEmpty()) {
        taskPath = QLatin1String(DEFAULT_TASK_PATH);
    }
    config.taskPath = expandHome(taskPath);

    const QString zoneId = parser.isSet(timeZoneOption) ? parser.value(timeZoneOption) : settings.timeZone;
    if (zoneId.isEmpty()) {
        config.timeZone = defaultTimeZone();
    } else {
        config.timeZone = QTimeZone(zoneId.toUtf8());
        if (!config.timeZone.isValid()) {
            fail(QStringLiteral("Unknown time zone '%1'").arg(zoneId));
            return std::nullopt;
        }
    }
    return config;
}

bool ConfigLoader::helpRequested() const
{
    return m_helpRequested;
}

bool ConfigLoader::versionRequested() const
{
    return m_versionRequested;
}

QString ConfigLoader::helpText() const
{
    return m_helpText;
}

QString ConfigLoader::errorString() const
{
    return m_errorString;
}

FileSettings ConfigLoader::readSettings(const QString &configPath)
{
    FileSettings result;
    if (!QFileInfo::exists(configPath)) {
        qCDebug(lcApp) << "No configuration file at" << configPath;
        return result;
    }

    QSettings settings(configPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qCWarning(lcApp) << "Ignoring unreadable configuration file" << configPath;
        return result;
    }
    result.vaultPath = settings.value(QLatin1String(KEY_VAULT_PATH)).toString();
    result.taskPath = settings.value(QLatin1String(KEY_TASK_PATH)).toString();
    result.timeZone = settings.value(QLatin1String(KEY_TIMEZONE)).toString();
    return result;
}

QString ConfigLoader::defaultConfigPath()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return QDir(base).filePath(QStringLiteral("%1/%2").arg(QLatin1String(CONFIG_DIRECTORY),
                                                           QLatin1String(CONFIG_FILE_NAME)));
}

QString ConfigLoader::expandHome(const QString &path)
{
    if (path == QLatin1String("~")) {
        return QDir::homePath();
    }
    if (path.startsWith(QLatin1String("~/"))) {
        return QDir::homePath() + path.mid(1);
    }
    return path;
}

QTimeZone ConfigLoader::defaultTimeZone()
{
    const QTimeZone system = QTimeZone::systemTimeZone();
    if (system.isValid()) {
        return system;
    }
    return QTimeZone::utc();
}

void ConfigLoader::fail(const QString &message)
{
    m_errorString = message;
}

} // namespace core
} // namespace marksync
