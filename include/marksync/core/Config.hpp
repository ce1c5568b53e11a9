#pragma once

#include <QString>
#include <QStringList>
#include <QTimeZone>
#include <optional>

#include "marksync/sync/Reconciler.hpp"

namespace marksync {
namespace core {

constexpr int ExitSuccess = 0;
constexpr int ExitSyncFailed = 1;
constexpr int ExitConfigError = 2;

struct SyncConfig
{
    sync::SyncDirection direction = sync::SyncDirection::TextToStore;
    QString vaultPath;
    QString filePath; // takes precedence over vaultPath as the target when set
    QString taskPath;
    QTimeZone timeZone;
    bool verbose = false;
};

// Values read from the configuration file; empty means "not set".
struct FileSettings
{
    QString vaultPath;
    QString taskPath;
    QString timeZone;
};

class ConfigLoader
{
public:
    ConfigLoader();

    // Resolves command line over configuration file over defaults.
    // Returns std::nullopt on a configuration error and when help or the
    // version was requested.
    std::optional<SyncConfig> load(const QStringList &arguments);

    bool helpRequested() const;
    bool versionRequested() const;
    QString helpText() const;
    QString errorString() const;

    static FileSettings readSettings(const QString &configPath);
    static QString defaultConfigPath();
    static QString expandHome(const QString &path);
    static QTimeZone defaultTimeZone();

private:
    void fail(const QString &message);

    bool m_helpRequested = false;
    bool m_versionRequested = false;
    QString m_helpText;
    QString m_errorString;
};

} // namespace core
} // namespace marksync
