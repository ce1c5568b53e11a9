#include "marksync/core/SyncSession.hpp"

#include <QFileInfo>

#include "marksync/core/FileSynchronizer.hpp"
#include "marksync/core/Logging.hpp"
#include "marksync/core/VaultScanner.hpp"
#include "marksync/data/StoreProvider.hpp"
#include "marksync/sync/Reconciler.hpp"

namespace marksync {
namespace core {

SyncSession::SyncSession(SyncConfig config)
    : m_config(std::move(config))
{
}

int SyncSession::run()
{
    m_summary = RunSummary();

    data::StoreProvider provider(m_config.taskPath);
    if (!provider.open()) {
        qCCritical(lcApp).noquote() << provider.errorString();
        return ExitSyncFailed;
    }

    const QStringList files = targetFiles();
    if (files.isEmpty()) {
        qCWarning(lcApp).noquote() << "No markdown files found";
    }
    qCInfo(lcApp).noquote() << QStringLiteral("%1 %2 file(s), time zone %3")
                                   .arg(sync::directionName(m_config.direction))
                                   .arg(files.size())
                                   .arg(QString::fromUtf8(m_config.timeZone.id()));

    sync::Reconciler reconciler(provider.taskStore(), m_config.timeZone);
    FileSynchronizer synchronizer(reconciler, m_config.direction, m_config.vaultPath);
    for (const QString &filePath : files) {
        const FileReport report = synchronizer.synchronize(filePath);
        ++m_summary.files;
        m_summary.tasks += report.tasks;
        m_summary.created += report.created;
        m_summary.updated += report.updated;
        if (report.failed()) {
            ++m_summary.failedFiles;
        }
    }

    qCInfo(lcApp).noquote() << QStringLiteral("Done: %1 files, %2 tasks, %3 created, %4 updated, %5 failed files")
                                   .arg(m_summary.files)
                                   .arg(m_summary.tasks)
                                   .arg(m_summary.created)
                                   .arg(m_summary.updated)
                                   .arg(m_summary.failedFiles);
    return m_summary.failedFiles > 0 ? ExitSyncFailed : ExitSuccess;
}

const RunSummary &SyncSession::summary() const
{
    return m_summary;
}

QStringList SyncSession::targetFiles() const
{
    if (!m_config.filePath.isEmpty()) {
        return { QFileInfo(m_config.filePath).absoluteFilePath() };
    }
    return scanVault(m_config.vaultPath);
}

} // namespace core
} // namespace marksync
