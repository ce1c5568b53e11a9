#pragma once

#include <QString>

#include "marksync/sync/Reconciler.hpp"

namespace marksync {
namespace core {

struct FileReport
{
    QString filePath;
    int tasks = 0;
    int created = 0;
    int updated = 0;
    int missing = 0;
    int errors = 0;
    bool ioFailed = false;

    bool failed() const { return errors > 0 || ioFailed; }
};

// Reconciles every task line of one file, then rewrites the file once with
// all line replacements.
class FileSynchronizer
{
public:
    FileSynchronizer(sync::Reconciler &reconciler, sync::SyncDirection direction, QString vaultPath = QString());

    FileReport synchronize(const QString &filePath);

private:
    sync::Reconciler &m_reconciler;
    sync::SyncDirection m_direction;
    QString m_vaultPath;
};

} // namespace core
} // namespace marksync
