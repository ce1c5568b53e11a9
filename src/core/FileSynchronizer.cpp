#include "marksync/core/FileSynchronizer.hpp"

#include <QStringList>
#include <QVector>

#include "marksync/core/Logging.hpp"
#include "marksync/sync/LinePatcher.hpp"
#include "marksync/text/LineParser.hpp"
#include "marksync/text/TaskRenderer.hpp"

namespace marksync {
namespace core {

namespace {
constexpr auto CHECKBOX_HINT = "- [";

// Logs "name: old -> new" with the authoritative side as the new value.
void logDifferences(const sync::SyncOutcome &outcome, sync::SyncDirection direction)
{
    const bool toStore = direction == sync::SyncDirection::TextToStore;
    for (const sync::FieldDiff &diff : outcome.differences) {
        const QString &before = toStore ? diff.storeValue : diff.textValue;
        const QString &after = toStore ? diff.textValue : diff.storeValue;
        qCInfo(lcSync).noquote() << QStringLiteral("    %1: %2 -> %3").arg(diff.name, before, after);
    }
}
} // namespace

FileSynchronizer::FileSynchronizer(sync::Reconciler &reconciler, sync::SyncDirection direction, QString vaultPath)
    : m_reconciler(reconciler)
    , m_direction(direction)
    , m_vaultPath(std::move(vaultPath))
{
}

FileReport FileSynchronizer::synchronize(const QString &filePath)
{
    FileReport report;
    report.filePath = filePath;

    sync::LinePatcher patcher(filePath);
    if (!patcher.load()) {
        report.ioFailed = true;
        return report;
    }
    const QStringList lines = patcher.lines();

    const sync::SourceLink source { filePath, m_vaultPath };
    QVector<sync::LineUpdate> updates;

    for (int index = 0; index < lines.size(); ++index) {
        const QString &line = lines.at(index);
        const auto task = text::parseLine(line);
        if (!task) {
            if (line.trimmed().startsWith(QLatin1String(CHECKBOX_HINT))) {
                qCDebug(lcText) << "Unparsed line" << index + 1 << "in" << filePath << ":" << line;
            }
            continue;
        }
        ++report.tasks;

        const sync::SyncOutcome outcome = m_reconciler.reconcile(*task, m_direction, source);
        const QString label = QStringLiteral("%1:%2").arg(filePath).arg(index + 1);
        switch (outcome.kind) {
        case sync::SyncOutcome::Kind::NoChange:
            qCDebug(lcSync).noquote() << label << sync::outcomeName(outcome.kind);
            break;
        case sync::SyncOutcome::Kind::StoreCreated:
            ++report.created;
            qCInfo(lcSync).noquote() << label << "created" << outcome.task.identifier.toString(QUuid::WithoutBraces);
            updates.append({ index, text::renderTask(outcome.task) });
            break;
        case sync::SyncOutcome::Kind::StoreUpdated:
            ++report.updated;
            qCInfo(lcSync).noquote() << label << "store updated";
            logDifferences(outcome, m_direction);
            break;
        case sync::SyncOutcome::Kind::TextUpdated:
            ++report.updated;
            qCInfo(lcSync).noquote() << label << "text updated";
            logDifferences(outcome, m_direction);
            updates.append({ index, text::renderTask(outcome.task) });
            break;
        case sync::SyncOutcome::Kind::RecordMissing:
            ++report.missing;
            qCWarning(lcSync).noquote() << label << "references missing task"
                                        << task->identifier.toString(QUuid::WithoutBraces);
            break;
        case sync::SyncOutcome::Kind::Failed:
            ++report.errors;
            qCWarning(lcSync).noquote() << label << "failed:" << outcome.errorString;
            break;
        }
    }

    if (!updates.isEmpty()) {
        if (!patcher.apply(updates)) {
            report.ioFailed = true;
        }
    }

    qCInfo(lcApp).noquote() << QStringLiteral("%1: %2 tasks, %3 created, %4 updated, %5 errors")
                                   .arg(filePath)
                                   .arg(report.tasks)
                                   .arg(report.created)
                                   .arg(report.updated)
                                   .arg(report.errors + (report.ioFailed ? 1 : 0));
    return report;
}

} // namespace core
} // namespace marksync
