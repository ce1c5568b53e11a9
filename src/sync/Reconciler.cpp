#include "marksync/sync/Reconciler.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include "marksync/core/Logging.hpp"
#include "marksync/data/TaskStore.hpp"

namespace marksync {
namespace sync {

namespace {
constexpr auto TEXT_TO_STORE = "text-to-store";
constexpr auto STORE_TO_TEXT = "store-to-text";
constexpr auto BACKLINK_FORMAT = "obsidian://open?vault=%1&file=%2";

QString idString(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

SyncOutcome failed(const QString &message)
{
    SyncOutcome outcome;
    outcome.kind = SyncOutcome::Kind::Failed;
    outcome.errorString = message;
    return outcome;
}
} // namespace

QString directionName(SyncDirection direction)
{
    return direction == SyncDirection::TextToStore ? QLatin1String(TEXT_TO_STORE) : QLatin1String(STORE_TO_TEXT);
}

std::optional<SyncDirection> directionFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String(TEXT_TO_STORE)) {
        return SyncDirection::TextToStore;
    }
    if (normalized == QLatin1String(STORE_TO_TEXT)) {
        return SyncDirection::StoreToText;
    }
    return std::nullopt;
}

QString backlinkAnnotation(const SourceLink &source)
{
    if (source.filePath.isEmpty() || source.vaultPath.isEmpty()) {
        return QString();
    }
    const QString vaultName = QFileInfo(QDir::cleanPath(source.vaultPath)).fileName();
    const QString fileStem = QFileInfo(source.filePath).completeBaseName();
    if (vaultName.isEmpty() || fileStem.isEmpty()) {
        return QString();
    }
    return QString::fromLatin1(BACKLINK_FORMAT).arg(vaultName, fileStem);
}

QString outcomeName(SyncOutcome::Kind kind)
{
    switch (kind) {
    case SyncOutcome::Kind::StoreUpdated:
        return QStringLiteral("store updated");
    case SyncOutcome::Kind::TextUpdated:
        return QStringLiteral("text updated");
    case SyncOutcome::Kind::StoreCreated:
        return QStringLiteral("store created");
    case SyncOutcome::Kind::RecordMissing:
        return QStringLiteral("record missing");
    case SyncOutcome::Kind::Failed:
        return QStringLiteral("failed");
    case SyncOutcome::Kind::NoChange:
    default:
        return QStringLiteral("no change");
    }
}

Reconciler::Reconciler(data::TaskStore &store, QTimeZone zone)
    : m_store(store)
    , m_zone(std::move(zone))
{
}

SyncOutcome Reconciler::reconcile(const data::TaskRecord &task, SyncDirection direction, const SourceLink &source)
{
    if (direction == SyncDirection::StoreToText) {
        return pullFromStore(task);
    }
    if (task.identifier.isNull()) {
        return createInStore(task, source);
    }
    return pushToStore(task);
}

QTimeZone Reconciler::timeZone() const
{
    return m_zone;
}

SyncOutcome Reconciler::createInStore(const data::TaskRecord &task, const SourceLink &source)
{
    data::TaskRecord created = task;
    created.identifier = m_store.generateId();

    data::StoreOperations operations;
    data::StoreTask storeTask = m_store.createTask(created.identifier, operations);
    writeAllFields(created, storeTask, operations, m_zone);

    const QString annotation = backlinkAnnotation(source);
    if (!annotation.isEmpty()) {
        storeTask.addAnnotation(QDateTime::currentDateTimeUtc(), annotation, operations);
    }

    if (!m_store.commit(operations)) {
        qCWarning(lcSync) << "Failed to create task" << idString(created.identifier) << ":" << m_store.errorString();
        return failed(m_store.errorString());
    }
    qCDebug(lcSync) << "Created task" << idString(created.identifier) << "with" << operations.size() << "operations";

    SyncOutcome outcome;
    outcome.kind = SyncOutcome::Kind::StoreCreated;
    outcome.task = created;
    return outcome;
}

SyncOutcome Reconciler::pushToStore(const data::TaskRecord &task)
{
    auto storeTask = m_store.findById(task.identifier);
    if (!storeTask) {
        SyncOutcome outcome;
        outcome.kind = SyncOutcome::Kind::RecordMissing;
        outcome.task = task;
        return outcome;
    }

    SyncOutcome outcome;
    outcome.task = task;
    outcome.differences = compareFields(task, *storeTask, m_zone);
    if (outcome.differences.isEmpty()) {
        return outcome;
    }

    data::StoreOperations operations;
    for (const FieldDiff &diff : outcome.differences) {
        writeField(diff.field, task, *storeTask, operations, m_zone);
    }
    if (operations.empty()) {
        return outcome;
    }
    if (!m_store.commit(operations)) {
        qCWarning(lcSync) << "Failed to update task" << idString(task.identifier) << ":" << m_store.errorString();
        SyncOutcome failure = failed(m_store.errorString());
        failure.task = task;
        failure.differences = outcome.differences;
        return failure;
    }
    outcome.kind = SyncOutcome::Kind::StoreUpdated;
    return outcome;
}

SyncOutcome Reconciler::pullFromStore(const data::TaskRecord &task)
{
    SyncOutcome outcome;
    outcome.task = task;
    if (task.identifier.isNull()) {
        return outcome;
    }

    const auto storeTask = m_store.findById(task.identifier);
    if (!storeTask) {
        outcome.kind = SyncOutcome::Kind::RecordMissing;
        return outcome;
    }

    const data::TaskRecord incoming = taskFromStore(*storeTask, m_zone);
    outcome.differences = compareRecords(task, incoming, m_zone);
    if (outcome.differences.isEmpty()) {
        return outcome;
    }
    outcome.kind = SyncOutcome::Kind::TextUpdated;
    outcome.task = incoming;
    return outcome;
}

} // namespace sync
} // namespace marksync
