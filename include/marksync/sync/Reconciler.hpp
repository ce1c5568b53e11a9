#pragma once

#include <QString>
#include <QTimeZone>
#include <QUuid>
#include <QVector>
#include <optional>

#include "marksync/data/Task.hpp"
#include "marksync/sync/FieldComparison.hpp"

namespace marksync {
namespace data {
class TaskStore;
}

namespace sync {

enum class SyncDirection
{
    TextToStore,
    StoreToText,
};

QString directionName(SyncDirection direction);
std::optional<SyncDirection> directionFromName(const QString &name);

// Where a task line came from; used for the creation back-link.
struct SourceLink
{
    QString filePath;
    QString vaultPath;
};

// Empty unless both a file and a vault root are known.
QString backlinkAnnotation(const SourceLink &source);

struct SyncOutcome
{
    enum class Kind
    {
        NoChange,
        StoreUpdated,
        TextUpdated,
        StoreCreated,
        RecordMissing,
        Failed,
    };

    Kind kind = Kind::NoChange;
    // For TextUpdated the corrected record, for StoreCreated the input with its new identifier.
    data::TaskRecord task;
    QVector<FieldDiff> differences;
    QString errorString;
};

QString outcomeName(SyncOutcome::Kind kind);

class Reconciler
{
public:
    Reconciler(data::TaskStore &store, QTimeZone zone);

    SyncOutcome reconcile(const data::TaskRecord &task, SyncDirection direction,
                          const SourceLink &source = SourceLink());

    QTimeZone timeZone() const;

private:
    SyncOutcome createInStore(const data::TaskRecord &task, const SourceLink &source);
    SyncOutcome pushToStore(const data::TaskRecord &task);
    SyncOutcome pullFromStore(const data::TaskRecord &task);

    data::TaskStore &m_store;
    QTimeZone m_zone;
};

} // namespace sync
} // namespace marksync
