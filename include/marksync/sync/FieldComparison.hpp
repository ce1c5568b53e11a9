#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QTimeZone>
#include <QVector>
#include <optional>

#include "marksync/data/StoreTask.hpp"
#include "marksync/data/Task.hpp"

namespace marksync {
namespace sync {

enum class TaskField
{
    Status,
    Description,
    Due,
    Scheduled,
    Start,
    Created,
    End,
    Tags,
    Priority,
    Project,
};

// Tag implied by the highest priority.
constexpr auto ReservedNextTag = "next";

struct FieldDiff
{
    TaskField field = TaskField::Status;
    QString name;
    QString textValue;
    QString storeValue;
};

// Empty when the text record and the store record agree on every field.
QVector<FieldDiff> compareFields(const data::TaskRecord &task, const data::StoreTask &storeTask,
                                 const QTimeZone &zone);

// Compares two text side records field by field; storeValue of each diff holds the incoming value.
QVector<FieldDiff> compareRecords(const data::TaskRecord &current, const data::TaskRecord &incoming,
                                  const QTimeZone &zone);

// Copies the text side value of one field (or of all fields) into the store record.
void writeField(TaskField field, const data::TaskRecord &task, data::StoreTask &storeTask,
                data::StoreOperations &operations, const QTimeZone &zone);
void writeAllFields(const data::TaskRecord &task, data::StoreTask &storeTask,
                    data::StoreOperations &operations, const QTimeZone &zone);

// Store tags missing from the description are appended to it as "#name" tokens,
// so the record renders to a line that parses back to itself.
data::TaskRecord taskFromStore(const data::StoreTask &storeTask, const QTimeZone &zone);

// "L", "M", "H", or empty for Normal.
QString priorityCode(data::TaskPriority priority);
data::TaskPriority priorityFromStore(const QString &code, bool hasNextTag);

// Tags as they should appear in the store, including the reserved tag for Highest.
QStringList effectiveTags(const data::TaskRecord &task);

// The date that owns the store "end" slot, selected by status.
QDate endDate(const data::TaskRecord &task);

std::optional<QDateTime> dateToInstant(const QDate &date, const QTimeZone &zone);
QDate instantToDate(const std::optional<QDateTime> &instant, const QTimeZone &zone);

} // namespace sync
} // namespace marksync
