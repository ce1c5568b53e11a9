#include "marksync/sync/FieldComparison.hpp"

#include <QTime>
#include <QVariant>
#include <array>

#include "marksync/sync/StatusMapping.hpp"
#include "marksync/text/LineParser.hpp"

namespace marksync {
namespace sync {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

using data::StoreOperations;
using data::StoreTask;
using data::TaskRecord;

struct FieldSpec
{
    TaskField field;
    const char *name;
    QVariant (*textValue)(const TaskRecord &, const QTimeZone &);
    QVariant (*storeValue)(const StoreTask &, const QTimeZone &);
    bool (*equal)(const QVariant &, const QVariant &);
    void (*write)(const TaskRecord &, StoreTask &, StoreOperations &, const QTimeZone &);
    void (*read)(const StoreTask &, TaskRecord &, const QTimeZone &);
};

QVariant dateValue(const QDate &date)
{
    return date.isValid() ? QVariant(date) : QVariant();
}

QVariant storeDateValue(const StoreTask &storeTask, const char *name, const QTimeZone &zone)
{
    return dateValue(instantToDate(storeTask.timestamp(QLatin1String(name)), zone));
}

void writeDate(StoreTask &storeTask, const char *name, const QDate &date, StoreOperations &operations,
               const QTimeZone &zone)
{
    storeTask.setTimestamp(QLatin1String(name), dateToInstant(date, zone), operations);
}

QDate readDate(const StoreTask &storeTask, const char *name, const QTimeZone &zone)
{
    return instantToDate(storeTask.timestamp(QLatin1String(name)), zone);
}

bool variantsEqual(const QVariant &lhs, const QVariant &rhs)
{
    return lhs == rhs;
}

bool tagSetsEqual(const QVariant &lhs, const QVariant &rhs)
{
    return data::sameTagSet(lhs.toStringList(), rhs.toStringList());
}

// Text side is [code] or [code, next]; the reserved tag only matters for Highest.
bool prioritiesEqual(const QVariant &lhs, const QVariant &rhs)
{
    const QStringList text = lhs.toStringList();
    const QStringList store = rhs.toStringList();
    if (text.isEmpty() || store.isEmpty() || text.first() != store.first()) {
        return false;
    }
    return text.size() < 2 || store.size() >= 2;
}

bool storeHasHighestPriority(const StoreTask &storeTask)
{
    return storeTask.priority() == QLatin1String("H") && storeTask.hasTag(QLatin1String(ReservedNextTag));
}

const std::array<FieldSpec, 10> &fieldTable()
{
    // Status precedes End: reading "end" back depends on the status.
    static const std::array<FieldSpec, 10> table = { {
        { TaskField::Status, "status",
          [](const TaskRecord &task, const QTimeZone &) {
              return QVariant(data::statusName(task.status));
          },
          [](const StoreTask &storeTask, const QTimeZone &) {
              return QVariant(data::statusName(fromStoreStatus(storeTask.status())));
          },
          variantsEqual,
          [](const TaskRecord &task, StoreTask &storeTask, StoreOperations &operations, const QTimeZone &) {
              storeTask.setStatus(toStoreStatus(task.status), operations);
          },
          [](const StoreTask &storeTask, TaskRecord &task, const QTimeZone &) {
              task.status = fromStoreStatus(storeTask.status());
          } },
        { TaskField::Description, "description",
          [](const TaskRecord &task, const QTimeZone &) { return QVariant(task.description); },
          [](const StoreTask &storeTask, const QTimeZone &) { return QVariant(storeTask.description()); },
          variantsEqual,
          [](const TaskRecord &task, StoreTask &storeTask, StoreOperations &operations, const QTimeZone &) {
              storeTask.setDescription(task.description, operations);
          },
          [](const StoreTask &storeTask, TaskRecord &task, const QTimeZone &) {
              task.description = storeTask.description().trimmed();
          } },
        { TaskField::Due, "due",
          [](const TaskRecord &task, const QTimeZone &) { return dateValue(task.due); },
          [](const StoreTask &storeTask, const QTimeZone &zone) {
              return storeDateValue(storeTask, data::property::Due, zone);
          },
          variantsEqual,
          [](const TaskRecord &task, StoreTask &storeTask, StoreOperations &operations, const QTimeZone &zone) {
              writeDate(storeTask, data::property::Due, task.due, operations, zone);
          },
          [](const StoreTask &storeTask, TaskRecord &task, const QTimeZone &zone) {
              task.due = readDate(storeTask, data::property::Due, zone);
          } },
        { TaskField::Scheduled, "scheduled",
          [](const TaskRecord &task, const QTimeZone &) { return dateValue(task.scheduled); },
          [](const StoreTask &storeTask, const QTimeZone &zone) {
              return storeDateValue(storeTask, data::property::Scheduled, zone);
          },
          variantsEqual,
          [](const TaskRecord &task, StoreTask &storeTask, StoreOperations &operations, const QTimeZone &zone) {
              writeDate(storeTask, data::property::Scheduled, task.scheduled, operations, zone);
          },
          [](const StoreTask &storeTask, TaskRecord &task, const QTimeZone &zone) {
              task.scheduled = readDate(storeTask, data::property::Scheduled, zone);
          } },
        { TaskField::Start, "start",
          [](const TaskRecord &task, const QTimeZone &) { return dateValue(task.start); },
          [](const StoreTask &storeTask, const QTimeZone &zone) {
              return storeDateValue(storeTask, data::property::Wait, zone);
          },
          variantsEqual,
          [](const TaskRecord &task, StoreTask &storeTask, StoreOperations &operations, const QTimeZone &zone) {
              writeDate(storeTask, data::property::Wait, task.start, operations, zone);
          },
          [](const StoreTask &storeTask, TaskRecord &task, const QTimeZone &zone) {
              task.start = readDate(storeTask, data::property::Wait, zone);
          } },
        { TaskField::Created, "created",
          [](const TaskRecord &task, const QTimeZone &) { return dateValue(task.created); },
          [](const StoreTask &storeTask, const QTimeZone &zone) {
              return storeDateValue(storeTask, data::property::Created, zone);
          },
          variantsEqual,
          [](const TaskRecord &task, StoreTask &storeTask, StoreOperations &operations, const QTimeZone &zone) {
              writeDate(storeTask, data::property::Created, task.created, operations, zone);
          },
          [](const StoreTask &storeTask, TaskRecord &task, const QTimeZone &zone) {
              task.created = readDate(storeTask, data::property::Created, zone);
          } },
        { TaskField::End, "end",
          [](const TaskRecord &task, const QTimeZone &) { return dateValue(endDate(task)); },
          [](const StoreTask &storeTask, const QTimeZone &zone) {
              return storeDateValue(storeTask, data::property::End, zone);
          },
          variantsEqual,
          [](const TaskRecord &task, StoreTask &storeTask, StoreOperations &operations, const QTimeZone &zone) {
              writeDate(storeTask, data::property::End, endDate(task), operations, zone);
          },
          [](const StoreTask &storeTask, TaskRecord &task, const QTimeZone &zone) {
              const QDate end = readDate(storeTask, data::property::End, zone);
              if (task.status == data::TaskStatus::Complete) {
                  task.done = end;
              } else if (task.status == data::TaskStatus::Canceled) {
                  task.canceled = end;
              }
          } },
        { TaskField::Tags, "tags",
          [](const TaskRecord &task, const QTimeZone &) { return QVariant(effectiveTags(task)); },
          [](const StoreTask &storeTask, const QTimeZone &) { return QVariant(storeTask.tags()); },
          tagSetsEqual,
          [](const TaskRecord &task, StoreTask &storeTask, StoreOperations &operations, const QTimeZone &) {
              const QStringList wanted = effectiveTags(task);
              for (const QString &tag : storeTask.tags()) {
                  if (!wanted.contains(tag)) {
                      storeTask.setTag(tag, false, operations);
                  }
              }
              for (const QString &tag : wanted) {
                  storeTask.setTag(tag, true, operations);
              }
          },
          [](const StoreTask &storeTask, TaskRecord &task, const QTimeZone &) {
              QStringList tags = storeTask.tags();
              if (storeHasHighestPriority(storeTask)) {
                  tags.removeAll(QLatin1String(ReservedNextTag));
              }
              task.tags = tags;
          } },
        { TaskField::Priority, "priority",
          [](const TaskRecord &task, const QTimeZone &) {
              QStringList value { priorityCode(task.priority) };
              if (task.priority == data::TaskPriority::Highest) {
                  value << QLatin1String(ReservedNextTag);
              }
              return QVariant(value);
          },
          [](const StoreTask &storeTask, const QTimeZone &) {
              QStringList value { storeTask.priority() };
              if (storeTask.hasTag(QLatin1String(ReservedNextTag))) {
                  value << QLatin1String(ReservedNextTag);
              }
              return QVariant(value);
          },
          prioritiesEqual,
          [](const TaskRecord &task, StoreTask &storeTask, StoreOperations &operations, const QTimeZone &) {
              const QString code = priorityCode(task.priority);
              storeTask.setValue(QLatin1String(data::property::Priority),
                                 code.isEmpty() ? std::nullopt : std::optional<QString>(code), operations);
              if (task.priority == data::TaskPriority::Highest) {
                  storeTask.setTag(QLatin1String(ReservedNextTag), true, operations);
              }
          },
          [](const StoreTask &storeTask, TaskRecord &task, const QTimeZone &) {
              task.priority = priorityFromStore(storeTask.priority(),
                                                storeTask.hasTag(QLatin1String(ReservedNextTag)));
          } },
        { TaskField::Project, "project",
          [](const TaskRecord &task, const QTimeZone &) {
              return task.project ? QVariant(*task.project) : QVariant();
          },
          [](const StoreTask &storeTask, const QTimeZone &) {
              const auto project = storeTask.project();
              return project ? QVariant(*project) : QVariant();
          },
          variantsEqual,
          [](const TaskRecord &task, StoreTask &storeTask, StoreOperations &operations, const QTimeZone &) {
              storeTask.setValue(QLatin1String(data::property::Project), task.project, operations);
          },
          [](const StoreTask &storeTask, TaskRecord &task, const QTimeZone &) {
              task.project = storeTask.project();
          } },
    } };
    return table;
}

// Text lines carry tags only as "#name" tokens of the description.
void appendMissingTags(TaskRecord &task)
{
    const QStringList described = text::parseTags(task.description);
    for (const QString &tag : task.tags) {
        if (described.contains(tag)) {
            continue;
        }
        if (!task.description.isEmpty()) {
            task.description += QLatin1Char(' ');
        }
        task.description += QLatin1Char('#') + tag;
    }
    task.tags = text::parseTags(task.description);
}

QString describe(const QVariant &value)
{
    if (!value.isValid()) {
        return QStringLiteral("(none)");
    }
    if (value.userType() == QMetaType::QDate) {
        return value.toDate().toString(QLatin1String(DATE_FORMAT));
    }
    if (value.userType() == QMetaType::QStringList) {
        return QLatin1Char('[') + value.toStringList().join(QStringLiteral(", ")) + QLatin1Char(']');
    }
    return value.toString();
}
} // namespace

QVector<FieldDiff> compareFields(const data::TaskRecord &task, const data::StoreTask &storeTask,
                                 const QTimeZone &zone)
{
    QVector<FieldDiff> diffs;
    for (const FieldSpec &spec : fieldTable()) {
        const QVariant textValue = spec.textValue(task, zone);
        const QVariant storeValue = spec.storeValue(storeTask, zone);
        if (spec.equal(textValue, storeValue)) {
            continue;
        }
        FieldDiff diff;
        diff.field = spec.field;
        diff.name = QLatin1String(spec.name);
        diff.textValue = describe(textValue);
        diff.storeValue = describe(storeValue);
        diffs.append(diff);
    }
    return diffs;
}

QVector<FieldDiff> compareRecords(const data::TaskRecord &current, const data::TaskRecord &incoming,
                                  const QTimeZone &zone)
{
    QVector<FieldDiff> diffs;
    for (const FieldSpec &spec : fieldTable()) {
        const QVariant currentValue = spec.textValue(current, zone);
        const QVariant incomingValue = spec.textValue(incoming, zone);
        const bool equal = spec.field == TaskField::Tags ? tagSetsEqual(currentValue, incomingValue)
                                                         : currentValue == incomingValue;
        if (equal) {
            continue;
        }
        FieldDiff diff;
        diff.field = spec.field;
        diff.name = QLatin1String(spec.name);
        diff.textValue = describe(currentValue);
        diff.storeValue = describe(incomingValue);
        diffs.append(diff);
    }
    return diffs;
}

void writeField(TaskField field, const data::TaskRecord &task, data::StoreTask &storeTask,
                data::StoreOperations &operations, const QTimeZone &zone)
{
    for (const FieldSpec &spec : fieldTable()) {
        if (spec.field == field) {
            spec.write(task, storeTask, operations, zone);
            return;
        }
    }
}

void writeAllFields(const data::TaskRecord &task, data::StoreTask &storeTask,
                    data::StoreOperations &operations, const QTimeZone &zone)
{
    for (const FieldSpec &spec : fieldTable()) {
        spec.write(task, storeTask, operations, zone);
    }
}

data::TaskRecord taskFromStore(const data::StoreTask &storeTask, const QTimeZone &zone)
{
    data::TaskRecord task;
    task.identifier = storeTask.id();
    for (const FieldSpec &spec : fieldTable()) {
        spec.read(storeTask, task, zone);
    }
    appendMissingTags(task);
    return task;
}

QString priorityCode(data::TaskPriority priority)
{
    switch (priority) {
    case data::TaskPriority::Lowest:
    case data::TaskPriority::Low:
        return QStringLiteral("L");
    case data::TaskPriority::Medium:
        return QStringLiteral("M");
    case data::TaskPriority::High:
    case data::TaskPriority::Highest:
        return QStringLiteral("H");
    case data::TaskPriority::Normal:
    default:
        return QString("");
    }
}

data::TaskPriority priorityFromStore(const QString &code, bool hasNextTag)
{
    if (code == QLatin1String("H")) {
        return hasNextTag ? data::TaskPriority::Highest : data::TaskPriority::High;
    }
    if (code == QLatin1String("M")) {
        return data::TaskPriority::Medium;
    }
    if (code == QLatin1String("L")) {
        return data::TaskPriority::Low;
    }
    return data::TaskPriority::Normal;
}

QStringList effectiveTags(const data::TaskRecord &task)
{
    QStringList tags = task.tags;
    if (task.priority == data::TaskPriority::Highest && !tags.contains(QLatin1String(ReservedNextTag))) {
        tags << QLatin1String(ReservedNextTag);
    }
    return tags;
}

QDate endDate(const data::TaskRecord &task)
{
    switch (task.status) {
    case data::TaskStatus::Complete:
        return task.done;
    case data::TaskStatus::Canceled:
        return task.canceled;
    case data::TaskStatus::Pending:
    default:
        return {};
    }
}

std::optional<QDateTime> dateToInstant(const QDate &date, const QTimeZone &zone)
{
    if (!date.isValid()) {
        return std::nullopt;
    }
    return QDateTime(date, QTime(0, 0), zone).toUTC();
}

QDate instantToDate(const std::optional<QDateTime> &instant, const QTimeZone &zone)
{
    if (!instant || !instant->isValid()) {
        return {};
    }
    return instant->toTimeZone(zone).date();
}

} // namespace sync
} // namespace marksync
