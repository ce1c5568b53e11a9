#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <optional>

namespace marksync {
namespace data {

enum class TaskStatus
{
    Pending,
    Complete,
    Canceled,
};

enum class TaskPriority
{
    Lowest,
    Low,
    Normal,
    Medium,
    High,
    Highest,
};

// One task line. A null identifier means the task was never synchronized,
// an invalid date means the field is absent.
struct TaskRecord
{
    QUuid identifier;
    TaskStatus status = TaskStatus::Pending;
    QString description;
    QStringList tags;
    QDate due;
    QDate scheduled;
    QDate start;
    QDate created;
    QDate done;
    QDate canceled;
    TaskPriority priority = TaskPriority::Normal;
    std::optional<QString> project;
};

bool operator==(const TaskRecord &lhs, const TaskRecord &rhs);
bool operator!=(const TaskRecord &lhs, const TaskRecord &rhs);

bool sameTagSet(const QStringList &lhs, const QStringList &rhs);

QString statusName(TaskStatus status);

} // namespace data
} // namespace marksync
