#include "marksync/data/Task.hpp"

namespace marksync {
namespace data {

bool operator==(const TaskRecord &lhs, const TaskRecord &rhs)
{
    return lhs.identifier == rhs.identifier
        && lhs.status == rhs.status
        && lhs.description == rhs.description
        && sameTagSet(lhs.tags, rhs.tags)
        && lhs.due == rhs.due
        && lhs.scheduled == rhs.scheduled
        && lhs.start == rhs.start
        && lhs.created == rhs.created
        && lhs.done == rhs.done
        && lhs.canceled == rhs.canceled
        && lhs.priority == rhs.priority
        && lhs.project == rhs.project;
}

bool operator!=(const TaskRecord &lhs, const TaskRecord &rhs)
{
    return !(lhs == rhs);
}

bool sameTagSet(const QStringList &lhs, const QStringList &rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const QString &tag : lhs) {
        if (!rhs.contains(tag)) {
            return false;
        }
    }
    for (const QString &tag : rhs) {
        if (!lhs.contains(tag)) {
            return false;
        }
    }
    return true;
}

QString statusName(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Complete:
        return QStringLiteral("complete");
    case TaskStatus::Canceled:
        return QStringLiteral("canceled");
    case TaskStatus::Pending:
    default:
        return QStringLiteral("pending");
    }
}

} // namespace data
} // namespace marksync
