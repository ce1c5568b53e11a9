#include "marksync/data/TaskStore.hpp"

namespace marksync {
namespace data {

QUuid TaskStore::generateId()
{
    return QUuid::createUuid();
}

StoreTask TaskStore::createTask(const QUuid &id, StoreOperations &operations)
{
    StoreOperation operation;
    operation.kind = StoreOperation::Kind::Create;
    operation.taskId = id;
    operation.timestamp = QDateTime::currentDateTimeUtc();
    operations.push_back(std::move(operation));
    return StoreTask(id);
}

QString TaskStore::errorString() const
{
    return m_errorString;
}

void TaskStore::setErrorString(const QString &message)
{
    m_errorString = message;
}

} // namespace data
} // namespace marksync
