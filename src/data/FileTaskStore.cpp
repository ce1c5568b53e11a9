#include "marksync/data/FileTaskStore.hpp"

namespace marksync {
namespace data {

FileTaskStore::FileTaskStore(std::shared_ptr<FileTaskStorage> storage)
    : m_storage(std::move(storage))
{
}

std::optional<StoreTask> FileTaskStore::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &tasks = m_storage->tasks();
    if (tasks.contains(id)) {
        return tasks.value(id);
    }
    return std::nullopt;
}

std::vector<QUuid> FileTaskStore::allIds() const
{
    std::vector<QUuid> ids;
    if (!m_storage) {
        return ids;
    }
    const auto &tasks = m_storage->tasks();
    ids.reserve(static_cast<size_t>(tasks.size()));
    for (auto it = tasks.constBegin(); it != tasks.constEnd(); ++it) {
        ids.push_back(it.key());
    }
    return ids;
}

bool FileTaskStore::commit(const StoreOperations &operations)
{
    if (!m_storage) {
        setErrorString(QStringLiteral("Task store is not open"));
        return false;
    }
    if (operations.empty()) {
        return true;
    }

    QHash<QUuid, StoreTask> tasks = m_storage->tasks();
    QString error;
    if (!applyOperations(tasks, operations, &error)) {
        setErrorString(error);
        return false;
    }
    if (!m_storage->replaceTasks(std::move(tasks))) {
        setErrorString(m_storage->errorString());
        return false;
    }
    setErrorString({});
    return true;
}

} // namespace data
} // namespace marksync
