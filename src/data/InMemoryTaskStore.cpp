#include "marksync/data/InMemoryTaskStore.hpp"

namespace marksync {
namespace data {

InMemoryTaskStore::InMemoryTaskStore() = default;
InMemoryTaskStore::~InMemoryTaskStore() = default;

std::optional<StoreTask> InMemoryTaskStore::findById(const QUuid &id) const
{
    if (m_tasks.contains(id)) {
        return m_tasks.value(id);
    }
    return std::nullopt;
}

std::vector<QUuid> InMemoryTaskStore::allIds() const
{
    std::vector<QUuid> ids;
    ids.reserve(static_cast<size_t>(m_tasks.size()));
    for (auto it = m_tasks.constBegin(); it != m_tasks.constEnd(); ++it) {
        ids.push_back(it.key());
    }
    return ids;
}

bool InMemoryTaskStore::commit(const StoreOperations &operations)
{
    QString error;
    if (!applyOperations(m_tasks, operations, &error)) {
        setErrorString(error);
        return false;
    }
    setErrorString({});
    return true;
}

} // namespace data
} // namespace marksync
