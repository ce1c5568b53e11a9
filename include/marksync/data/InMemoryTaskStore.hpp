#pragma once

#include <QHash>

#include "marksync/data/TaskStore.hpp"

namespace marksync {
namespace data {

class InMemoryTaskStore : public TaskStore
{
public:
    InMemoryTaskStore();
    ~InMemoryTaskStore() override;

    std::optional<StoreTask> findById(const QUuid &id) const override;
    std::vector<QUuid> allIds() const override;
    bool commit(const StoreOperations &operations) override;

private:
    QHash<QUuid, StoreTask> m_tasks;
};

} // namespace data
} // namespace marksync
