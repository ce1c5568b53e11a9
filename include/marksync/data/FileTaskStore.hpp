#pragma once

#include "marksync/data/FileTaskStorage.hpp"
#include "marksync/data/TaskStore.hpp"

#include <memory>

namespace marksync {
namespace data {

class FileTaskStore : public TaskStore
{
public:
    explicit FileTaskStore(std::shared_ptr<FileTaskStorage> storage);
    ~FileTaskStore() override = default;

    std::optional<StoreTask> findById(const QUuid &id) const override;
    std::vector<QUuid> allIds() const override;
    bool commit(const StoreOperations &operations) override;

private:
    std::shared_ptr<FileTaskStorage> m_storage;
};

} // namespace data
} // namespace marksync
