#pragma once

#include <QString>
#include <QUuid>
#include <optional>
#include <vector>

#include "marksync/data/StoreTask.hpp"

namespace marksync {
namespace data {

class TaskStore
{
public:
    virtual ~TaskStore() = default;

    virtual std::optional<StoreTask> findById(const QUuid &id) const = 0;
    virtual std::vector<QUuid> allIds() const = 0;
    // Applies the whole group or nothing; errorString() explains a rejection.
    virtual bool commit(const StoreOperations &operations) = 0;
    virtual QUuid generateId();

    // Records the creation of an empty task; it exists once committed.
    StoreTask createTask(const QUuid &id, StoreOperations &operations);

    QString errorString() const;

protected:
    void setErrorString(const QString &message);

private:
    QString m_errorString;
};

} // namespace data
} // namespace marksync
