#include "marksync/sync/StatusMapping.hpp"

#include <array>

namespace marksync {
namespace sync {

namespace {
struct StatusPair
{
    data::TaskStatus task;
    data::StoreStatus store;
};

// Bidirectional pairs first, then store-only statuses.
constexpr std::array<StatusPair, 3> StatusTable = { {
    { data::TaskStatus::Pending, data::StoreStatus::Pending },
    { data::TaskStatus::Complete, data::StoreStatus::Completed },
    { data::TaskStatus::Canceled, data::StoreStatus::Deleted },
} };

constexpr std::array<StatusPair, 2> StoreOnlyTable = { {
    { data::TaskStatus::Pending, data::StoreStatus::Recurring },
    { data::TaskStatus::Pending, data::StoreStatus::Unknown },
} };
} // namespace

data::StoreStatus toStoreStatus(data::TaskStatus status)
{
    for (const auto &pair : StatusTable) {
        if (pair.task == status) {
            return pair.store;
        }
    }
    return data::StoreStatus::Pending;
}

data::TaskStatus fromStoreStatus(data::StoreStatus status)
{
    for (const auto &pair : StatusTable) {
        if (pair.store == status) {
            return pair.task;
        }
    }
    for (const auto &pair : StoreOnlyTable) {
        if (pair.store == status) {
            return pair.task;
        }
    }
    return data::TaskStatus::Pending;
}

} // namespace sync
} // namespace marksync
