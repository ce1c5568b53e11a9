#pragma once

#include "marksync/data/StoreTask.hpp"
#include "marksync/data/Task.hpp"

namespace marksync {
namespace sync {

data::StoreStatus toStoreStatus(data::TaskStatus status);
// Total: store statuses without a checkbox counterpart map to Pending.
data::TaskStatus fromStoreStatus(data::StoreStatus status);

} // namespace sync
} // namespace marksync
