#pragma once

#include <QString>

#include "marksync/data/Task.hpp"

namespace marksync {
namespace text {

// Canonical line for a task, without leading indentation.
QString renderTask(const data::TaskRecord &task);

QString renderAnchor(const QUuid &identifier);

} // namespace text
} // namespace marksync
