#pragma once

#include <QString>
#include <QStringList>

namespace marksync {
namespace core {

// Markdown files below root, sorted, skipping hidden files and directories.
QStringList scanVault(const QString &root);

} // namespace core
} // namespace marksync
