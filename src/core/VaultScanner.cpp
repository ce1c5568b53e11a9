#include "marksync/core/VaultScanner.hpp"

#include <QDir>
#include <algorithm>

namespace marksync {
namespace core {

namespace {
constexpr auto MARKDOWN_PATTERN = "*.md";

void collect(const QDir &directory, QStringList &files)
{
    const QFileInfoList entries = directory.entryInfoList({ QLatin1String(MARKDOWN_PATTERN) },
                                                          QDir::Files | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo &entry : entries) {
        files << entry.absoluteFilePath();
    }

    const QFileInfoList subdirectories = directory.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo &subdirectory : subdirectories) {
        if (subdirectory.isSymLink()) {
            continue;
        }
        collect(QDir(subdirectory.absoluteFilePath()), files);
    }
}
} // namespace

QStringList scanVault(const QString &root)
{
    QStringList files;
    const QDir directory(root);
    if (!directory.exists()) {
        return files;
    }
    collect(directory, files);
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace core
} // namespace marksync
