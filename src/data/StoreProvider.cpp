#include "marksync/data/StoreProvider.hpp"

#include "marksync/core/Logging.hpp"
#include "marksync/data/FileTaskStorage.hpp"
#include "marksync/data/FileTaskStore.hpp"
#include "marksync/data/TaskStore.hpp"

#include <QDir>
#include <QFileInfo>

namespace marksync {
namespace data {

namespace {
constexpr auto DATA_FILE_NAME = "tasks.data";
} // namespace

StoreProvider::StoreProvider(QString directory)
    : m_directory(std::move(directory))
{
}

StoreProvider::~StoreProvider() = default;

bool StoreProvider::open()
{
    const QFileInfo info(m_directory);
    if (!info.exists() || !info.isDir()) {
        m_errorString = QStringLiteral("Task store directory %1 does not exist").arg(m_directory);
        return false;
    }

    auto storage = std::make_shared<FileTaskStorage>(dataFilePath());
    if (!storage->load()) {
        m_errorString = storage->errorString();
        return false;
    }
    qCDebug(lcStore) << "Loaded" << storage->tasks().size() << "tasks from" << storage->filePath();

    m_storage = std::move(storage);
    m_taskStore = std::make_unique<FileTaskStore>(m_storage);
    return true;
}

bool StoreProvider::isOpen() const
{
    return m_taskStore != nullptr;
}

TaskStore &StoreProvider::taskStore()
{
    return *m_taskStore;
}

QString StoreProvider::dataFilePath() const
{
    return QDir(m_directory).filePath(QLatin1String(DATA_FILE_NAME));
}

QString StoreProvider::errorString() const
{
    return m_errorString;
}

} // namespace data
} // namespace marksync
