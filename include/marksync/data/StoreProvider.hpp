#pragma once

#include <memory>
#include <QString>

namespace marksync {
namespace data {

class TaskStore;
class FileTaskStorage;

// Opens the file backed task store living in a store directory.
class StoreProvider
{
public:
    explicit StoreProvider(QString directory);
    ~StoreProvider();

    // Fails when the directory does not exist or the data file is unreadable.
    bool open();
    bool isOpen() const;

    TaskStore &taskStore();
    QString dataFilePath() const;
    QString errorString() const;

private:
    QString m_directory;
    QString m_errorString;
    std::shared_ptr<FileTaskStorage> m_storage;
    std::unique_ptr<TaskStore> m_taskStore;
};

} // namespace data
} // namespace marksync
