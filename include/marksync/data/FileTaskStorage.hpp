#pragma once

#include <QHash>
#include <QString>
#include <QUuid>

#include "marksync/data/StoreTask.hpp"

namespace marksync {
namespace data {

class FileTaskStorage
{
public:
    explicit FileTaskStorage(QString filePath);
    ~FileTaskStorage() = default;

    QString filePath() const;
    const QHash<QUuid, StoreTask> &tasks() const;

    bool load();
    // Writes the given tasks and adopts them only when the write succeeded.
    bool replaceTasks(QHash<QUuid, StoreTask> tasks);

    QString errorString() const;

private:
    bool save(const QHash<QUuid, StoreTask> &tasks);

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString encodeName(const QString &name);
    static QString decodeName(const QString &name);

    QString m_filePath;
    QHash<QUuid, StoreTask> m_tasks;
    QString m_errorString;
};

} // namespace data
} // namespace marksync
