#include "marksync/data/FileTaskStorage.hpp"

#include <QFile>
#include <QSaveFile>
#include <QTextStream>
#include <QUrl>
#include <algorithm>

#include "marksync/core/Logging.hpp"

namespace marksync {
namespace data {

namespace {
QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    return QUuid(QStringLiteral("{%1}").arg(value));
}
} // namespace

FileTaskStorage::FileTaskStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

QString FileTaskStorage::filePath() const
{
    return m_filePath;
}

const QHash<QUuid, StoreTask> &FileTaskStorage::tasks() const
{
    return m_tasks;
}

QString FileTaskStorage::errorString() const
{
    return m_errorString;
}

bool FileTaskStorage::load()
{
    m_tasks.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        m_errorString = QStringLiteral("Cannot open %1: %2").arg(m_filePath, file.errorString());
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    bool inTask = false;
    QUuid currentId;
    QHash<QString, QString> currentProperties;
    int lineNumber = 0;

    while (!stream.atEnd()) {
        const QString line = stream.readLine();
        ++lineNumber;
        if (line == QLatin1String("BEGIN:TASK")) {
            inTask = true;
            currentId = QUuid();
            currentProperties.clear();
            continue;
        }
        if (line == QLatin1String("END:TASK")) {
            if (inTask && !currentId.isNull()) {
                m_tasks.insert(currentId, StoreTask(currentId, currentProperties));
            } else if (inTask) {
                qCWarning(lcStore) << "Skipping task without UID ending at" << m_filePath << "line" << lineNumber;
            }
            inTask = false;
            continue;
        }
        if (!inTask) {
            continue;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            continue;
        }
        const QString name = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        if (name == QLatin1String("UID")) {
            currentId = parseUid(rawValue);
        } else {
            currentProperties.insert(decodeName(name), decodeText(rawValue));
        }
    }
    return true;
}

bool FileTaskStorage::replaceTasks(QHash<QUuid, StoreTask> tasks)
{
    if (!save(tasks)) {
        return false;
    }
    m_tasks = std::move(tasks);
    return true;
}

bool FileTaskStorage::save(const QHash<QUuid, StoreTask> &tasks)
{
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        m_errorString = QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString());
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:TASKDB\n";
    stream << "VERSION:1\n";

    auto ids = tasks.keys();
    std::sort(ids.begin(), ids.end());
    for (const QUuid &id : ids) {
        const StoreTask &task = tasks[id];
        stream << "BEGIN:TASK\n";
        stream << "UID:" << prepareUid(id) << '\n';

        auto names = task.properties().keys();
        std::sort(names.begin(), names.end());
        for (const QString &name : names) {
            stream << encodeName(name) << ':' << encodeText(task.properties().value(name)) << '\n';
        }
        stream << "END:TASK\n";
    }
    stream << "END:TASKDB\n";

    stream.flush();
    if (stream.status() != QTextStream::Ok) {
        file.cancelWriting();
        m_errorString = QStringLiteral("Failed writing %1").arg(m_filePath);
        return false;
    }
    if (!file.commit()) {
        m_errorString = QStringLiteral("Cannot commit %1: %2").arg(m_filePath, file.errorString());
        return false;
    }
    return true;
}

QString FileTaskStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace('\r', "\\r");
    return encoded;
}

QString FileTaskStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch != '\\' || i + 1 >= text.size()) {
            decoded += ch;
            continue;
        }
        const QChar next = text.at(++i);
        if (next == 'n') {
            decoded += '\n';
        } else if (next == 'r') {
            decoded += '\r';
        } else {
            decoded += next;
        }
    }
    return decoded;
}

QString FileTaskStorage::encodeName(const QString &name)
{
    return QString::fromLatin1(QUrl::toPercentEncoding(name));
}

QString FileTaskStorage::decodeName(const QString &name)
{
    return QUrl::fromPercentEncoding(name.toLatin1());
}

} // namespace data
} // namespace marksync
