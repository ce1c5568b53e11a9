#include "marksync/sync/LinePatcher.hpp"

#include <QFile>
#include <QTextStream>

#include "marksync/core/Logging.hpp"

namespace marksync {
namespace sync {

namespace {
constexpr auto TEMPORARY_SUFFIX = ".temp";

QString leadingWhitespace(const QString &line)
{
    int length = 0;
    while (length < line.size() && line.at(length).isSpace()) {
        ++length;
    }
    return line.left(length);
}
} // namespace

LinePatcher::LinePatcher(QString filePath)
    : m_filePath(std::move(filePath))
{
}

bool LinePatcher::load()
{
    m_errorString.clear();
    m_lines.clear();
    m_loaded = false;

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return fail(QStringLiteral("Cannot open %1: %2").arg(m_filePath, file.errorString()));
    }
    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    while (!stream.atEnd()) {
        m_lines << stream.readLine();
    }
    m_loaded = true;
    return true;
}

const QStringList &LinePatcher::lines() const
{
    return m_lines;
}

bool LinePatcher::apply(const QVector<LineUpdate> &updates)
{
    m_errorString.clear();
    if (!m_loaded) {
        return fail(QStringLiteral("%1 has not been loaded").arg(m_filePath));
    }

    // Validate the whole batch before touching anything.
    for (const LineUpdate &update : updates) {
        if (update.line < 0 || update.line >= m_lines.size()) {
            return fail(QStringLiteral("Line %1 is out of range for %2 (%3 lines)")
                            .arg(update.line)
                            .arg(m_filePath)
                            .arg(m_lines.size()));
        }
    }

    QStringList lines = m_lines;
    for (const LineUpdate &update : updates) {
        lines[update.line] = leadingWhitespace(m_lines.at(update.line)) + update.text.trimmed();
    }

    if (!writeLines(lines)) {
        QFile::remove(temporaryPath());
        return false;
    }

    if (!QFile::remove(m_filePath)) {
        QFile::remove(temporaryPath());
        return fail(QStringLiteral("Cannot remove %1").arg(m_filePath));
    }
    if (!QFile::rename(temporaryPath(), m_filePath)) {
        return fail(QStringLiteral("Cannot rename %1 to %2").arg(temporaryPath(), m_filePath));
    }
    m_lines = lines;
    qCDebug(lcSync) << "Patched" << updates.size() << "lines in" << m_filePath;
    return true;
}

QString LinePatcher::filePath() const
{
    return m_filePath;
}

QString LinePatcher::temporaryPath() const
{
    return m_filePath + QLatin1String(TEMPORARY_SUFFIX);
}

QString LinePatcher::errorString() const
{
    return m_errorString;
}

bool LinePatcher::writeLines(const QStringList &lines)
{
    const QString path = temporaryPath();
    if (QFile::exists(path) && !QFile::remove(path)) {
        return fail(QStringLiteral("Cannot remove stale %1").arg(path));
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return fail(QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
    }
    for (const QString &line : lines) {
        const QByteArray bytes = line.toUtf8() + '\n';
        if (file.write(bytes) != bytes.size()) {
            return fail(QStringLiteral("Failed writing %1: %2").arg(path, file.errorString()));
        }
    }
    file.close();
    if (file.error() != QFileDevice::NoError) {
        return fail(QStringLiteral("Failed writing %1: %2").arg(path, file.errorString()));
    }
    return true;
}

bool LinePatcher::fail(const QString &message)
{
    m_errorString = message;
    qCWarning(lcSync) << message;
    return false;
}

} // namespace sync
} // namespace marksync
