#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

namespace marksync {
namespace sync {

struct LineUpdate
{
    int line = 0;
    QString text;
};

// Rewrites selected lines of a text file. load() takes the snapshot the batch
// refers to; indices are 0-based lines of that snapshot and every replaced
// line keeps its original leading whitespace. The new content goes to a sibling temporary file which
// then replaces the original, so a failure never leaves a half-written file.
class LinePatcher
{
public:
    explicit LinePatcher(QString filePath);

    bool load();
    const QStringList &lines() const;

    bool apply(const QVector<LineUpdate> &updates);

    QString filePath() const;
    QString temporaryPath() const;
    QString errorString() const;

private:
    bool writeLines(const QStringList &lines);
    bool fail(const QString &message);

    QString m_filePath;
    QStringList m_lines;
    bool m_loaded = false;
    QString m_errorString;
};

} // namespace sync
} // namespace marksync
