#pragma once

#include <QString>
#include <QStringList>

namespace marksync {
namespace text {

QStringList splitGraphemes(const QString &text);

// Single pass cursor over the grapheme clusters of a text fragment.
class GraphemeCursor
{
public:
    explicit GraphemeCursor(const QString &text);
    explicit GraphemeCursor(QStringList graphemes);

    bool atEnd() const;

    // Current grapheme, or an empty string at the end.
    QString peek() const;
    QString advance();
    // Up to count graphemes, fewer when the end is reached first.
    QString take(int count);
    QString remaining() const;

private:
    QStringList m_graphemes;
    int m_index = 0;
};

} // namespace text
} // namespace marksync
