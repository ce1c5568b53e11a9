#include "marksync/text/GraphemeCursor.hpp"

#include <QTextBoundaryFinder>

namespace marksync {
namespace text {

QStringList splitGraphemes(const QString &text)
{
    QStringList graphemes;
    if (text.isEmpty()) {
        return graphemes;
    }

    QTextBoundaryFinder finder(QTextBoundaryFinder::Grapheme, text);
    int start = 0;
    int next = finder.toNextBoundary();
    while (next != -1) {
        if (next > start) {
            graphemes << text.mid(start, next - start);
        }
        start = next;
        next = finder.toNextBoundary();
    }
    if (start < text.size()) {
        graphemes << text.mid(start);
    }
    return graphemes;
}

GraphemeCursor::GraphemeCursor(const QString &text)
    : m_graphemes(splitGraphemes(text))
{
}

GraphemeCursor::GraphemeCursor(QStringList graphemes)
    : m_graphemes(std::move(graphemes))
{
}

bool GraphemeCursor::atEnd() const
{
    return m_index >= m_graphemes.size();
}

QString GraphemeCursor::peek() const
{
    if (atEnd()) {
        return {};
    }
    return m_graphemes.at(m_index);
}

QString GraphemeCursor::advance()
{
    if (atEnd()) {
        return {};
    }
    return m_graphemes.at(m_index++);
}

QString GraphemeCursor::take(int count)
{
    QString taken;
    for (int i = 0; i < count && !atEnd(); ++i) {
        taken += m_graphemes.at(m_index++);
    }
    return taken;
}

QString GraphemeCursor::remaining() const
{
    QString rest;
    for (int i = m_index; i < m_graphemes.size(); ++i) {
        rest += m_graphemes.at(i);
    }
    return rest;
}

} // namespace text
} // namespace marksync
