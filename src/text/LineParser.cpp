#include "marksync/text/LineParser.hpp"

#include <QRegularExpression>

#include "marksync/core/Logging.hpp"
#include "marksync/text/GraphemeCursor.hpp"
#include "marksync/text/Glyphs.hpp"
#include "marksync/text/MetadataParser.hpp"

namespace marksync {
namespace text {

namespace {
constexpr int UuidTextLength = 36;

const QRegularExpression &preambleExpression()
{
    static const QRegularExpression expression(
        QStringLiteral(R"(^\s*- \[(?<status>[x\- ])\] (?<remaining>.*)$)"));
    return expression;
}

// Accepts both "[[id: ...|X]]" and the older "[[uuid: ...|X]]" spelling.
const QRegularExpression &anchorExpression()
{
    static const QRegularExpression expression(
        QStringLiteral(R"((?<whole>\[\[(?:id|uuid): (?<id>.*?)\|\x{2694}\x{FE0F}?\]\]))"));
    return expression;
}

bool isWhitespace(const QString &grapheme)
{
    return !grapheme.isEmpty() && grapheme.at(0).isSpace();
}
} // namespace

std::optional<data::TaskRecord> parseLine(const QString &line)
{
    QString remaining = line;
    const auto status = parsePreamble(remaining);
    if (!status) {
        return std::nullopt;
    }

    const TaskParts parts = splitTaskParts(remaining);
    if (parts.description.isEmpty()) {
        qCDebug(lcText) << "Task without description:" << line;
        return std::nullopt;
    }

    data::TaskRecord task;
    task.status = *status;
    task.identifier = parts.identifier;
    task.description = parts.description;
    task.tags = parseTags(parts.description);
    applyMetadata(parts.metadata, task);
    return task;
}

std::optional<data::TaskStatus> parsePreamble(QString &text)
{
    const auto match = preambleExpression().match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    const QString marker = match.captured(QStringLiteral("status"));
    data::TaskStatus status = data::TaskStatus::Pending;
    if (marker == QLatin1String("x")) {
        status = data::TaskStatus::Complete;
    } else if (marker == QLatin1String("-")) {
        status = data::TaskStatus::Canceled;
    }
    text = match.captured(QStringLiteral("remaining"));
    return status;
}

TaskParts splitTaskParts(const QString &text)
{
    TaskParts parts;
    QString working = text;

    const auto match = anchorExpression().match(working);
    if (match.hasMatch()) {
        const QString value = match.captured(QStringLiteral("id"));
        if (const auto id = parseIdentifier(value)) {
            parts.identifier = *id;
        } else {
            qCDebug(lcText) << "Failed to parse identifier:" << value;
        }
        working.remove(match.capturedStart(QStringLiteral("whole")),
                       match.capturedLength(QStringLiteral("whole")));
        working = working.trimmed();
    }

    GraphemeCursor cursor(working);
    QString description;
    while (!cursor.atEnd() && !isMarker(cursor.peek())) {
        description += cursor.advance();
    }
    parts.description = description.trimmed();
    parts.metadata = cursor.remaining().trimmed();
    return parts;
}

QStringList parseTags(const QString &description)
{
    QStringList tags;
    GraphemeCursor cursor(description);
    while (!cursor.atEnd()) {
        if (cursor.advance() != QLatin1String("#")) {
            continue;
        }
        QString run;
        while (!cursor.atEnd() && !isWhitespace(cursor.peek())) {
            run += cursor.advance();
        }
        const QStringList segments = run.split(QLatin1Char('/'), Qt::SkipEmptyParts);
        for (const QString &segment : segments) {
            if (!tags.contains(segment)) {
                tags << segment;
            }
        }
    }
    return tags;
}

std::optional<QUuid> parseIdentifier(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.size() != UuidTextLength) {
        return std::nullopt;
    }
    const QUuid id(QStringLiteral("{%1}").arg(trimmed));
    if (id.isNull()) {
        return std::nullopt;
    }
    return id;
}

} // namespace text
} // namespace marksync
