#pragma once

#include <QString>
#include <QStringList>
#include <QUuid>
#include <optional>

#include "marksync/data/Task.hpp"

namespace marksync {
namespace text {

struct TaskParts
{
    QString description;
    QString metadata;
    QUuid identifier; // null when absent or malformed
};

// Returns std::nullopt when the line is not a task or has no description.
std::optional<data::TaskRecord> parseLine(const QString &line);

// Strips "- [?] " (with leading whitespace) and returns the checkbox status.
std::optional<data::TaskStatus> parsePreamble(QString &text);

// Splits the text after the preamble into description, metadata run and anchor.
TaskParts splitTaskParts(const QString &text);

QStringList parseTags(const QString &description);

std::optional<QUuid> parseIdentifier(const QString &value);

} // namespace text
} // namespace marksync
