#pragma once

#include <QDate>
#include <QString>
#include <optional>

#include "marksync/data/Task.hpp"
#include "marksync/text/GraphemeCursor.hpp"

namespace marksync {
namespace text {

enum class MetadataKind
{
    Due,
    Scheduled,
    Start,
    Created,
    Done,
    Canceled,
    Priority,
    Project,
};

struct MetadataEvent
{
    MetadataKind kind = MetadataKind::Due;
    QDate date;
    data::TaskPriority priority = data::TaskPriority::Normal;
    QString project;
    QString error; // set when the payload of a date marker did not parse

    bool isError() const { return !error.isEmpty(); }
};

// Yields the metadata events of a metadata run in source order.
class MetadataParser
{
public:
    explicit MetadataParser(const QString &metadata);

    std::optional<MetadataEvent> next();

private:
    MetadataEvent parseDate(MetadataKind kind);
    MetadataEvent parseProject();

    GraphemeCursor m_cursor;
};

// Applies every successfully parsed event, later events overwriting earlier ones.
void applyMetadata(const QString &metadata, data::TaskRecord &task);

} // namespace text
} // namespace marksync
