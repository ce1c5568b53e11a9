#include "marksync/text/MetadataParser.hpp"

#include "marksync/core/Logging.hpp"
#include "marksync/text/Glyphs.hpp"

namespace marksync {
namespace text {

namespace {
constexpr int DatePayloadLength = 11; // " YYYY-MM-DD"
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

std::optional<MetadataKind> dateKindFor(Marker marker)
{
    switch (marker) {
    case Marker::Due:
        return MetadataKind::Due;
    case Marker::Scheduled:
        return MetadataKind::Scheduled;
    case Marker::Start:
        return MetadataKind::Start;
    case Marker::Created:
        return MetadataKind::Created;
    case Marker::Done:
        return MetadataKind::Done;
    case Marker::Canceled:
        return MetadataKind::Canceled;
    default:
        return std::nullopt;
    }
}

std::optional<data::TaskPriority> priorityFor(Marker marker)
{
    switch (marker) {
    case Marker::PriorityHighest:
        return data::TaskPriority::Highest;
    case Marker::PriorityHigh:
        return data::TaskPriority::High;
    case Marker::PriorityMedium:
        return data::TaskPriority::Medium;
    case Marker::PriorityLow:
        return data::TaskPriority::Low;
    case Marker::PriorityLowest:
        return data::TaskPriority::Lowest;
    default:
        return std::nullopt;
    }
}
} // namespace

MetadataParser::MetadataParser(const QString &metadata)
    : m_cursor(metadata)
{
}

std::optional<MetadataEvent> MetadataParser::next()
{
    while (!m_cursor.atEnd()) {
        const Marker marker = markerForGrapheme(m_cursor.advance());
        if (const auto kind = dateKindFor(marker)) {
            return parseDate(*kind);
        }
        if (const auto priority = priorityFor(marker)) {
            MetadataEvent event;
            event.kind = MetadataKind::Priority;
            event.priority = *priority;
            return event;
        }
        if (marker == Marker::Project) {
            return parseProject();
        }
    }
    return std::nullopt;
}

MetadataEvent MetadataParser::parseDate(MetadataKind kind)
{
    MetadataEvent event;
    event.kind = kind;
    const QString payload = m_cursor.take(DatePayloadLength).trimmed();
    event.date = QDate::fromString(payload, QLatin1String(DATE_FORMAT));
    if (!event.date.isValid()) {
        event.date = QDate();
        event.error = QStringLiteral("Failed to parse date: '%1'").arg(payload);
    }
    return event;
}

MetadataEvent MetadataParser::parseProject()
{
    MetadataEvent event;
    event.kind = MetadataKind::Project;
    QString project;
    while (!m_cursor.atEnd() && !isMarker(m_cursor.peek())) {
        project += m_cursor.advance();
    }
    event.project = project.trimmed();
    return event;
}

void applyMetadata(const QString &metadata, data::TaskRecord &task)
{
    MetadataParser parser(metadata);
    while (const auto event = parser.next()) {
        if (event->isError()) {
            qCDebug(lcText) << "Ignoring metadata field:" << event->error;
            continue;
        }
        switch (event->kind) {
        case MetadataKind::Due:
            task.due = event->date;
            break;
        case MetadataKind::Scheduled:
            task.scheduled = event->date;
            break;
        case MetadataKind::Start:
            task.start = event->date;
            break;
        case MetadataKind::Created:
            task.created = event->date;
            break;
        case MetadataKind::Done:
            task.done = event->date;
            break;
        case MetadataKind::Canceled:
            task.canceled = event->date;
            break;
        case MetadataKind::Priority:
            task.priority = event->priority;
            break;
        case MetadataKind::Project:
            task.project = event->project;
            break;
        }
    }
}

} // namespace text
} // namespace marksync
