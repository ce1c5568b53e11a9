#include "marksync/text/TaskRenderer.hpp"

#include "marksync/text/Glyphs.hpp"

namespace marksync {
namespace text {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

QChar checkboxMarker(data::TaskStatus status)
{
    switch (status) {
    case data::TaskStatus::Complete:
        return QLatin1Char('x');
    case data::TaskStatus::Canceled:
        return QLatin1Char('-');
    case data::TaskStatus::Pending:
    default:
        return QLatin1Char(' ');
    }
}

Marker priorityMarker(data::TaskPriority priority)
{
    switch (priority) {
    case data::TaskPriority::Highest:
        return Marker::PriorityHighest;
    case data::TaskPriority::High:
        return Marker::PriorityHigh;
    case data::TaskPriority::Medium:
        return Marker::PriorityMedium;
    case data::TaskPriority::Low:
        return Marker::PriorityLow;
    case data::TaskPriority::Lowest:
        return Marker::PriorityLowest;
    case data::TaskPriority::Normal:
    default:
        return Marker::None;
    }
}

void appendDate(QString &line, Marker marker, const QDate &date)
{
    if (!date.isValid()) {
        return;
    }
    line += QLatin1Char(' ') + glyphFor(marker) + QLatin1Char(' ')
        + date.toString(QLatin1String(DATE_FORMAT));
}
} // namespace

QString renderTask(const data::TaskRecord &task)
{
    QString line = QStringLiteral("- [%1] ").arg(checkboxMarker(task.status));
    line += task.description;

    if (task.project) {
        line += QLatin1Char(' ') + glyphFor(Marker::Project);
        if (!task.project->isEmpty()) {
            line += QLatin1Char(' ') + *task.project;
        }
    }
    appendDate(line, Marker::Due, task.due);
    appendDate(line, Marker::Scheduled, task.scheduled);
    appendDate(line, Marker::Start, task.start);
    appendDate(line, Marker::Created, task.created);
    appendDate(line, Marker::Done, task.done);
    appendDate(line, Marker::Canceled, task.canceled);

    const Marker priority = priorityMarker(task.priority);
    if (priority != Marker::None) {
        line += QLatin1Char(' ') + glyphFor(priority);
    }
    if (!task.identifier.isNull()) {
        line += QLatin1Char(' ') + renderAnchor(task.identifier);
    }
    return line;
}

QString renderAnchor(const QUuid &identifier)
{
    return QStringLiteral("[[id: %1|%2]]")
        .arg(identifier.toString(QUuid::WithoutBraces), anchorGlyph());
}

} // namespace text
} // namespace marksync
