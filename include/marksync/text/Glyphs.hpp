#pragma once

#include <QString>

namespace marksync {
namespace text {

enum class Marker
{
    None,
    Due,
    Scheduled,
    Start,
    Created,
    Done,
    Canceled,
    PriorityHighest,
    PriorityHigh,
    PriorityMedium,
    PriorityLow,
    PriorityLowest,
    Project,
    // Recognized so they end a description or a project, never interpreted.
    Recurrence,
    ExternalId,
    Blocked,
};

// Accepts a glyph with or without a trailing emoji variation selector.
Marker markerForGrapheme(const QString &grapheme);
bool isMarker(const QString &grapheme);

// Canonical encoding used when rendering.
QString glyphFor(Marker marker);

QString anchorGlyph();

} // namespace text
} // namespace marksync
