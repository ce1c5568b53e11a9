#include "marksync/text/Glyphs.hpp"

#include <QChar>
#include <array>

namespace marksync {
namespace text {

namespace {
constexpr ushort EmojiVariationSelector = 0xFE0F;
constexpr ushort TextVariationSelector = 0xFE0E;

struct GlyphEntry
{
    Marker marker;
    const char16_t *glyph;
};

const std::array<GlyphEntry, 15> &glyphTable()
{
    static const std::array<GlyphEntry, 15> table = { {
        { Marker::Due, u"\U0001F4C5" },
        { Marker::Scheduled, u"\u23F3" },
        { Marker::Start, u"\U0001F6EB" },
        { Marker::Created, u"\u2795" },
        { Marker::Done, u"\u2705" },
        { Marker::Canceled, u"\u274C" },
        { Marker::PriorityHighest, u"\U0001F53A" },
        { Marker::PriorityHigh, u"\u23EB" },
        { Marker::PriorityMedium, u"\U0001F53C" },
        { Marker::PriorityLow, u"\U0001F53D" },
        { Marker::PriorityLowest, u"\u23EC" },
        { Marker::Project, u"\U0001F528" },
        { Marker::Recurrence, u"\U0001F501" },
        { Marker::ExternalId, u"\U0001F194" },
        { Marker::Blocked, u"\u26D4" },
    } };
    return table;
}

QString stripVariationSelectors(const QString &grapheme)
{
    QString base = grapheme;
    while (!base.isEmpty()
           && (base.back().unicode() == EmojiVariationSelector
               || base.back().unicode() == TextVariationSelector)) {
        base.chop(1);
    }
    return base;
}
} // namespace

Marker markerForGrapheme(const QString &grapheme)
{
    const QString base = stripVariationSelectors(grapheme);
    if (base.isEmpty()) {
        return Marker::None;
    }
    for (const auto &entry : glyphTable()) {
        if (base == QString::fromUtf16(entry.glyph)) {
            return entry.marker;
        }
    }
    return Marker::None;
}

bool isMarker(const QString &grapheme)
{
    return markerForGrapheme(grapheme) != Marker::None;
}

QString glyphFor(Marker marker)
{
    for (const auto &entry : glyphTable()) {
        if (entry.marker == marker) {
            return QString::fromUtf16(entry.glyph);
        }
    }
    return {};
}

QString anchorGlyph()
{
    return QString::fromUtf16(u"\u2694\uFE0F");
}

} // namespace text
} // namespace marksync
