#include <wrapflow/layout/alignment.h>

namespace wrapflow::layout {

namespace {

struct AlignmentEntry {
    Alignment alignment;
    const char* name;
};

constexpr AlignmentEntry kAlignmentNames[] = {
    {Alignment::Center, "center"},
    {Alignment::Leading, "leading"},
    {Alignment::Trailing, "trailing"},
    {Alignment::Top, "top"},
    {Alignment::Bottom, "bottom"},
    {Alignment::TopLeading, "top-leading"},
    {Alignment::TopTrailing, "top-trailing"},
    {Alignment::BottomLeading, "bottom-leading"},
    {Alignment::BottomTrailing, "bottom-trailing"},
    {Alignment::LeadingFirstTextBaseline, "leading-first-text-baseline"},
    {Alignment::CenterFirstTextBaseline, "center-first-text-baseline"},
    {Alignment::TrailingFirstTextBaseline, "trailing-first-text-baseline"},
    {Alignment::LeadingLastTextBaseline, "leading-last-text-baseline"},
    {Alignment::CenterLastTextBaseline, "center-last-text-baseline"},
    {Alignment::TrailingLastTextBaseline, "trailing-last-text-baseline"},
};

} // namespace

UnitPoint anchor_for(Alignment alignment) {
    switch (alignment) {
        case Alignment::Leading:        return {0.0f, 0.5f};
        case Alignment::TopLeading:     return {0.0f, 0.0f};
        case Alignment::Top:            return {0.5f, 0.0f};
        case Alignment::TopTrailing:    return {1.0f, 0.0f};
        case Alignment::Trailing:       return {1.0f, 0.5f};
        case Alignment::BottomTrailing: return {1.0f, 1.0f};
        case Alignment::Bottom:         return {0.5f, 1.0f};
        case Alignment::BottomLeading:  return {0.0f, 1.0f};
        default:                        return {0.5f, 0.5f};
    }
}

Point resolve_position(const Row& row, const RowElement& element,
                       float container_width, UnitPoint anchor) {
    return {
        element.x_offset + anchor.x * (container_width - row.width),
        row.y_offset + anchor.y * (row.height - element.size.height),
    };
}

const char* alignment_name(Alignment alignment) {
    for (const auto& entry : kAlignmentNames) {
        if (entry.alignment == alignment) return entry.name;
    }
    return "unknown";
}

} // namespace wrapflow::layout
