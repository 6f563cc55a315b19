#pragma once
#include <wrapflow/layout/geometry.h>
#include <wrapflow/layout/row.h>

namespace wrapflow::layout {

enum class Alignment {
    Center,
    Leading,
    Trailing,
    Top,
    Bottom,
    TopLeading,
    TopTrailing,
    BottomLeading,
    BottomTrailing,
    // Baseline alignments have no fixed anchor and resolve to Center.
    LeadingFirstTextBaseline,
    CenterFirstTextBaseline,
    TrailingFirstTextBaseline,
    LeadingLastTextBaseline,
    CenterLastTextBaseline,
    TrailingLastTextBaseline
};

// Fractional anchor inside a box: (0, 0) is top-leading, (1, 1) bottom-trailing.
struct UnitPoint {
    float x = 0.5f, y = 0.5f;

    bool operator==(const UnitPoint& other) const { return x == other.x && y == other.y; }
};

UnitPoint anchor_for(Alignment alignment);

// Position of `element` inside a container of `container_width`, relative to
// the container's origin. Each row is shifted independently along x, each
// element independently within its row's height.
Point resolve_position(const Row& row, const RowElement& element,
                       float container_width, UnitPoint anchor);

// Kebab-case name, as it appears in diagnostics.
const char* alignment_name(Alignment alignment);

} // namespace wrapflow::layout
