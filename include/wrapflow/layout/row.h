#pragma once
#include <wrapflow/layout/geometry.h>
#include <cstddef>
#include <functional>
#include <vector>

namespace wrapflow::layout {

struct RowElement {
    std::size_t index = 0;  // position in the host's item collection
    Size size;
    float x_offset = 0;     // relative to the row's leading edge

    bool operator==(const RowElement& other) const {
        return index == other.index && size == other.size && x_offset == other.x_offset;
    }
};

struct Row {
    std::vector<RowElement> elements;
    float y_offset = 0;  // top edge within the content
    float width = 0;     // item widths plus the spacing between them
    float height = 0;    // tallest element

    bool operator==(const Row& other) const {
        return elements == other.elements && y_offset == other.y_offset &&
               width == other.width && height == other.height;
    }
};

// Distance between two adjacent items, identified by their collection index.
using PairSpacingFn = std::function<float(std::size_t previous, std::size_t next)>;

} // namespace wrapflow::layout
