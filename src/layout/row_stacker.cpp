#include <wrapflow/layout/row_stacker.h>

#include <algorithm>

namespace wrapflow::layout {

const RowElement* tallest_element(const Row& row) {
    const RowElement* tallest = nullptr;
    for (const auto& element : row.elements) {
        // Strict comparison keeps the first of equally tall elements.
        if (!tallest || element.size.height > tallest->size.height) {
            tallest = &element;
        }
    }
    return tallest;
}

void stack_rows(std::vector<Row>& rows, const PairSpacingFn& spacing) {
    float cursor_y = 0;
    const RowElement* previous_tallest = nullptr;

    for (auto& row : rows) {
        const RowElement* tallest = tallest_element(row);
        if (!tallest) continue;

        float gap = 0;
        if (previous_tallest && spacing) {
            gap = spacing(previous_tallest->index, tallest->index);
        }

        row.y_offset = cursor_y + gap;
        row.height = tallest->size.height;
        cursor_y += row.height + gap;
        previous_tallest = tallest;
    }
}

Size content_size(const std::vector<Row>& rows, const ProposedSize& proposal) {
    Size size;
    for (const auto& row : rows) {
        size.width = std::max(size.width, row.width);
    }
    if (proposal.width.is_definite()) {
        size.width = std::max(size.width, proposal.width.value_or(0));
    }
    if (!rows.empty()) {
        size.height = rows.back().y_offset + rows.back().height;
    }
    return size;
}

} // namespace wrapflow::layout
