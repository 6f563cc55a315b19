#include <wrapflow/layout/row_packer.h>

#include <utility>

namespace wrapflow::layout {

namespace {

// Close the current row at the consumed width and start an empty one.
void close_row(std::vector<Row>& rows, Row& current, float& cursor_x) {
    current.width = cursor_x;
    rows.push_back(std::move(current));
    current = Row{};
    cursor_x = 0;
}

} // namespace

std::vector<Row> pack_rows(const std::vector<Size>& sizes,
                           Dimension available_width,
                           const PairSpacingFn& spacing) {
    std::vector<Row> rows;
    Row current;
    float cursor_x = 0;

    for (std::size_t i = 0; i < sizes.size(); ++i) {
        const Size& size = sizes[i];
        const bool oversized = available_width.exceeded_by(size.width);

        float gap = 0;
        if (!current.elements.empty() && spacing) {
            gap = spacing(current.elements.back().index, i);
        }

        // An item too wide for any row never shares one: flush what is
        // already on the line before placing it.
        if (oversized && !current.elements.empty()) {
            close_row(rows, current, cursor_x);
            gap = 0;
        }

        if (!current.elements.empty() &&
            available_width.exceeded_by(cursor_x + size.width + gap)) {
            close_row(rows, current, cursor_x);
            gap = 0;
        }

        current.elements.push_back(RowElement{i, size, cursor_x + gap});
        cursor_x += size.width + gap;

        // Whatever follows an oversized item starts on a fresh row.
        if (oversized) {
            close_row(rows, current, cursor_x);
        }
    }

    if (!current.elements.empty()) {
        close_row(rows, current, cursor_x);
    }
    return rows;
}

} // namespace wrapflow::layout
