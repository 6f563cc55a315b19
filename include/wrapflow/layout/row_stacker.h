#pragma once
#include <wrapflow/layout/geometry.h>
#include <wrapflow/layout/row.h>
#include <vector>

namespace wrapflow::layout {

// Assign y offsets and heights to packed rows. The spacing between two rows
// is resolved between the tallest element of each (first one wins on ties).
void stack_rows(std::vector<Row>& rows, const PairSpacingFn& spacing);

// Bounding size of stacked rows. The width never shrinks below a definite
// proposed width.
Size content_size(const std::vector<Row>& rows, const ProposedSize& proposal);

// First tallest element of the row, or nullptr for an empty row.
const RowElement* tallest_element(const Row& row);

} // namespace wrapflow::layout
