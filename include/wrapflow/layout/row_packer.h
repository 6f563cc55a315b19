#pragma once
#include <wrapflow/layout/geometry.h>
#include <wrapflow/layout/row.h>
#include <vector>

namespace wrapflow::layout {

// Break `sizes` into rows no wider than `available_width`, left to right in
// input order. An item wider than the available width is placed alone on
// its own row. An unconstrained width yields a single row. Returned rows
// carry x offsets and widths; vertical placement is left to stack_rows().
std::vector<Row> pack_rows(const std::vector<Size>& sizes,
                           Dimension available_width,
                           const PairSpacingFn& spacing);

} // namespace wrapflow::layout
