#pragma once
#include <wrapflow/layout/geometry.h>
#include <cstddef>
#include <functional>
#include <vector>

namespace wrapflow::layout {

// Natural size of item `index` under `proposal`. May be expensive; the
// engine calls it at most once per item per pass.
using SizeThatFitsFn = std::function<Size(std::size_t index, const ProposedSize& proposal)>;

// Host's preferred distance between two adjacent items along `axis`.
using PreferredSpacingFn = std::function<float(std::size_t previous, std::size_t next, Axis axis)>;

// Receives the final top-left position of item `index` together with the
// proposal the pass ran under.
using PlaceFn = std::function<void(std::size_t index, Point position, const ProposedSize& proposal)>;

// The host's view of the items being laid out. Only `count` and
// `size_that_fits` are required.
struct ItemCollection {
    std::size_t count = 0;
    SizeThatFitsFn size_that_fits;
    PreferredSpacingFn preferred_spacing;
    PlaceFn place;

    bool empty() const { return count == 0; }
};

// Measure every item against `proposal`, in order. Negative or NaN extents
// reported by the host are clamped to zero.
// Throws std::invalid_argument if items are present but no sizing function is.
std::vector<Size> measure_items(const ItemCollection& items, const ProposedSize& proposal);

// Componentwise maximum of every item measured against a zero proposal.
Size compute_min_size(const ItemCollection& items);

} // namespace wrapflow::layout
