#include <wrapflow/layout/sizing.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace wrapflow::layout {

namespace {

float sanitize_extent(float v) {
    if (std::isnan(v) || v < 0) return 0;
    return v;
}

} // namespace

std::vector<Size> measure_items(const ItemCollection& items, const ProposedSize& proposal) {
    if (items.count > 0 && !items.size_that_fits) {
        throw std::invalid_argument("ItemCollection has items but no size_that_fits function");
    }

    std::vector<Size> sizes;
    sizes.reserve(items.count);
    for (std::size_t i = 0; i < items.count; ++i) {
        Size size = items.size_that_fits(i, proposal);
        size.width = sanitize_extent(size.width);
        size.height = sanitize_extent(size.height);
        sizes.push_back(size);
    }
    return sizes;
}

Size compute_min_size(const ItemCollection& items) {
    Size min_size;
    for (const auto& size : measure_items(items, ProposedSize::zero())) {
        min_size.width = std::max(min_size.width, size.width);
        min_size.height = std::max(min_size.height, size.height);
    }
    return min_size;
}

} // namespace wrapflow::layout
