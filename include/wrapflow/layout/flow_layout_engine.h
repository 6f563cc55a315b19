#pragma once
#include <wrapflow/core/diagnostics.h>
#include <wrapflow/layout/alignment.h>
#include <wrapflow/layout/geometry.h>
#include <wrapflow/layout/layout_cache.h>
#include <wrapflow/layout/row.h>
#include <wrapflow/layout/sizing.h>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wrapflow::layout {

struct FlowLayoutConfig {
    Alignment alignment = Alignment::Center;
    // When unset, spacing is asked from the host for every adjacent pair.
    std::optional<float> horizontal_spacing;
    std::optional<float> vertical_spacing;
};

struct MeasureResult {
    Size min_size;
    Size fit_size;
};

struct PlacedItem {
    std::size_t index = 0;
    Point position;  // top-left corner, in the coordinate space of the bounds
    ProposedSize proposal;
};

struct LayoutStats {
    std::uint64_t passes = 0;
    std::uint64_t cache_hits = 0;
    std::uint64_t cache_misses = 0;
    std::uint64_t degenerate_passes = 0;  // proposal smaller than the min size
    std::uint64_t pack_runs = 0;
};

// Lays items out in rows that wrap at the proposed width, like words in a
// paragraph. One engine instance belongs to one container; it keeps the
// container's min size and the rows of the last pass between calls.
class FlowLayoutEngine {
public:
    FlowLayoutEngine() = default;
    explicit FlowLayoutEngine(FlowLayoutConfig config) : config_(std::move(config)) {}

    FlowLayoutEngine(const FlowLayoutEngine&) = delete;
    FlowLayoutEngine& operator=(const FlowLayoutEngine&) = delete;

    // Items are laid out along the horizontal axis, wrapping downwards.
    static Axis stack_orientation() { return Axis::Horizontal; }

    // Prime the cache for a new item collection. update_cache() must be
    // called again whenever the collection or its contents change.
    void make_cache(const ItemCollection& items);
    void update_cache(const ItemCollection& items);

    // Minimum size of the container and the size it takes for `proposal`.
    // When nothing can be arranged, fit_size falls back to min_size.
    MeasureResult measure(const ProposedSize& proposal, const ItemCollection& items);

    // Final top-left positions of every item inside `bounds`. Calls
    // items.place for each one when the host supplied it.
    std::vector<PlacedItem> arrange(const Rect& bounds, const ProposedSize& proposal,
                                    const ItemCollection& items);

    // Packed and stacked rows for `proposal`, served from the cache when
    // neither the proposal nor any measured item size changed.
    std::vector<Row> arrange_rows(const ProposedSize& proposal, const ItemCollection& items);

    FlowLayoutConfig config() const;
    // Drops the cached rows. A pass already running with the previous config
    // still returns its rows but does not cache them.
    void set_config(FlowLayoutConfig config);

    void set_diagnostics(core::DiagnosticEmitter* emitter) { diagnostics_ = emitter; }

    LayoutStats stats() const;
    void reset_stats();

private:
    Size ensure_min_size(const ItemCollection& items);
    float resolve_spacing(const ItemCollection& items, std::optional<float> override_value,
                          std::size_t previous, std::size_t next, Axis axis) const;
    void log(core::Severity severity, const char* stage, const std::string& message);

    FlowLayoutConfig config_;
    std::uint64_t config_generation_ = 0;
    LayoutCache cache_;
    LayoutStats stats_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace wrapflow::layout
