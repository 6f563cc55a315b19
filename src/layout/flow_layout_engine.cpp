#include <wrapflow/layout/flow_layout_engine.h>

#include <sstream>
#include <wrapflow/core/config.h>
#include <wrapflow/layout/row_packer.h>
#include <wrapflow/layout/row_stacker.h>

namespace wrapflow::layout {

namespace {

std::string describe(const ProposedSize& proposal) {
    std::ostringstream oss;
    auto axis = [&oss](const Dimension& d) {
        if (d.is_definite()) {
            oss << d.value_or(0);
        } else {
            oss << "unconstrained";
        }
    };
    axis(proposal.width);
    oss << "x";
    axis(proposal.height);
    return oss.str();
}

} // namespace

void FlowLayoutEngine::make_cache(const ItemCollection& items) {
    const Size min_size = compute_min_size(items);
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    cache_.set_min_size(min_size);
}

void FlowLayoutEngine::update_cache(const ItemCollection& items) {
    // Only the floor is refreshed; cached rows stay valid because their
    // fingerprint covers every measured size.
    const Size min_size = compute_min_size(items);
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.set_min_size(min_size);
}

FlowLayoutConfig FlowLayoutEngine::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void FlowLayoutEngine::set_config(FlowLayoutConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
    ++config_generation_;
    // Spacing is not part of the fingerprint.
    cache_.invalidate();
}

LayoutStats FlowLayoutEngine::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void FlowLayoutEngine::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = LayoutStats{};
}

Size FlowLayoutEngine::ensure_min_size(const ItemCollection& items) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cache_.min_size()) return *cache_.min_size();
    }
    const Size min_size = compute_min_size(items);
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.set_min_size(min_size);
    return min_size;
}

float FlowLayoutEngine::resolve_spacing(const ItemCollection& items,
                                        std::optional<float> override_value,
                                        std::size_t previous, std::size_t next,
                                        Axis axis) const {
    if (override_value) return *override_value;
    if (items.preferred_spacing) return items.preferred_spacing(previous, next, axis);
    return core::config::kDefaultItemSpacing;
}

void FlowLayoutEngine::log(core::Severity severity, const char* stage,
                           const std::string& message) {
    if (!diagnostics_ || !diagnostics_->enabled(severity)) return;
    diagnostics_->emit(severity, core::config::kLogModule, stage, message);
}

std::vector<Row> FlowLayoutEngine::arrange_rows(const ProposedSize& proposal,
                                                const ItemCollection& items) {
    std::uint64_t pass_id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pass_id = ++stats_.passes;
    }
    if (diagnostics_) diagnostics_->set_pass_id(pass_id);

    if (items.empty()) return {};

    const Size min_size = ensure_min_size(items);
    if (proposal.width.exceeded_by(min_size.width) ||
        proposal.height.exceeded_by(min_size.height)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.degenerate_passes;
        }
        std::ostringstream oss;
        oss << "proposal " << describe(proposal) << " is smaller than min size "
            << min_size.width << "x" << min_size.height << "; nothing arranged";
        log(core::Severity::Info, "arrange", oss.str());
        return {};
    }

    const std::vector<Size> sizes = measure_items(items, proposal);
    const Fingerprint fingerprint = compute_fingerprint(proposal, sizes);

    std::optional<std::vector<Row>> cached_rows;
    FlowLayoutConfig config;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
        generation = config_generation_;
        if (const auto* cached = cache_.lookup(fingerprint)) {
            ++stats_.cache_hits;
            cached_rows = *cached;
        } else {
            ++stats_.cache_misses;
        }
    }
    if (cached_rows) {
        log(core::Severity::Debug, "cache", "hit for " + describe(proposal));
        return std::move(*cached_rows);
    }

    PairSpacingFn horizontal = [this, &items, &config](std::size_t previous, std::size_t next) {
        return resolve_spacing(items, config.horizontal_spacing, previous, next, Axis::Horizontal);
    };
    PairSpacingFn vertical = [this, &items, &config](std::size_t previous, std::size_t next) {
        return resolve_spacing(items, config.vertical_spacing, previous, next, Axis::Vertical);
    };

    std::vector<Row> rows = pack_rows(sizes, proposal.width, horizontal);
    stack_rows(rows, vertical);

    if (diagnostics_) {
        for (const auto& row : rows) {
            if (row.elements.size() == 1 && proposal.width.exceeded_by(row.width)) {
                std::ostringstream oss;
                oss << "item " << row.elements.front().index << " is " << row.width
                    << " wide, more than the available " << proposal.width.value_or(0)
                    << "; placed on its own row";
                log(core::Severity::Warning, "pack", oss.str());
            }
        }
        std::ostringstream oss;
        oss << "packed " << sizes.size() << " items into " << rows.size()
            << " rows for " << describe(proposal) << ", alignment "
            << alignment_name(config.alignment);
        log(core::Severity::Info, "pack", oss.str());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.pack_runs;
        // Rows packed under a config that set_config() has since replaced
        // must not outlive the invalidation.
        if (generation == config_generation_) cache_.store(fingerprint, rows);
    }
    return rows;
}

MeasureResult FlowLayoutEngine::measure(const ProposedSize& proposal,
                                        const ItemCollection& items) {
    const std::vector<Row> rows = arrange_rows(proposal, items);

    MeasureResult result;
    result.min_size = items.empty() ? Size{} : ensure_min_size(items);
    result.fit_size = rows.empty() ? result.min_size : content_size(rows, proposal);

    std::ostringstream oss;
    oss << "fit " << result.fit_size.width << "x" << result.fit_size.height
        << " for " << describe(proposal);
    log(core::Severity::Debug, "measure", oss.str());
    return result;
}

std::vector<PlacedItem> FlowLayoutEngine::arrange(const Rect& bounds,
                                                  const ProposedSize& proposal,
                                                  const ItemCollection& items) {
    const std::vector<Row> rows = arrange_rows(proposal, items);
    UnitPoint anchor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        anchor = anchor_for(config_.alignment);
    }

    std::vector<PlacedItem> placed;
    placed.reserve(items.count);
    for (const auto& row : rows) {
        for (const auto& element : row.elements) {
            Point position = resolve_position(row, element, bounds.width, anchor);
            position.x += bounds.min_x();
            position.y += bounds.min_y();
            placed.push_back(PlacedItem{element.index, position, proposal});
        }
    }

    if (items.place) {
        for (const auto& item : placed) {
            items.place(item.index, item.position, item.proposal);
        }
    }
    return placed;
}

} // namespace wrapflow::layout
