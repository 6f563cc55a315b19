#pragma once
#include <wrapflow/layout/geometry.h>
#include <wrapflow/layout/row.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace wrapflow::layout {

using Fingerprint = std::uint64_t;

// Incremental FNV-1a 64 over canonical float bit patterns, so equal inputs
// hash equally on every platform (-0.0 is folded into 0.0).
class FingerprintBuilder {
public:
    FingerprintBuilder& add(float value);
    FingerprintBuilder& add(std::uint64_t value);
    Fingerprint value() const { return hash_; }

private:
    void mix_bytes(const unsigned char* bytes, std::size_t n);

    Fingerprint hash_ = 0xcbf29ce484222325ULL;
};

// Key for one layout pass: the proposal, with unconstrained axes hashed as
// +infinity, followed by every measured item size in order.
Fingerprint compute_fingerprint(const ProposedSize& proposal, const std::vector<Size>& sizes);

// Single-slot cache owned by one engine instance. A lookup only succeeds for
// the exact fingerprint of the last stored pass.
class LayoutCache {
public:
    const std::vector<Row>* lookup(Fingerprint fingerprint) const;
    void store(Fingerprint fingerprint, std::vector<Row> rows);
    void invalidate() { entry_.reset(); }

    // Floor below which no arrangement is attempted; refreshed by the host
    // whenever the item collection changes.
    void set_min_size(Size size) { min_size_ = size; }
    const std::optional<Size>& min_size() const { return min_size_; }

    void clear();

private:
    struct Entry {
        Fingerprint fingerprint = 0;
        std::vector<Row> rows;
    };

    std::optional<Entry> entry_;
    std::optional<Size> min_size_;
};

} // namespace wrapflow::layout
