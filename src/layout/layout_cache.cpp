#include <wrapflow/layout/layout_cache.h>

#include <cstring>
#include <utility>

namespace wrapflow::layout {

namespace {

constexpr Fingerprint kFnvPrime = 0x100000001b3ULL;

} // namespace

void FingerprintBuilder::mix_bytes(const unsigned char* bytes, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
        hash_ ^= bytes[i];
        hash_ *= kFnvPrime;
    }
}

FingerprintBuilder& FingerprintBuilder::add(float value) {
    if (value == 0.0f) value = 0.0f;
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    unsigned char bytes[4];
    for (int i = 0; i < 4; ++i) {
        bytes[i] = static_cast<unsigned char>((bits >> (8 * i)) & 0xFFu);
    }
    mix_bytes(bytes, sizeof(bytes));
    return *this;
}

FingerprintBuilder& FingerprintBuilder::add(std::uint64_t value) {
    unsigned char bytes[8];
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFFu);
    }
    mix_bytes(bytes, sizeof(bytes));
    return *this;
}

Fingerprint compute_fingerprint(const ProposedSize& proposal, const std::vector<Size>& sizes) {
    FingerprintBuilder builder;
    builder.add(proposal.width.to_px_or_infinity())
           .add(proposal.height.to_px_or_infinity())
           .add(static_cast<std::uint64_t>(sizes.size()));
    for (const auto& size : sizes) {
        builder.add(size.width).add(size.height);
    }
    return builder.value();
}

const std::vector<Row>* LayoutCache::lookup(Fingerprint fingerprint) const {
    if (!entry_ || entry_->fingerprint != fingerprint) return nullptr;
    return &entry_->rows;
}

void LayoutCache::store(Fingerprint fingerprint, std::vector<Row> rows) {
    entry_ = Entry{fingerprint, std::move(rows)};
}

void LayoutCache::clear() {
    entry_.reset();
    min_size_.reset();
}

} // namespace wrapflow::layout
