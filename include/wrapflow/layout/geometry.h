#pragma once
#include <cmath>
#include <limits>
#include <optional>

namespace wrapflow::layout {

struct Size {
    float width = 0, height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
};

struct Point {
    float x = 0, y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

struct Rect {
    float x = 0, y = 0;
    float width = 0, height = 0;

    float min_x() const { return x; }
    float min_y() const { return y; }
};

enum class Axis {
    Horizontal,
    Vertical
};

// One axis of a size proposal: either a finite, non-negative length or
// unconstrained. Infinity only appears through to_px_or_infinity().
class Dimension {
public:
    // Negative and NaN lengths clamp to zero, +inf means unconstrained.
    static Dimension definite(float px) {
        if (std::isnan(px) || px < 0) return Dimension(0.0f);
        if (std::isinf(px)) return unconstrained();
        return Dimension(px);
    }
    static Dimension unconstrained() { return Dimension(); }

    bool is_definite() const { return value_.has_value(); }
    bool is_unconstrained() const { return !value_.has_value(); }

    float value_or(float fallback) const { return value_.value_or(fallback); }
    float to_px_or_infinity() const {
        return value_.value_or(std::numeric_limits<float>::infinity());
    }

    // True when `length` does not fit; an unconstrained axis fits everything.
    bool exceeded_by(float length) const { return value_ && length > *value_; }

    bool operator==(const Dimension& other) const { return value_ == other.value_; }
    bool operator!=(const Dimension& other) const { return !(*this == other); }

private:
    Dimension() = default;
    explicit Dimension(float px) : value_(px) {}

    std::optional<float> value_;
};

struct ProposedSize {
    Dimension width = Dimension::unconstrained();
    Dimension height = Dimension::unconstrained();

    static ProposedSize zero() { return definite(0, 0); }
    static ProposedSize unspecified() { return {}; }
    static ProposedSize definite(float w, float h) {
        return {Dimension::definite(w), Dimension::definite(h)};
    }

    bool operator==(const ProposedSize& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const ProposedSize& other) const { return !(*this == other); }
};

} // namespace wrapflow::layout
