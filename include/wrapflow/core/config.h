#pragma once

namespace wrapflow::core::config {

// Distance used between adjacent items when neither the engine configuration
// nor the host provides one.
inline constexpr float kDefaultItemSpacing = 8.0f;

// Module tag attached to every diagnostic emitted by the layout engine.
inline constexpr const char kLogModule[] = "flow_layout";

} // namespace wrapflow::core::config
