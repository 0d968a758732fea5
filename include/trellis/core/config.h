#pragma once

#include <cstddef>
#include <cstdint>

namespace trellis::core::config {

// Rows reserved up front by a default-constructed NodeCache.
inline constexpr std::size_t kDefaultInitialCapacity = 64;

// Largest entity index a NodeCache accepts by default. Rows are dense, so
// this bounds the cache's memory regardless of the handles it is given.
inline constexpr std::uint32_t kDefaultMaxIndex = (1u << 20) - 1;

// Module name attached to every diagnostic the layout cache emits.
inline constexpr const char kDiagnosticsModule[] = "layout_cache";

// Module name under which cache contract checks are registered.
inline constexpr const char kContractModule[] = "layout_cache";

} // namespace trellis::core::config
