#pragma once
#include <trellis/core/contract.h>
#include <trellis/layout/layout_cache.h>
#include <functional>
#include <memory>

namespace trellis::layout {

using LayoutCacheFactory = std::function<std::unique_ptr<LayoutCache>()>;

// Registers one check per clause of the LayoutCache contract under module
// core::config::kContractModule. Every check runs against a fresh cache
// from `factory`. Any LayoutCache implementation must pass all of them;
// the solver is written against exactly this behaviour.
void add_layout_cache_contract(core::ContractValidator& validator, LayoutCacheFactory factory);

} // namespace trellis::layout
