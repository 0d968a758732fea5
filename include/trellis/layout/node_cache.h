#pragma once
#include <trellis/core/config.h>
#include <trellis/core/diagnostics.h>
#include <trellis/layout/entity.h>
#include <trellis/layout/geometry.h>
#include <trellis/layout/geometry_changed.h>
#include <trellis/layout/layout_cache.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trellis::layout {

struct NodeCacheOptions {
    // Rows reserved up front; the cache still grows past this on demand.
    std::size_t initial_capacity = core::config::kDefaultInitialCapacity;
    // Non-owning. Receives register/remove events and strict-access errors.
    core::DiagnosticEmitter* diagnostics = nullptr;
    // Registering an entity with a larger index throws std::length_error.
    uint32_t max_index = core::config::kDefaultMaxIndex;
};

// One layout node's row.
struct NodeRecord {
    uint32_t generation = 0;
    bool live = false;

    // Computed outputs
    Rect rect;

    // Intermediate values
    Space space;
    Size size;

    float child_width_max = 0;
    float child_height_max = 0;
    float child_width_sum = 0;
    float child_height_sum = 0;

    float grid_row_max = 0;
    float grid_col_max = 0;

    float horizontal_free_space = 0;
    float horizontal_stretch_sum = 0;
    float vertical_free_space = 0;
    float vertical_stretch_sum = 0;

    bool stack_first_child = false;
    bool stack_last_child = false;

    GeometryChanged geometry_changed;
    bool visible = true;

    // Painting order; only present once the caller sets it.
    std::optional<std::size_t> layer;
};

// LayoutCache backed by a dense vector indexed by Entity::index. A row
// only answers to the exact generation it was registered with, so handles
// to a recycled slot behave as unregistered.
//
// Not thread-safe. One layout pass owns the cache at a time.
class NodeCache : public LayoutCache {
public:
    explicit NodeCache(NodeCacheOptions options = {});

    // Lifecycle
    void register_entity(Entity entity) override;
    bool remove_entity(Entity entity) override;
    bool contains(Entity entity) const;
    std::size_t size() const { return live_count_; }
    bool empty() const { return live_count_ == 0; }
    void clear();
    void reserve(std::size_t capacity);

    // Registered entities in ascending index order.
    std::vector<Entity> entities() const;

    // Output rectangle
    float posx(Entity entity) const override;
    float posy(Entity entity) const override;
    float width(Entity entity) const override;
    float height(Entity entity) const override;
    void set_posx(Entity entity, float value) override;
    void set_posy(Entity entity, float value) override;
    void set_width(Entity entity, float value) override;
    void set_height(Entity entity, float value) override;
    Rect rect(Entity entity) const;

    // Resolved space
    float left(Entity entity) const override;
    float right(Entity entity) const override;
    float top(Entity entity) const override;
    float bottom(Entity entity) const override;
    void set_left(Entity entity, float value) override;
    void set_right(Entity entity, float value) override;
    void set_top(Entity entity, float value) override;
    void set_bottom(Entity entity, float value) override;

    // Requested size
    float requested_width(Entity entity) const override;
    float requested_height(Entity entity) const override;
    void set_requested_width(Entity entity, float value) override;
    void set_requested_height(Entity entity, float value) override;

    // Child aggregates
    float child_width_max(Entity entity) const override;
    float child_height_max(Entity entity) const override;
    float child_width_sum(Entity entity) const override;
    float child_height_sum(Entity entity) const override;
    void set_child_width_max(Entity entity, float value) override;
    void set_child_height_max(Entity entity, float value) override;
    void set_child_width_sum(Entity entity, float value) override;
    void set_child_height_sum(Entity entity, float value) override;

    // Grid maxima
    float grid_row_max(Entity entity) const override;
    float grid_col_max(Entity entity) const override;
    void set_grid_row_max(Entity entity, float value) override;
    void set_grid_col_max(Entity entity, float value) override;

    // Free space and stretch
    float horizontal_free_space(Entity entity) const override;
    float horizontal_stretch_sum(Entity entity) const override;
    float vertical_free_space(Entity entity) const override;
    float vertical_stretch_sum(Entity entity) const override;
    void set_horizontal_free_space(Entity entity, float value) override;
    void set_horizontal_stretch_sum(Entity entity, float value) override;
    void set_vertical_free_space(Entity entity, float value) override;
    void set_vertical_stretch_sum(Entity entity, float value) override;

    // Stack markers
    bool stack_first_child(Entity entity) const override;
    bool stack_last_child(Entity entity) const override;
    void set_stack_first_child(Entity entity, bool value) override;
    void set_stack_last_child(Entity entity, bool value) override;

    // Visibility
    bool visible(Entity entity) const override;
    void set_visible(Entity entity, bool value) override;

    // Change tracking
    GeometryChanged geometry_changed(Entity entity) const override;
    void set_geometry_changed(Entity entity, GeometryFlag flag, bool value) override;
    void clear_geometry_changed(Entity entity);
    void clear_all_geometry_changed();
    // Registered entities with at least one change bit set, ascending index.
    std::vector<Entity> changed_entities() const;

    // Painting order
    std::optional<std::size_t> layer(Entity entity) const override;
    void set_layer(Entity entity, std::size_t layer) override;

private:
    const NodeRecord* find(Entity entity) const;
    NodeRecord* find(Entity entity);

    const NodeRecord& require(Entity entity, const char* field) const;
    NodeRecord& require(Entity entity, const char* field);
    [[noreturn]] void fail_unregistered(Entity entity, const char* field) const;

    bool logging(core::Severity severity) const;
    void log(core::Severity severity, const char* stage, Entity entity,
             const std::string& message) const;

    std::vector<NodeRecord> rows_;
    std::size_t live_count_ = 0;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    uint32_t max_index_ = core::config::kDefaultMaxIndex;
};

} // namespace trellis::layout
