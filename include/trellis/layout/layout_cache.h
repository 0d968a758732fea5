#pragma once
#include <trellis/layout/entity.h>
#include <trellis/layout/geometry_changed.h>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace trellis::layout {

// Thrown when a solver-only field (accumulators, stack flags, visibility
// writes) is touched for an entity that was never registered, was removed,
// or whose handle is stale. Always indicates a defect in the caller.
class UnregisteredEntityError : public std::logic_error {
public:
    UnregisteredEntityError(Entity entity, const std::string& field);

    Entity entity() const { return entity_; }
    const std::string& field() const { return field_; }

private:
    Entity entity_;
    std::string field_;
};

// Storage the layout solver reads current geometry from and publishes new
// geometry to. The solver depends only on this interface.
//
// Two accessor families with different contracts:
//
//   Tolerant: posx/posy/width/height, left/right/top/bottom,
//   requested_width/requested_height, visible (read), geometry_changed,
//   layer.
//   Reads on an unregistered entity return a default (0, true, or "nothing
//   changed"); writes are silently ignored.
//
//   Strict: the child/grid/free-space/stretch accumulators, the stack
//   flags, and set_visible. Only the solver touches these, inside a
//   traversal where registration always comes first, so misuse throws
//   UnregisteredEntityError.
class LayoutCache {
public:
    virtual ~LayoutCache() = default;

    // Creates (or resets) the entity's row with every field at its default.
    // Throws std::invalid_argument for the null entity or a generation older
    // than the live row at that index.
    virtual void register_entity(Entity entity) = 0;
    // Drops the entity's row. Returns false if there was nothing to drop.
    virtual bool remove_entity(Entity entity) = 0;

    // Output rectangle
    virtual float posx(Entity entity) const = 0;
    virtual float posy(Entity entity) const = 0;
    virtual float width(Entity entity) const = 0;
    virtual float height(Entity entity) const = 0;
    virtual void set_posx(Entity entity, float value) = 0;
    virtual void set_posy(Entity entity, float value) = 0;
    virtual void set_width(Entity entity, float value) = 0;
    virtual void set_height(Entity entity, float value) = 0;

    // Resolved space
    virtual float left(Entity entity) const = 0;
    virtual float right(Entity entity) const = 0;
    virtual float top(Entity entity) const = 0;
    virtual float bottom(Entity entity) const = 0;
    virtual void set_left(Entity entity, float value) = 0;
    virtual void set_right(Entity entity, float value) = 0;
    virtual void set_top(Entity entity, float value) = 0;
    virtual void set_bottom(Entity entity, float value) = 0;

    // Requested size
    virtual float requested_width(Entity entity) const = 0;
    virtual float requested_height(Entity entity) const = 0;
    virtual void set_requested_width(Entity entity, float value) = 0;
    virtual void set_requested_height(Entity entity, float value) = 0;

    // Child aggregates (strict)
    virtual float child_width_max(Entity entity) const = 0;
    virtual float child_height_max(Entity entity) const = 0;
    virtual float child_width_sum(Entity entity) const = 0;
    virtual float child_height_sum(Entity entity) const = 0;
    virtual void set_child_width_max(Entity entity, float value) = 0;
    virtual void set_child_height_max(Entity entity, float value) = 0;
    virtual void set_child_width_sum(Entity entity, float value) = 0;
    virtual void set_child_height_sum(Entity entity, float value) = 0;

    // Grid maxima (strict)
    virtual float grid_row_max(Entity entity) const = 0;
    virtual float grid_col_max(Entity entity) const = 0;
    virtual void set_grid_row_max(Entity entity, float value) = 0;
    virtual void set_grid_col_max(Entity entity, float value) = 0;

    // Free space and stretch factors (strict)
    virtual float horizontal_free_space(Entity entity) const = 0;
    virtual float horizontal_stretch_sum(Entity entity) const = 0;
    virtual float vertical_free_space(Entity entity) const = 0;
    virtual float vertical_stretch_sum(Entity entity) const = 0;
    virtual void set_horizontal_free_space(Entity entity, float value) = 0;
    virtual void set_horizontal_stretch_sum(Entity entity, float value) = 0;
    virtual void set_vertical_free_space(Entity entity, float value) = 0;
    virtual void set_vertical_stretch_sum(Entity entity, float value) = 0;

    // Position-in-stack markers (strict)
    virtual bool stack_first_child(Entity entity) const = 0;
    virtual bool stack_last_child(Entity entity) const = 0;
    virtual void set_stack_first_child(Entity entity, bool value) = 0;
    virtual void set_stack_last_child(Entity entity, bool value) = 0;

    // Visibility: tolerant read (defaults to true), strict write
    virtual bool visible(Entity entity) const = 0;
    virtual void set_visible(Entity entity, bool value) = 0;

    // Change tracking (tolerant)
    virtual GeometryChanged geometry_changed(Entity entity) const = 0;
    virtual void set_geometry_changed(Entity entity, GeometryFlag flag, bool value) = 0;

    // Painting order (tolerant). Absent until set, and after registration.
    virtual std::optional<std::size_t> layer(Entity entity) const = 0;
    virtual void set_layer(Entity entity, std::size_t layer) = 0;
};

} // namespace trellis::layout
