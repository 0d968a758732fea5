#include <trellis/layout/node_cache.h>

#include <stdexcept>

namespace trellis::layout {

NodeCache::NodeCache(NodeCacheOptions options)
    : diagnostics_(options.diagnostics), max_index_(options.max_index) {
    rows_.reserve(options.initial_capacity);
}

// ---------------------------------------------------------------------------
// Row lookup
// ---------------------------------------------------------------------------

const NodeRecord* NodeCache::find(Entity entity) const {
    if (entity.is_null() || entity.index >= rows_.size()) return nullptr;
    const NodeRecord& row = rows_[entity.index];
    if (!row.live || row.generation != entity.generation) return nullptr;
    return &row;
}

NodeRecord* NodeCache::find(Entity entity) {
    return const_cast<NodeRecord*>(static_cast<const NodeCache*>(this)->find(entity));
}

const NodeRecord& NodeCache::require(Entity entity, const char* field) const {
    const NodeRecord* row = find(entity);
    if (!row) fail_unregistered(entity, field);
    return *row;
}

NodeRecord& NodeCache::require(Entity entity, const char* field) {
    NodeRecord* row = find(entity);
    if (!row) fail_unregistered(entity, field);
    return *row;
}

void NodeCache::fail_unregistered(Entity entity, const char* field) const {
    log(core::Severity::Error, field, entity, "strict field accessed while unregistered");
    throw UnregisteredEntityError(entity, field);
}

bool NodeCache::logging(core::Severity severity) const {
    return diagnostics_ && diagnostics_->accepts(severity);
}

void NodeCache::log(core::Severity severity, const char* stage, Entity entity,
                    const std::string& message) const {
    if (logging(severity)) {
        diagnostics_->emit(severity, core::config::kDiagnosticsModule, stage,
                           entity.is_null() ? std::string() : to_string(entity), message);
    }
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void NodeCache::register_entity(Entity entity) {
    if (entity.is_null()) {
        log(core::Severity::Error, "register", entity, "cannot register the null entity");
        throw std::invalid_argument("layout cache: cannot register the null entity");
    }
    if (entity.index > max_index_) {
        log(core::Severity::Error, "register", entity,
            "index exceeds max_index " + std::to_string(max_index_));
        throw std::length_error("layout cache: entity " + to_string(entity) +
                                " exceeds max_index " + std::to_string(max_index_));
    }

    if (entity.index >= rows_.size()) {
        rows_.resize(static_cast<std::size_t>(entity.index) + 1);
    }

    NodeRecord& row = rows_[entity.index];
    if (row.live && entity.generation < row.generation) {
        log(core::Severity::Error, "register", entity,
            "stale handle, generation " + std::to_string(row.generation) + " is live");
        throw std::invalid_argument("layout cache: entity " + to_string(entity) +
                                    " is older than live generation " +
                                    std::to_string(row.generation));
    }

    if (row.live && row.generation == entity.generation) {
        log(core::Severity::Warning, "register", entity, "re-registered, fields reset");
    } else if (row.live) {
        if (logging(core::Severity::Warning)) {
            log(core::Severity::Warning, "register", entity,
                "replaces stale generation " + std::to_string(row.generation));
        }
    } else {
        ++live_count_;
        log(core::Severity::Debug, "register", entity, "registered");
    }

    row = NodeRecord{};
    row.generation = entity.generation;
    row.live = true;
}

bool NodeCache::remove_entity(Entity entity) {
    NodeRecord* row = find(entity);
    if (!row) return false;

    *row = NodeRecord{};
    --live_count_;
    log(core::Severity::Debug, "remove", entity, "removed");
    return true;
}

bool NodeCache::contains(Entity entity) const {
    return find(entity) != nullptr;
}

void NodeCache::clear() {
    if (logging(core::Severity::Info)) {
        log(core::Severity::Info, "clear", Entity::null(),
            std::to_string(live_count_) + " entities dropped");
    }
    rows_.clear();
    live_count_ = 0;
}

void NodeCache::reserve(std::size_t capacity) {
    rows_.reserve(capacity);
}

std::vector<Entity> NodeCache::entities() const {
    std::vector<Entity> result;
    result.reserve(live_count_);
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].live) {
            result.emplace_back(static_cast<uint32_t>(i), rows_[i].generation);
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// Tolerant family: Rect
// ---------------------------------------------------------------------------

float NodeCache::posx(Entity entity) const {
    if (auto* row = find(entity)) return row->rect.posx;
    return 0.0f;
}

float NodeCache::posy(Entity entity) const {
    if (auto* row = find(entity)) return row->rect.posy;
    return 0.0f;
}

float NodeCache::width(Entity entity) const {
    if (auto* row = find(entity)) return row->rect.width;
    return 0.0f;
}

float NodeCache::height(Entity entity) const {
    if (auto* row = find(entity)) return row->rect.height;
    return 0.0f;
}

void NodeCache::set_posx(Entity entity, float value) {
    if (auto* row = find(entity)) row->rect.posx = value;
}

void NodeCache::set_posy(Entity entity, float value) {
    if (auto* row = find(entity)) row->rect.posy = value;
}

void NodeCache::set_width(Entity entity, float value) {
    if (auto* row = find(entity)) row->rect.width = value;
}

void NodeCache::set_height(Entity entity, float value) {
    if (auto* row = find(entity)) row->rect.height = value;
}

Rect NodeCache::rect(Entity entity) const {
    if (auto* row = find(entity)) return row->rect;
    return Rect{};
}

// ---------------------------------------------------------------------------
// Tolerant family: Space
// ---------------------------------------------------------------------------

float NodeCache::left(Entity entity) const {
    if (auto* row = find(entity)) return row->space.left;
    return 0.0f;
}

float NodeCache::right(Entity entity) const {
    if (auto* row = find(entity)) return row->space.right;
    return 0.0f;
}

float NodeCache::top(Entity entity) const {
    if (auto* row = find(entity)) return row->space.top;
    return 0.0f;
}

float NodeCache::bottom(Entity entity) const {
    if (auto* row = find(entity)) return row->space.bottom;
    return 0.0f;
}

void NodeCache::set_left(Entity entity, float value) {
    if (auto* row = find(entity)) row->space.left = value;
}

void NodeCache::set_right(Entity entity, float value) {
    if (auto* row = find(entity)) row->space.right = value;
}

void NodeCache::set_top(Entity entity, float value) {
    if (auto* row = find(entity)) row->space.top = value;
}

void NodeCache::set_bottom(Entity entity, float value) {
    if (auto* row = find(entity)) row->space.bottom = value;
}

// ---------------------------------------------------------------------------
// Tolerant family: requested Size
// ---------------------------------------------------------------------------

float NodeCache::requested_width(Entity entity) const {
    if (auto* row = find(entity)) return row->size.width;
    return 0.0f;
}

float NodeCache::requested_height(Entity entity) const {
    if (auto* row = find(entity)) return row->size.height;
    return 0.0f;
}

void NodeCache::set_requested_width(Entity entity, float value) {
    if (auto* row = find(entity)) row->size.width = value;
}

void NodeCache::set_requested_height(Entity entity, float value) {
    if (auto* row = find(entity)) row->size.height = value;
}

// ---------------------------------------------------------------------------
// Strict family: accumulators
// ---------------------------------------------------------------------------

float NodeCache::child_width_max(Entity entity) const {
    return require(entity, "child_width_max").child_width_max;
}

float NodeCache::child_height_max(Entity entity) const {
    return require(entity, "child_height_max").child_height_max;
}

float NodeCache::child_width_sum(Entity entity) const {
    return require(entity, "child_width_sum").child_width_sum;
}

float NodeCache::child_height_sum(Entity entity) const {
    return require(entity, "child_height_sum").child_height_sum;
}

void NodeCache::set_child_width_max(Entity entity, float value) {
    require(entity, "set_child_width_max").child_width_max = value;
}

void NodeCache::set_child_height_max(Entity entity, float value) {
    require(entity, "set_child_height_max").child_height_max = value;
}

void NodeCache::set_child_width_sum(Entity entity, float value) {
    require(entity, "set_child_width_sum").child_width_sum = value;
}

void NodeCache::set_child_height_sum(Entity entity, float value) {
    require(entity, "set_child_height_sum").child_height_sum = value;
}

float NodeCache::grid_row_max(Entity entity) const {
    return require(entity, "grid_row_max").grid_row_max;
}

float NodeCache::grid_col_max(Entity entity) const {
    return require(entity, "grid_col_max").grid_col_max;
}

void NodeCache::set_grid_row_max(Entity entity, float value) {
    require(entity, "set_grid_row_max").grid_row_max = value;
}

void NodeCache::set_grid_col_max(Entity entity, float value) {
    require(entity, "set_grid_col_max").grid_col_max = value;
}

float NodeCache::horizontal_free_space(Entity entity) const {
    return require(entity, "horizontal_free_space").horizontal_free_space;
}

float NodeCache::horizontal_stretch_sum(Entity entity) const {
    return require(entity, "horizontal_stretch_sum").horizontal_stretch_sum;
}

float NodeCache::vertical_free_space(Entity entity) const {
    return require(entity, "vertical_free_space").vertical_free_space;
}

float NodeCache::vertical_stretch_sum(Entity entity) const {
    return require(entity, "vertical_stretch_sum").vertical_stretch_sum;
}

void NodeCache::set_horizontal_free_space(Entity entity, float value) {
    require(entity, "set_horizontal_free_space").horizontal_free_space = value;
}

void NodeCache::set_horizontal_stretch_sum(Entity entity, float value) {
    require(entity, "set_horizontal_stretch_sum").horizontal_stretch_sum = value;
}

void NodeCache::set_vertical_free_space(Entity entity, float value) {
    require(entity, "set_vertical_free_space").vertical_free_space = value;
}

void NodeCache::set_vertical_stretch_sum(Entity entity, float value) {
    require(entity, "set_vertical_stretch_sum").vertical_stretch_sum = value;
}

// ---------------------------------------------------------------------------
// Strict family: stack markers
// ---------------------------------------------------------------------------

bool NodeCache::stack_first_child(Entity entity) const {
    return require(entity, "stack_first_child").stack_first_child;
}

bool NodeCache::stack_last_child(Entity entity) const {
    return require(entity, "stack_last_child").stack_last_child;
}

void NodeCache::set_stack_first_child(Entity entity, bool value) {
    require(entity, "set_stack_first_child").stack_first_child = value;
}

void NodeCache::set_stack_last_child(Entity entity, bool value) {
    require(entity, "set_stack_last_child").stack_last_child = value;
}

// ---------------------------------------------------------------------------
// Visibility
// ---------------------------------------------------------------------------

bool NodeCache::visible(Entity entity) const {
    if (auto* row = find(entity)) return row->visible;
    return true;
}

void NodeCache::set_visible(Entity entity, bool value) {
    require(entity, "set_visible").visible = value;
}

// ---------------------------------------------------------------------------
// Change tracking
// ---------------------------------------------------------------------------

GeometryChanged NodeCache::geometry_changed(Entity entity) const {
    if (auto* row = find(entity)) return row->geometry_changed;
    return GeometryChanged{};
}

void NodeCache::set_geometry_changed(Entity entity, GeometryFlag flag, bool value) {
    if (auto* row = find(entity)) row->geometry_changed.set(flag, value);
}

void NodeCache::clear_geometry_changed(Entity entity) {
    if (auto* row = find(entity)) row->geometry_changed.clear();
}

void NodeCache::clear_all_geometry_changed() {
    for (auto& row : rows_) {
        row.geometry_changed.clear();
    }
}

std::vector<Entity> NodeCache::changed_entities() const {
    std::vector<Entity> result;
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        const NodeRecord& row = rows_[i];
        if (row.live && row.geometry_changed.any()) {
            result.emplace_back(static_cast<uint32_t>(i), row.generation);
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// Layer
// ---------------------------------------------------------------------------

std::optional<std::size_t> NodeCache::layer(Entity entity) const {
    if (auto* row = find(entity)) return row->layer;
    return std::nullopt;
}

void NodeCache::set_layer(Entity entity, std::size_t layer) {
    if (auto* row = find(entity)) row->layer = layer;
}

} // namespace trellis::layout
