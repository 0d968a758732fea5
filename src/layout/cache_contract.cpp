#include <trellis/layout/cache_contract.h>
#include <trellis/core/config.h>

#include <array>
#include <functional>
#include <string>

namespace trellis::layout {

namespace {

using FloatGetter = float (LayoutCache::*)(Entity) const;
using FloatSetter = void (LayoutCache::*)(Entity, float);
using BoolGetter = bool (LayoutCache::*)(Entity) const;
using BoolSetter = void (LayoutCache::*)(Entity, bool);

struct FloatField {
    const char* name;
    FloatGetter get;
    FloatSetter set;
};

struct BoolField {
    const char* name;
    BoolGetter get;
    BoolSetter set;
};

const std::array<FloatField, 10> kTolerantFloats = {{
    {"posx", &LayoutCache::posx, &LayoutCache::set_posx},
    {"posy", &LayoutCache::posy, &LayoutCache::set_posy},
    {"width", &LayoutCache::width, &LayoutCache::set_width},
    {"height", &LayoutCache::height, &LayoutCache::set_height},
    {"left", &LayoutCache::left, &LayoutCache::set_left},
    {"right", &LayoutCache::right, &LayoutCache::set_right},
    {"top", &LayoutCache::top, &LayoutCache::set_top},
    {"bottom", &LayoutCache::bottom, &LayoutCache::set_bottom},
    {"requested_width", &LayoutCache::requested_width, &LayoutCache::set_requested_width},
    {"requested_height", &LayoutCache::requested_height, &LayoutCache::set_requested_height},
}};

const std::array<FloatField, 10> kStrictFloats = {{
    {"child_width_max", &LayoutCache::child_width_max, &LayoutCache::set_child_width_max},
    {"child_height_max", &LayoutCache::child_height_max, &LayoutCache::set_child_height_max},
    {"child_width_sum", &LayoutCache::child_width_sum, &LayoutCache::set_child_width_sum},
    {"child_height_sum", &LayoutCache::child_height_sum, &LayoutCache::set_child_height_sum},
    {"grid_row_max", &LayoutCache::grid_row_max, &LayoutCache::set_grid_row_max},
    {"grid_col_max", &LayoutCache::grid_col_max, &LayoutCache::set_grid_col_max},
    {"horizontal_free_space", &LayoutCache::horizontal_free_space,
     &LayoutCache::set_horizontal_free_space},
    {"horizontal_stretch_sum", &LayoutCache::horizontal_stretch_sum,
     &LayoutCache::set_horizontal_stretch_sum},
    {"vertical_free_space", &LayoutCache::vertical_free_space,
     &LayoutCache::set_vertical_free_space},
    {"vertical_stretch_sum", &LayoutCache::vertical_stretch_sum,
     &LayoutCache::set_vertical_stretch_sum},
}};

const std::array<BoolField, 2> kStrictBools = {{
    {"stack_first_child", &LayoutCache::stack_first_child, &LayoutCache::set_stack_first_child},
    {"stack_last_child", &LayoutCache::stack_last_child, &LayoutCache::set_stack_last_child},
}};

constexpr std::array<GeometryFlag, 4> kFlags = {
    GeometryFlag::PosX, GeometryFlag::PosY, GeometryFlag::Width, GeometryFlag::Height};

// True if every tolerant field reads back its unregistered default.
bool reads_tolerant_defaults(const LayoutCache& cache, Entity e, std::string& detail) {
    for (const auto& f : kTolerantFloats) {
        float v = (cache.*f.get)(e);
        if (v != 0.0f) {
            detail = std::string(f.name) + " returned " + std::to_string(v) + ", expected 0";
            return false;
        }
    }
    if (!cache.visible(e)) {
        detail = "visible returned false";
        return false;
    }
    if (cache.geometry_changed(e).any()) {
        detail = "geometry_changed returned " + cache.geometry_changed(e).to_string();
        return false;
    }
    if (auto layer = cache.layer(e)) {
        detail = "layer returned " + std::to_string(*layer) + ", expected none";
        return false;
    }
    return true;
}

// True if every strict read and write on `e` throws UnregisteredEntityError.
bool strict_access_throws(LayoutCache& cache, Entity e, std::string& detail) {
    auto expect_throw = [&](const std::string& name, const std::function<void()>& op) {
        try {
            op();
        } catch (const UnregisteredEntityError&) {
            return true;
        }
        detail = name + " did not fail for " + to_string(e);
        return false;
    };

    for (const auto& f : kStrictFloats) {
        if (!expect_throw(f.name, [&] { (void)(cache.*f.get)(e); })) return false;
        if (!expect_throw(std::string("set_") + f.name, [&] { (cache.*f.set)(e, 1.0f); })) {
            return false;
        }
    }
    for (const auto& f : kStrictBools) {
        if (!expect_throw(f.name, [&] { (void)(cache.*f.get)(e); })) return false;
        if (!expect_throw(std::string("set_") + f.name, [&] { (cache.*f.set)(e, true); })) {
            return false;
        }
    }
    return expect_throw("set_visible", [&] { cache.set_visible(e, false); });
}

// Writes a distinct value into every field of `e`.
void write_all(LayoutCache& cache, Entity e, float base) {
    float v = base;
    for (const auto& f : kTolerantFloats) (cache.*f.set)(e, v++);
    for (const auto& f : kStrictFloats) (cache.*f.set)(e, v++);
    for (const auto& f : kStrictBools) (cache.*f.set)(e, true);
    cache.set_visible(e, false);
    cache.set_geometry_changed(e, GeometryFlag::All, true);
    cache.set_layer(e, static_cast<std::size_t>(v));
}

// True if `e` holds exactly the registration defaults.
bool holds_registration_defaults(const LayoutCache& cache, Entity e, std::string& detail) {
    if (!reads_tolerant_defaults(cache, e, detail)) return false;
    for (const auto& f : kStrictFloats) {
        float v = (cache.*f.get)(e);
        if (v != 0.0f) {
            detail = std::string(f.name) + " returned " + std::to_string(v) + ", expected 0";
            return false;
        }
    }
    for (const auto& f : kStrictBools) {
        if ((cache.*f.get)(e)) {
            detail = std::string(f.name) + " returned true, expected false";
            return false;
        }
    }
    return true;
}

} // namespace

void add_layout_cache_contract(core::ContractValidator& validator, LayoutCacheFactory factory) {
    const std::string module = core::config::kContractModule;

    validator.add_check(module, "tolerant_defaults",
        "tolerant fields of an unregistered entity read 0, visible=true, nothing changed, no layer",
        [factory](std::string& detail) {
            auto cache = factory();
            return reads_tolerant_defaults(*cache, Entity{7}, detail);
        });

    validator.add_check(module, "registration_defaults",
        "register_entity initializes every field to its default",
        [factory](std::string& detail) {
            auto cache = factory();
            Entity e{0};
            cache->register_entity(e);
            return holds_registration_defaults(*cache, e, detail);
        });

    validator.add_check(module, "reregistration_resets",
        "registering a live entity again discards prior writes",
        [factory](std::string& detail) {
            auto cache = factory();
            Entity e{3};
            cache->register_entity(e);
            write_all(*cache, e, 5.0f);
            cache->register_entity(e);
            return holds_registration_defaults(*cache, e, detail);
        });

    validator.add_check(module, "strict_accessors_fail_fast",
        "accumulators, stack flags and set_visible throw for unregistered entities",
        [factory](std::string& detail) {
            auto cache = factory();
            return strict_access_throws(*cache, Entity{11}, detail);
        });

    validator.add_check(module, "tolerant_writes_ignored",
        "tolerant setters on an unregistered entity are silent no-ops",
        [factory](std::string& detail) {
            auto cache = factory();
            Entity e{2};
            for (const auto& f : kTolerantFloats) ((*cache).*f.set)(e, 42.0f);
            cache->set_geometry_changed(e, GeometryFlag::All, true);
            cache->set_layer(e, 3);
            return reads_tolerant_defaults(*cache, e, detail);
        });

    validator.add_check(module, "geometry_flag_independence",
        "setting or clearing one change flag leaves the others untouched",
        [factory](std::string& detail) {
            auto cache = factory();
            Entity e{1};
            cache->register_entity(e);
            for (auto flag : kFlags) {
                cache->set_geometry_changed(e, GeometryFlag::All, false);
                cache->set_geometry_changed(e, flag, true);
                if (cache->geometry_changed(e) != GeometryChanged(flag)) {
                    detail = "setting one flag produced " + cache->geometry_changed(e).to_string();
                    return false;
                }
                cache->set_geometry_changed(e, GeometryFlag::All, true);
                cache->set_geometry_changed(e, flag, false);
                auto expected = GeometryChanged(GeometryFlag::All);
                expected.set(flag, false);
                if (cache->geometry_changed(e) != expected) {
                    detail = "clearing one flag produced " + cache->geometry_changed(e).to_string();
                    return false;
                }
            }
            return true;
        });

    validator.add_check(module, "entity_isolation",
        "writes to one entity never change another",
        [factory](std::string& detail) {
            auto cache = factory();
            Entity a{0};
            Entity b{1};
            cache->register_entity(a);
            cache->register_entity(b);
            write_all(*cache, a, 100.0f);
            return holds_registration_defaults(*cache, b, detail);
        });

    validator.add_check(module, "stale_handle_unregistered",
        "a handle whose generation no longer matches behaves as unregistered",
        [factory](std::string& detail) {
            auto cache = factory();
            Entity old_handle{4, 1};
            Entity new_handle{4, 2};
            cache->register_entity(old_handle);
            cache->set_width(old_handle, 30.0f);
            cache->register_entity(new_handle);
            if (!reads_tolerant_defaults(*cache, old_handle, detail)) {
                detail = "stale handle: " + detail;
                return false;
            }
            if (!strict_access_throws(*cache, old_handle, detail)) return false;
            return holds_registration_defaults(*cache, new_handle, detail);
        });

    validator.add_check(module, "removal_forgets_entity",
        "remove_entity drops the row so the entity reads as unregistered",
        [factory](std::string& detail) {
            auto cache = factory();
            Entity e{5};
            cache->register_entity(e);
            write_all(*cache, e, 9.0f);
            if (!cache->remove_entity(e)) {
                detail = "remove_entity returned false for a registered entity";
                return false;
            }
            if (cache->remove_entity(e)) {
                detail = "remove_entity returned true twice";
                return false;
            }
            if (!reads_tolerant_defaults(*cache, e, detail)) return false;
            return strict_access_throws(*cache, e, detail);
        });
}

} // namespace trellis::layout
