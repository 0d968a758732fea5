#include <trellis/layout/layout_cache.h>

namespace trellis::layout {

UnregisteredEntityError::UnregisteredEntityError(Entity entity, const std::string& field)
    : std::logic_error("layout cache: '" + field + "' accessed for unregistered entity " +
                       to_string(entity)),
      entity_(entity),
      field_(field) {}

} // namespace trellis::layout
