#include "storage/copy_on_write_map.hpp"

#include <string>

namespace cowmap {

// The string-valued map is what the stress tool and most callers use; build
// it once here instead of in every translation unit.
template class CopyOnWriteMap<std::string>;

} // namespace cowmap
