#include "storage/locked_map.hpp"

#include <string>

namespace cowmap {

template class LockedMap<std::string>;

} // namespace cowmap
