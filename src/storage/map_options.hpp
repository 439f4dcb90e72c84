#pragma once

#include <cstddef>
#include <cstdint>

namespace cowmap {

// Sizing assumptions for a copy-on-write map.  Neither knob is enforced: a
// write that grows the map past max_keys still succeeds, it is only logged.
struct MapOptions {
    std::size_t   max_keys                  = 10000; // copy cost becomes prohibitive past this
    std::uint32_t expected_read_write_ratio = 1000;  // gets per put the design assumes
};

} // namespace cowmap
