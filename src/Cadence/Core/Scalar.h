#pragma once

#include <cstdint>

using u32 = std::uint32_t;

// Sizes, indices and positions held in state and carried by actions/events.
using Count = u32;
