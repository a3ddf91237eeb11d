#pragma once

#include <cstddef>

namespace recycling::core {

// Destructive interference size on the x86-64 and ARM64 targets we build for
static constexpr std::size_t CACHELINE_SIZE = 64;

// Keeps hot counters of different writers on separate cache lines
#define CACHE_ALIGNED alignas(::recycling::core::CACHELINE_SIZE)

}  // namespace recycling::core
