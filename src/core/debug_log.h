/**
 * @file debug_log.h
 * @brief Compile-time switchable trace stream for the simulation
 *
 * PADDLEBALL_DBG accepts anything std::ostream does. Unless
 * PADDLEBALL_ENABLE_DEBUG_OUTPUT is defined (the PADDLEBALL_DEBUG_OUTPUT
 * CMake option) every insertion compiles to nothing, so traces can stay
 * in the per-tick paths. Warnings are not traces: they go to std::cerr.
 */

#pragma once

#include <ostream>

namespace paddleball {

/**
 * @brief Stream that discards every insertion, manipulators included
 */
struct NullStream {
    template<typename T>
    NullStream& operator<<(T const&) { return *this; }
    NullStream& operator<<(std::ostream& (*)(std::ostream&)) { return *this; }
};

} // namespace paddleball

#ifdef PADDLEBALL_ENABLE_DEBUG_OUTPUT
#include <iostream>
#define PADDLEBALL_DBG std::cout
#else
static paddleball::NullStream PADDLEBALL_DBG;
#endif
