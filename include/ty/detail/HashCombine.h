/***
 * Name: tyflow::ty::detail::hashCombine
 * Purpose: Mix a value hash into a running seed.
 */
#pragma once

#include <cstddef>

namespace tyflow::ty::detail {

inline void hashCombine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U);
}

} // namespace tyflow::ty::detail
