/***
 * Name: tyflow::ty::detail structural walks
 * Purpose: Deep structural equality and hashing over arena shapes.
 * Theory of Operation:
 *   EqualityWalk compares two types all the way down. Identical nodes are
 *   equal without looking inside. A node pair already being compared further
 *   up the walk is assumed equal, so cyclic shapes terminate and two
 *   unrollings of the same cycle compare equal.
 *   HashWalk hashes the unrolled shape down to a fixed depth. It never stops
 *   early on a revisited node: equal cyclic shapes of different lengths must
 *   still hash alike.
 */
#pragma once

#include "ty/Ty.h"

#include <cstddef>
#include <utility>
#include <vector>

namespace tyflow::ty::detail {

    class EqualityWalk {
    public:
        bool equal(const Ty& a, const Ty& b);

    private:
        std::vector<std::pair<const TypeNode*, const TypeNode*>> assumed_;
    };

    class HashWalk {
    public:
        static constexpr unsigned kMaxDepth = 6;

        std::size_t hash(const Ty& ty);

    private:
        unsigned depth_{0};
    };

} // namespace tyflow::ty::detail
