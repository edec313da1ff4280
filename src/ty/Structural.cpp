/***
 * Name: tyflow::ty::detail structural walks (definitions)
 * Purpose: Deep equality with assumed pairs; depth-bounded hashing.
 */
#include "ty/detail/Structural.h"

#include "ty/TypeNode.h"
#include "ty/detail/HashCombine.h"

#include <algorithm>
#include <functional>

namespace tyflow::ty {

namespace detail {

    /*** Name: EqualityWalk::equal */
    bool EqualityWalk::equal(const Ty& a, const Ty& b) {
        if (a.kind() != b.kind()) return false;
        if (!isNodeKind(a.kind())) return a.identical(b);
        const TypeNode* na = a.node();
        const TypeNode* nb = b.node();
        if (na == nb) return true;

        const auto key = std::make_pair(na, nb);
        if (std::find(assumed_.begin(), assumed_.end(), key) != assumed_.end()) return true;
        assumed_.push_back(key);
        const bool same = na->sameShape(*nb, *this);
        assumed_.pop_back();
        return same;
    }

    /*** Name: HashWalk::hash */
    std::size_t HashWalk::hash(const Ty& ty) {
        if (!isNodeKind(ty.kind())) return ty.shallowHash();
        std::size_t seed = std::hash<int>{}(static_cast<int>(ty.kind()));
        if (depth_ >= kMaxDepth) return seed;
        ++depth_;
        hashCombine(seed, ty.node()->hashShape(*this));
        --depth_;
        return seed;
    }

} // namespace detail

    /*** Name: TypeNode::structuralHash */
    std::size_t TypeNode::structuralHash() const {
        detail::HashWalk walk;
        return hashShape(walk);
    }

    /*** Name: TypeNode::structurallyEquals */
    bool TypeNode::structurallyEquals(const TypeNode& other) const {
        if (this == &other) return true;
        if (kind() != other.kind()) return false;
        detail::EqualityWalk walk;
        return sameShape(other, walk);
    }

} // namespace tyflow::ty
