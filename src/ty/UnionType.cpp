/***
 * Name: tyflow::ty::UnionType (definitions)
 * Purpose: Classify incoming members into the canonical partitions.
 */
#include "ty/UnionType.h"

#include "ty/detail/Structural.h"
#include "tyflow/exceptions/invariant_error.h"

#include <algorithm>
#include <string>

namespace tyflow::ty {

    /*** Name: UnionType::add */
    void UnionType::add(const Ty& ty) {
        switch (ty.kind()) {
            using enum TyKind;
            case Void: void_ = true; break;
            case Null: null_ = true; break;
            case Undefined: undefined_ = true; break;
            case Object: object_ = true; break;

            case String: string_.setAny(); break;
            case Number: number_.setAny(); break;
            case BigInt: bigint_.setAny(); break;
            case Symbol: symbol_.setAny(); break;
            case Boolean: boolean_ = {true, true}; break;

            case StringLiteral: string_.add(ty.atom()); break;
            case NumericLiteral: number_.add(NumberValue{ty.numberValue()}); break;
            case BigIntLiteral: bigint_.add(ty.atom()); break;
            case UniqueSymbol: symbol_.add(ty.symbol()); break;
            case BooleanLiteral:
                if (ty.booleanValue()) { boolean_.first = true; } else { boolean_.second = true; }
                break;

            case Record:
            case Function:
            case Constructor:
            case Interface:
            case Intersection:
                if (complexIndex_.insert(ty).second) { complex_.push_back(ty); }
                break;

            case Unresolved: unresolved_.push_back(ty); break;

            default:
                throw exceptions::InvariantError(std::string("UnionType::add received a ") + std::string(kindName(ty.kind())) +
                                                 " member; it must be handled by UnionTypeBuilder");
        }
    }

    /*** Name: UnionType::members */
    std::vector<Ty> UnionType::members() const {
        std::vector<Ty> out;
        forEach([&out](const Ty& t) { out.push_back(t); });
        return out;
    }

    /*** Name: UnionType::sameMembers */
    bool UnionType::sameMembers(const UnionType& other) const {
        detail::EqualityWalk walk;
        return sameShape(other, walk);
    }

    // Commutative so that member order never changes the hash.
    std::size_t UnionType::hashShape(detail::HashWalk& walk) const {
        std::size_t acc = 0;
        forEach([&](const Ty& t) { acc += walk.hash(t); });
        return acc;
    }

    // Both complex lists are already deduplicated, so equal sizes plus
    // one-way containment is set equality.
    bool UnionType::sameShape(const TypeNode& node, detail::EqualityWalk& walk) const {
        const auto& other = static_cast<const UnionType&>(node);
        if (object_ != other.object_ || void_ != other.void_ || null_ != other.null_ || undefined_ != other.undefined_) return false;
        if (boolean_ != other.boolean_) return false;
        if (!string_.sameMembers(other.string_) || !number_.sameMembers(other.number_) ||
            !bigint_.sameMembers(other.bigint_) || !symbol_.sameMembers(other.symbol_)) {
            return false;
        }
        if (complex_.size() != other.complex_.size()) return false;
        for (const auto& mine : complex_) {
            const bool found = std::any_of(other.complex_.begin(), other.complex_.end(),
                                           [&](const Ty& theirs) { return walk.equal(mine, theirs); });
            if (!found) return false;
        }
        if (unresolved_.size() != other.unresolved_.size()) return false;
        for (std::size_t i = 0; i < unresolved_.size(); ++i) {
            if (!unresolved_[i].identical(other.unresolved_[i])) return false;
        }
        return true;
    }

} // namespace tyflow::ty
