/***
 * Name: tyflow::ty::LiteralAble
 * Purpose: Per-kind widening lattice: Vacant -> Literals{...} -> Any.
 * Inputs:
 *   - add(literal): record one literal value of the kind
 *   - setAny(): widen to "any value of this primitive kind"
 * Outputs:
 *   - forEach(): the concrete types this slot currently stands for
 * Theory of Operation:
 *   Any absorbs every later add. Duplicate literals collapse through the hash
 *   index; the vector only remembers first-insertion order so that printing
 *   is stable. Membership, not order, is the observable contract.
 */
#pragma once

#include "ty/Ty.h"

#include <functional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tyflow::ty {

template <typename L, typename Hash = std::hash<L>>
class LiteralAble {
public:
    enum class State { Vacant, Literals, Any };

    void add(const L& literal) {
        switch (state_) {
            case State::Any:
                return;
            case State::Vacant:
                state_ = State::Literals;
                [[fallthrough]];
            case State::Literals:
                if (index_.insert(literal).second) { order_.push_back(literal); }
                return;
        }
    }

    void setAny() {
        state_ = State::Any;
        index_.clear();
        order_.clear();
    }

    State state() const { return state_; }
    bool isVacant() const { return state_ == State::Vacant; }
    bool isAny() const { return state_ == State::Any; }
    const std::vector<L>& literals() const { return order_; }

    // Nothing for Vacant, `any` for Any, ctor(literal) per distinct literal otherwise.
    template <typename Ctor, typename Visit>
    void forEach(const Ty& any, Ctor&& ctor, Visit&& visit) const {
        switch (state_) {
            case State::Vacant:
                break;
            case State::Any:
                visit(any);
                break;
            case State::Literals:
                for (const auto& lit : order_) { visit(ctor(lit)); }
                break;
        }
    }

    bool sameMembers(const LiteralAble& other) const {
        return state_ == other.state_ && index_ == other.index_;
    }

private:
    State state_{State::Vacant};
    std::unordered_set<L, Hash> index_;
    std::vector<L> order_;
};

} // namespace tyflow::ty
