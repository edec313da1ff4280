/***
 * Name: tyflow::ty::UnionTypeBuilder (definitions)
 * Purpose: Escalation lattice and on-the-fly flattening.
 */
#include "ty/UnionTypeBuilder.h"

#include "ty/Shapes.h"

#include <vector>

namespace tyflow::ty {

    /*** Name: UnionTypeBuilder::add */
    void UnionTypeBuilder::add(InstanceResolver& resolver, const Ty& ty) {
        if (isTerminal()) return;

        switch (ty.kind()) {
            using enum TyKind;
            case Error:
            case Generic:
            case Intrinsic:
            case Namespace:
                state_ = State::Error;
                compound_.reset();
                return;
            case Any:
                state_ = State::Any;
                compound_.reset();
                return;
            case Unknown:
                state_ = State::Unknown;
                compound_.reset();
                return;
            case Never:
                return;
            case Union:
                ty.as<UnionType>().forEach([&](const Ty& member) { add(resolver, member); });
                return;
            case Instance:
                add(resolver, resolver.unwrapGenericInstance(ty.as<InstanceType>()));
                return;
            default:
                break;
        }

        if (state_ == State::Never) {
            compound_ = std::make_unique<UnionType>();
            state_ = State::Compound;
        }
        compound_->add(ty);
    }

    /*** Name: UnionTypeBuilder::build */
    Ty UnionTypeBuilder::build(TypeArena& arena) {
        const State s = state_;
        state_ = State::Never;
        switch (s) {
            case State::Never: return Ty::of(TyKind::Never);
            case State::Error: return Ty::of(TyKind::Error);
            case State::Any: return Ty::of(TyKind::Any);
            case State::Unknown: return Ty::of(TyKind::Unknown);
            case State::Compound: break;
        }
        // A union that collapsed to one member is that member.
        const std::vector<Ty> members = compound_->members();
        if (members.size() == 1U) {
            compound_.reset();
            return members.front();
        }
        return Ty::node(arena.adopt(std::move(compound_)));
    }

} // namespace tyflow::ty
