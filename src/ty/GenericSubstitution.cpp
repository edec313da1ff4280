/***
 * Name: tyflow::ty::GenericSubstitution (definitions)
 * Purpose: Replace generic parameter placeholders with instance arguments.
 */
#include "ty/GenericSubstitution.h"

#include "ty/Shapes.h"
#include "ty/TypeContext.h"
#include "ty/UnionType.h"
#include "ty/UnionTypeBuilder.h"

#include <unordered_set>

namespace tyflow::ty {

namespace {

using Bindings = std::unordered_map<const UnresolvedType*, Ty>;

// Visits the Ty members directly referenced by one node.
template <typename F>
void forEachChild(const Ty& ty, F&& f) {
    switch (ty.kind()) {
        case TyKind::Union:
            ty.as<UnionType>().forEach(f);
            break;
        case TyKind::Record:
            for (const auto& p : ty.as<RecordType>().properties) f(p.type);
            break;
        case TyKind::Interface:
            for (const auto& p : ty.as<InterfaceType>().properties) f(p.type);
            break;
        case TyKind::Namespace:
            for (const auto& p : ty.as<NamespaceType>().members) f(p.type);
            break;
        case TyKind::Function:
        case TyKind::Constructor:
            for (const auto& p : ty.as<CallableType>().params) f(p.type);
            f(ty.as<CallableType>().returns);
            break;
        case TyKind::Intersection:
            for (const auto& m : ty.as<IntersectionType>().members) f(m);
            break;
        case TyKind::Instance:
            for (const auto& a : ty.as<InstanceType>().args) f(a);
            break;
        default:
            break;
    }
}

bool mentionsAny(const Ty& ty, const Bindings& bindings, std::unordered_set<const TypeNode*>& visited) {
    if (!isNodeKind(ty.kind())) return false;
    if (ty.is(TyKind::Unresolved)) return bindings.contains(&ty.as<UnresolvedType>());
    if (!visited.insert(ty.node()).second) return false;
    bool found = false;
    forEachChild(ty, [&](const Ty& child) {
        if (!found) found = mentionsAny(child, bindings, visited);
    });
    return found;
}

bool mentionsAny(const Ty& ty, const Bindings& bindings) {
    std::unordered_set<const TypeNode*> visited;
    return mentionsAny(ty, bindings, visited);
}

} // namespace

/*** Name: GenericSubstitution::unwrapGenericInstance */
Ty GenericSubstitution::unwrapGenericInstance(const InstanceType& instance) {
    if (instance.generic == nullptr) return Ty::of(TyKind::Error);
    const GenericType& generic = *instance.generic;
    Bindings bindings;
    for (std::size_t i = 0; i < generic.params.size(); ++i) {
        bindings[generic.params[i]] = i < instance.args.size() ? instance.args[i] : Ty::of(TyKind::Unknown);
    }
    Memo memo;
    return substitute(generic.body, bindings, memo);
}

/*** Name: GenericSubstitution::substitute */
Ty GenericSubstitution::substitute(const Ty& ty, const Bindings& bindings, Memo& memo) {
    if (!isNodeKind(ty.kind())) return ty;
    if (ty.is(TyKind::Unresolved)) {
        const auto it = bindings.find(&ty.as<UnresolvedType>());
        return it == bindings.end() ? ty : it->second;
    }
    if (const auto it = memo.find(ty.node()); it != memo.end()) return it->second;
    if (!mentionsAny(ty, bindings)) return ty;

    TypeArena& arena = types_.arena();
    switch (ty.kind()) {
        case TyKind::Union: {
            UnionTypeBuilder builder;
            ty.as<UnionType>().forEach([&](const Ty& m) { builder.add(types_, substitute(m, bindings, memo)); });
            const Ty out = types_.finish(builder);
            memo[ty.node()] = out;
            return out;
        }
        case TyKind::Record: {
            auto* copy = arena.alloc<RecordType>();
            memo[ty.node()] = Ty::node(copy);
            for (const auto& p : ty.as<RecordType>().properties) {
                copy->properties.push_back(PropertySlot{p.key, substitute(p.type, bindings, memo), p.optional});
            }
            return Ty::node(copy);
        }
        case TyKind::Interface: {
            const auto& src = ty.as<InterfaceType>();
            auto* copy = arena.alloc<InterfaceType>(src.name);
            memo[ty.node()] = Ty::node(copy);
            for (const auto& p : src.properties) {
                copy->properties.push_back(PropertySlot{p.key, substitute(p.type, bindings, memo), p.optional});
            }
            return Ty::node(copy);
        }
        case TyKind::Namespace: {
            const auto& src = ty.as<NamespaceType>();
            auto* copy = arena.alloc<NamespaceType>(src.name);
            memo[ty.node()] = Ty::node(copy);
            for (const auto& p : src.members) {
                copy->members.push_back(PropertySlot{p.key, substitute(p.type, bindings, memo), p.optional});
            }
            return Ty::node(copy);
        }
        case TyKind::Function:
        case TyKind::Constructor: {
            const auto& src = ty.as<CallableType>();
            auto* copy = arena.alloc<CallableType>(ty.kind());
            memo[ty.node()] = Ty::node(copy);
            for (const auto& p : src.params) {
                copy->params.push_back(ParamSlot{p.name, substitute(p.type, bindings, memo), p.optional});
            }
            copy->returns = substitute(src.returns, bindings, memo);
            return Ty::node(copy);
        }
        case TyKind::Intersection: {
            auto* copy = arena.alloc<IntersectionType>();
            memo[ty.node()] = Ty::node(copy);
            for (const auto& m : ty.as<IntersectionType>().members) {
                copy->members.push_back(substitute(m, bindings, memo));
            }
            return Ty::node(copy);
        }
        case TyKind::Instance: {
            const auto& src = ty.as<InstanceType>();
            auto* copy = arena.alloc<InstanceType>(src.generic);
            memo[ty.node()] = Ty::node(copy);
            for (const auto& a : src.args) copy->args.push_back(substitute(a, bindings, memo));
            return Ty::node(copy);
        }
        default:
            return ty;
    }
}

} // namespace tyflow::ty
