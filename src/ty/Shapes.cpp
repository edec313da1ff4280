/***
 * Name: tyflow::ty shapes (definitions)
 * Purpose: Deep structural hash/equality and lookups for arena shapes.
 * Theory of Operation:
 *   Nested Ty members compare and hash through the walk, so two records are
 *   equal when their properties name the same keys in the same order and
 *   their types are structurally equal, however they were allocated.
 */
#include "ty/Shapes.h"

#include "ty/detail/HashCombine.h"
#include "ty/detail/Structural.h"

#include <algorithm>
#include <functional>

namespace tyflow::ty {

namespace {

std::size_t hashKey(const PropertyKey& key) {
    std::size_t seed = static_cast<std::size_t>(key.kind);
    if (key.kind == PropertyKey::Kind::Name) {
        detail::hashCombine(seed, std::hash<std::string>{}(key.name));
    } else {
        detail::hashCombine(seed, std::hash<SymbolId>{}(key.symbol));
    }
    return seed;
}

std::size_t hashSlots(const std::vector<PropertySlot>& slots, detail::HashWalk& walk) {
    std::size_t seed = slots.size();
    for (const auto& s : slots) {
        detail::hashCombine(seed, hashKey(s.key));
        detail::hashCombine(seed, walk.hash(s.type));
        detail::hashCombine(seed, s.optional ? 1U : 0U);
    }
    return seed;
}

bool sameSlots(const std::vector<PropertySlot>& a, const std::vector<PropertySlot>& b, detail::EqualityWalk& walk) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [&walk](const PropertySlot& x, const PropertySlot& y) {
        return x.key == y.key && x.optional == y.optional && walk.equal(x.type, y.type);
    });
}

const PropertySlot* findSlot(const std::vector<PropertySlot>& slots, const PropertyKey& key) {
    const auto it = std::find_if(slots.begin(), slots.end(), [&](const PropertySlot& s) { return s.key == key; });
    return it == slots.end() ? nullptr : &*it;
}

bool sameTypes(const std::vector<Ty>& a, const std::vector<Ty>& b, detail::EqualityWalk& walk) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [&walk](const Ty& x, const Ty& y) { return walk.equal(x, y); });
}

std::size_t hashTypes(const std::vector<Ty>& tys, detail::HashWalk& walk) {
    std::size_t seed = tys.size();
    for (const auto& t : tys) detail::hashCombine(seed, walk.hash(t));
    return seed;
}

} // namespace

/*** Name: RecordType::find */
const PropertySlot* RecordType::find(const PropertyKey& key) const { return findSlot(properties, key); }

/*** Name: RecordType::hashShape */
std::size_t RecordType::hashShape(detail::HashWalk& walk) const { return hashSlots(properties, walk); }

/*** Name: RecordType::sameShape */
bool RecordType::sameShape(const TypeNode& other, detail::EqualityWalk& walk) const {
    return sameSlots(properties, static_cast<const RecordType&>(other).properties, walk);
}

/*** Name: CallableType::CallableType */
CallableType::CallableType(TyKind kind) : TypeNode(kind) {}

/*** Name: CallableType::requiredParams */
std::size_t CallableType::requiredParams() const {
    return static_cast<std::size_t>(std::count_if(params.begin(), params.end(), [](const ParamSlot& p) { return !p.optional; }));
}

/*** Name: CallableType::hashShape */
std::size_t CallableType::hashShape(detail::HashWalk& walk) const {
    std::size_t seed = params.size();
    for (const auto& p : params) {
        detail::hashCombine(seed, walk.hash(p.type));
        detail::hashCombine(seed, p.optional ? 1U : 0U);
    }
    detail::hashCombine(seed, walk.hash(returns));
    return seed;
}

// Parameter names do not take part: (a: string) => void and (b: string) => void are one type.
bool CallableType::sameShape(const TypeNode& other, detail::EqualityWalk& walk) const {
    const auto& o = static_cast<const CallableType&>(other);
    if (!walk.equal(returns, o.returns)) return false;
    return std::equal(params.begin(), params.end(), o.params.begin(), o.params.end(), [&walk](const ParamSlot& x, const ParamSlot& y) {
        return x.optional == y.optional && walk.equal(x.type, y.type);
    });
}

/*** Name: InterfaceType::find */
const PropertySlot* InterfaceType::find(const PropertyKey& key) const { return findSlot(properties, key); }

/*** Name: InterfaceType::hashShape */
std::size_t InterfaceType::hashShape(detail::HashWalk& walk) const {
    std::size_t seed = std::hash<std::string>{}(name);
    detail::hashCombine(seed, hashSlots(properties, walk));
    return seed;
}

/*** Name: InterfaceType::sameShape */
bool InterfaceType::sameShape(const TypeNode& other, detail::EqualityWalk& walk) const {
    const auto& o = static_cast<const InterfaceType&>(other);
    return name == o.name && sameSlots(properties, o.properties, walk);
}

/*** Name: IntersectionType::hashShape */
std::size_t IntersectionType::hashShape(detail::HashWalk& walk) const { return hashTypes(members, walk); }

/*** Name: IntersectionType::sameShape */
bool IntersectionType::sameShape(const TypeNode& other, detail::EqualityWalk& walk) const {
    return sameTypes(members, static_cast<const IntersectionType&>(other).members, walk);
}

/*** Name: NamespaceType::find */
const PropertySlot* NamespaceType::find(const PropertyKey& key) const { return findSlot(members, key); }

/*** Name: NamespaceType::hashShape */
std::size_t NamespaceType::hashShape(detail::HashWalk& walk) const {
    std::size_t seed = std::hash<std::string>{}(name);
    detail::hashCombine(seed, hashSlots(members, walk));
    return seed;
}

/*** Name: NamespaceType::sameShape */
bool NamespaceType::sameShape(const TypeNode& other, detail::EqualityWalk& walk) const {
    const auto& o = static_cast<const NamespaceType&>(other);
    return name == o.name && sameSlots(members, o.members, walk);
}

/*** Name: UnresolvedType::hashShape */
std::size_t UnresolvedType::hashShape(detail::HashWalk&) const { return std::hash<std::uint32_t>{}(id()); }

/*** Name: UnresolvedType::sameShape */
bool UnresolvedType::sameShape(const TypeNode& other, detail::EqualityWalk&) const { return this == &other; }

/*** Name: GenericType::hashShape */
std::size_t GenericType::hashShape(detail::HashWalk&) const { return std::hash<std::uint32_t>{}(id()); }

/*** Name: GenericType::sameShape */
bool GenericType::sameShape(const TypeNode& other, detail::EqualityWalk&) const { return this == &other; }

/*** Name: IntrinsicType::hashShape */
std::size_t IntrinsicType::hashShape(detail::HashWalk&) const { return std::hash<std::string>{}(name); }

/*** Name: IntrinsicType::sameShape */
bool IntrinsicType::sameShape(const TypeNode& other, detail::EqualityWalk&) const {
    return name == static_cast<const IntrinsicType&>(other).name;
}

/*** Name: InstanceType::hashShape */
std::size_t InstanceType::hashShape(detail::HashWalk& walk) const {
    std::size_t seed = generic != nullptr ? generic->id() : 0U;
    detail::hashCombine(seed, hashTypes(args, walk));
    return seed;
}

/*** Name: InstanceType::sameShape */
bool InstanceType::sameShape(const TypeNode& other, detail::EqualityWalk& walk) const {
    const auto& o = static_cast<const InstanceType&>(other);
    return generic == o.generic && sameTypes(args, o.args, walk);
}

} // namespace tyflow::ty
