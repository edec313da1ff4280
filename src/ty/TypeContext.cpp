/***
 * Name: tyflow::ty::TypeContext (definitions)
 * Purpose: Union-consuming façade over the builder and resolvers.
 */
#include "ty/TypeContext.h"

#include "observability/Metrics.h"
#include "ty/Shapes.h"
#include "ty/TypePrinter.h"

namespace tyflow::ty {

    /*** Name: TypeContext::TypeContext */
    TypeContext::TypeContext(TypeArena& arena, obs::Metrics* metrics)
        : arena_(&arena),
          metrics_(metrics),
          builtinProperties_(*this),
          substitution_(*this),
          properties_(&builtinProperties_),
          instances_(&substitution_) {}

    /*** Name: TypeContext::intoUnion */
    Ty TypeContext::intoUnion(const std::vector<Ty>& members) {
        switch (members.size()) {
            // Lattice bottom would be Never; callers rely on Undefined here.
            case 0: return Ty::of(TyKind::Undefined);
            case 1: return members.front();
            default: break;
        }
        UnionTypeBuilder builder;
        for (const auto& m : members) builder.add(*this, m);
        return finish(builder);
    }

    /*** Name: TypeContext::intoUnion(initializer_list) */
    Ty TypeContext::intoUnion(std::initializer_list<Ty> members) {
        return intoUnion(std::vector<Ty>(members));
    }

    /*** Name: TypeContext::getOptionalType */
    Ty TypeContext::getOptionalType(bool optional, const Ty& ty) {
        if (!optional) return ty;
        return intoUnion({Ty::of(TyKind::Undefined), ty});
    }

    /*** Name: TypeContext::getUnionProperty */
    Ty TypeContext::getUnionProperty(const UnionType& u, const PropertyKey& key) {
        UnionTypeBuilder builder;
        u.forEach([&](const Ty& member) { builder.add(*this, getProperty(member, key)); });
        return finish(builder);
    }

    /*** Name: TypeContext::printUnionType */
    std::unique_ptr<TypeSyntax> TypeContext::printUnionType(const UnionType& u) const {
        TypePrinter printer;
        return printer.printUnion(u);
    }

    /*** Name: TypeContext::getProperty */
    Ty TypeContext::getProperty(const Ty& receiver, const PropertyKey& key) {
        return properties_->getProperty(receiver, key);
    }

    /*** Name: TypeContext::unwrapGenericInstance */
    Ty TypeContext::unwrapGenericInstance(const InstanceType& instance) {
        if (metrics_ != nullptr) metrics_->incCounter("ty.instances_unwrapped");
        return instances_->unwrapGenericInstance(instance);
    }

    /*** Name: TypeContext::setPropertyResolver */
    void TypeContext::setPropertyResolver(PropertyResolver* resolver) {
        properties_ = resolver != nullptr ? resolver : &builtinProperties_;
    }

    /*** Name: TypeContext::setInstanceResolver */
    void TypeContext::setInstanceResolver(InstanceResolver* resolver) {
        instances_ = resolver != nullptr ? resolver : &substitution_;
    }

    /*** Name: TypeContext::finish */
    Ty TypeContext::finish(UnionTypeBuilder& builder) {
        const Ty out = builder.build(*arena_);
        if (metrics_ == nullptr) return out;
        switch (out.kind()) {
            case TyKind::Union: metrics_->incCounter("ty.unions_built"); break;
            case TyKind::Error: metrics_->incCounter("ty.escalations.error"); break;
            case TyKind::Any: metrics_->incCounter("ty.escalations.any"); break;
            case TyKind::Unknown: metrics_->incCounter("ty.escalations.unknown"); break;
            default: break;
        }
        return out;
    }

} // namespace tyflow::ty
