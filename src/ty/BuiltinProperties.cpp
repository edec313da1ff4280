/***
 * Name: tyflow::ty::BuiltinProperties (definitions)
 * Purpose: Per-kind answers for a property read on one receiver type.
 */
#include "ty/BuiltinProperties.h"

#include "ty/Shapes.h"
#include "ty/TypeContext.h"
#include "ty/UnionType.h"
#include "tyflow/support/utf8.h"

namespace tyflow::ty {

    /*** Name: BuiltinProperties::getProperty */
    Ty BuiltinProperties::getProperty(const Ty& receiver, const PropertyKey& key) {
        const bool isName = key.kind == PropertyKey::Kind::Name;
        switch (receiver.kind()) {
            using enum TyKind;
            case Never:
            case Null:
            case Undefined:
            case Void:
                return Ty::of(Never);
            case Error:
            case Any:
            case Unknown:
                return receiver;
            case Generic:
            case Intrinsic:
                return Ty::of(Error);
            case Union:
                return types_.getUnionProperty(receiver.as<UnionType>(), key);
            case Instance:
                return getProperty(types_.unwrapGenericInstance(receiver.as<InstanceType>()), key);
            case Record:
                return slotType(receiver.as<RecordType>().find(key), Ty::of(Undefined));
            case Interface:
                return slotType(receiver.as<InterfaceType>().find(key), Ty::of(Unknown));
            case Namespace:
                return slotType(receiver.as<NamespaceType>().find(key), Ty::of(Unknown));
            case Intersection:
                return fromIntersection(receiver, key);
            case Function:
            case Constructor:
                return fromCallable(receiver, key);
            case String:
                return isName && key.name == "length" ? Ty::of(Number) : Ty::of(Unknown);
            case StringLiteral:
                if (isName && key.name == "length") {
                    const auto units = support::Utf16Length(receiver.atom());
                    return units ? Ty::numericLiteral(static_cast<double>(*units)) : Ty::of(Number);
                }
                return Ty::of(Unknown);
            default:
                return Ty::of(Unknown);
        }
    }

    /*** Name: BuiltinProperties::slotType */
    Ty BuiltinProperties::slotType(const PropertySlot* slot, const Ty& missing) {
        if (slot == nullptr) return missing;
        return types_.getOptionalType(slot->optional, slot->type);
    }

    // Exactly one member must define the key; otherwise the combined type is not modelled.
    Ty BuiltinProperties::fromIntersection(const Ty& receiver, const PropertyKey& key) {
        const PropertySlot* found = nullptr;
        for (const auto& m : receiver.as<IntersectionType>().members) {
            const PropertySlot* slot = nullptr;
            if (m.is(TyKind::Record)) {
                slot = m.as<RecordType>().find(key);
            } else if (m.is(TyKind::Interface)) {
                slot = m.as<InterfaceType>().find(key);
            }
            if (slot == nullptr) continue;
            if (found != nullptr) return Ty::of(TyKind::Unknown);
            found = slot;
        }
        return slotType(found, Ty::of(TyKind::Unknown));
    }

    /*** Name: BuiltinProperties::fromCallable */
    Ty BuiltinProperties::fromCallable(const Ty& receiver, const PropertyKey& key) {
        if (key.kind != PropertyKey::Kind::Name) return Ty::of(TyKind::Unknown);
        if (key.name == "length") {
            return Ty::numericLiteral(static_cast<double>(receiver.as<CallableType>().requiredParams()));
        }
        if (key.name == "name") return Ty::of(TyKind::String);
        return Ty::of(TyKind::Unknown);
    }

} // namespace tyflow::ty
