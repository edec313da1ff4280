/***
 * Name: tyflow::ty::TypePrinter (definitions)
 * Purpose: Build annotation-syntax trees for types.
 */
#include "ty/TypePrinter.h"

#include "ty/Shapes.h"

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace tyflow::ty {

namespace {

std::unique_ptr<TypeSyntax> leaf(TypeSyntaxKind kind, std::string text) {
    auto n = std::make_unique<TypeSyntax>();
    n->kind = kind;
    n->text = std::move(text);
    return n;
}

std::unique_ptr<TypeSyntax> keyword(std::string_view text) { return leaf(TypeSyntaxKind::Keyword, std::string(text)); }

std::string formatNumber(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v < 0 ? "-Infinity" : "Infinity";
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), v);
    if (res.ec != std::errc{}) return std::to_string(v);
    return std::string(buf, res.ptr);
}

} // namespace

/*** Name: TypePrinter::print */
std::unique_ptr<TypeSyntax> TypePrinter::print(const Ty& ty) {
    switch (ty.kind()) {
        using enum TyKind;
        case Never:
        case Any:
        case Unknown:
        case Object:
        case Void:
        case Null:
        case Undefined:
        case String:
        case Number:
        case BigInt:
        case Symbol:
        case Boolean:
            return keyword(kindName(ty.kind()));
        case Error:
            return keyword("any");
        case StringLiteral:
            return leaf(TypeSyntaxKind::StringLiteral, std::string(ty.atom()));
        case NumericLiteral:
            return leaf(TypeSyntaxKind::NumberLiteral, formatNumber(ty.numberValue()));
        case BigIntLiteral:
            return leaf(TypeSyntaxKind::BigIntLiteral, std::string(ty.atom()));
        case BooleanLiteral:
            return leaf(TypeSyntaxKind::BooleanLiteral, ty.booleanValue() ? "true" : "false");
        case UniqueSymbol:
            return leaf(TypeSyntaxKind::UniqueSymbol, "unique symbol");
        case Union:
            return printUnion(ty.as<UnionType>());
        default:
            return printShape(ty);
    }
}

/*** Name: TypePrinter::printUnion */
std::unique_ptr<TypeSyntax> TypePrinter::printUnion(const UnionType& u) {
    auto out = std::make_unique<TypeSyntax>();
    out->kind = TypeSyntaxKind::Union;
    u.forEach([&](const Ty& member) { out->types.push_back(print(member)); });
    return out;
}

/*** Name: TypePrinter::printShape */
std::unique_ptr<TypeSyntax> TypePrinter::printShape(const Ty& ty) {
    const TypeNode* node = ty.node();
    if (!active_.insert(node).second) return keyword("any");

    auto out = std::make_unique<TypeSyntax>();
    const auto addMembers = [&](const std::vector<PropertySlot>& slots) {
        for (const auto& p : slots) out->members.push_back(TypeSyntaxMember{p.key.toString(), p.optional, print(p.type)});
    };
    switch (ty.kind()) {
        case TyKind::Record:
            out->kind = TypeSyntaxKind::TypeLiteral;
            addMembers(ty.as<RecordType>().properties);
            break;
        case TyKind::Interface:
            out->kind = TypeSyntaxKind::Reference;
            out->text = ty.as<InterfaceType>().name;
            break;
        case TyKind::Namespace:
            out->kind = TypeSyntaxKind::Reference;
            out->text = "typeof " + ty.as<NamespaceType>().name;
            break;
        case TyKind::Function:
        case TyKind::Constructor: {
            const auto& c = ty.as<CallableType>();
            out->kind = ty.is(TyKind::Function) ? TypeSyntaxKind::Function : TypeSyntaxKind::Constructor;
            for (const auto& p : c.params) out->members.push_back(TypeSyntaxMember{p.name, p.optional, print(p.type)});
            out->types.push_back(print(c.returns));
            break;
        }
        case TyKind::Intersection:
            out->kind = TypeSyntaxKind::Intersection;
            for (const auto& m : ty.as<IntersectionType>().members) out->types.push_back(print(m));
            break;
        case TyKind::Generic:
            out->kind = TypeSyntaxKind::Reference;
            out->text = ty.as<GenericType>().name;
            break;
        case TyKind::Intrinsic:
            out->kind = TypeSyntaxKind::Reference;
            out->text = ty.as<IntrinsicType>().name;
            break;
        case TyKind::Instance: {
            const auto& inst = ty.as<InstanceType>();
            out->kind = TypeSyntaxKind::Reference;
            out->text = inst.generic != nullptr ? inst.generic->name : "?";
            for (const auto& a : inst.args) out->types.push_back(print(a));
            break;
        }
        case TyKind::Unresolved:
            out->kind = TypeSyntaxKind::Reference;
            out->text = ty.as<UnresolvedType>().name;
            break;
        default:
            out = keyword("any");
            break;
    }
    active_.erase(node);
    return out;
}

/*** Name: typeToString */
std::string typeToString(const Ty& ty) {
    TypePrinter printer;
    return renderTypeSyntax(*printer.print(ty));
}

} // namespace tyflow::ty
