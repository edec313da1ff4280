/***
 * Name: tyflow::ty::kindName
 * Purpose: Stable lower-case name for each TyKind (logs and diagnostics).
 */
#include "ty/TyKind.h"

namespace tyflow::ty {

std::string_view kindName(TyKind k) {
    switch (k) {
        using enum TyKind;
        case Never: return "never";
        case Error: return "error";
        case Any: return "any";
        case Unknown: return "unknown";
        case Object: return "object";
        case Void: return "void";
        case Null: return "null";
        case Undefined: return "undefined";
        case String: return "string";
        case Number: return "number";
        case BigInt: return "bigint";
        case Symbol: return "symbol";
        case Boolean: return "boolean";
        case StringLiteral: return "string-literal";
        case NumericLiteral: return "numeric-literal";
        case BigIntLiteral: return "bigint-literal";
        case UniqueSymbol: return "unique-symbol";
        case BooleanLiteral: return "boolean-literal";
        case Union: return "union";
        case Record: return "record";
        case Function: return "function";
        case Constructor: return "constructor";
        case Interface: return "interface";
        case Intersection: return "intersection";
        case Namespace: return "namespace";
        case Generic: return "generic";
        case Intrinsic: return "intrinsic";
        case Instance: return "instance";
        case Unresolved: return "unresolved";
    }
    return "?";
}

} // namespace tyflow::ty
