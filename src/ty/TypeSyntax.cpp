/***
 * Name: tyflow::ty::renderTypeSyntax
 * Purpose: Render a TypeSyntax tree as annotation text.
 * Theory of Operation:
 *   Function and constructor signatures are parenthesised inside unions and
 *   intersections; unions are parenthesised inside intersections. An empty
 *   union renders as `never`.
 */
#include "ty/TypeSyntax.h"

#include <sstream>

namespace tyflow::ty {

namespace {

void render(std::ostringstream& out, const TypeSyntax& n);

bool needsParens(const TypeSyntax& child, TypeSyntaxKind parent) {
    const bool signature = child.kind == TypeSyntaxKind::Function || child.kind == TypeSyntaxKind::Constructor;
    if (parent == TypeSyntaxKind::Union) return signature;
    if (parent == TypeSyntaxKind::Intersection) return signature || child.kind == TypeSyntaxKind::Union;
    return false;
}

void renderQuoted(std::ostringstream& out, const std::string& text) {
    out << '"';
    for (const char c : text) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\t': out << "\\t"; break;
            default: out << c; break;
        }
    }
    out << '"';
}

void renderJoined(std::ostringstream& out, const TypeSyntax& n, const char* sep) {
    bool first = true;
    for (const auto& t : n.types) {
        if (!first) out << sep;
        first = false;
        const bool parens = needsParens(*t, n.kind);
        if (parens) out << '(';
        render(out, *t);
        if (parens) out << ')';
    }
}

void renderSignature(std::ostringstream& out, const TypeSyntax& n) {
    if (n.kind == TypeSyntaxKind::Constructor) out << "new ";
    out << '(';
    for (std::size_t i = 0; i < n.members.size(); ++i) {
        const auto& m = n.members[i];
        if (i != 0) out << ", ";
        out << m.name << (m.optional ? "?: " : ": ");
        render(out, *m.type);
    }
    out << ") => ";
    if (n.types.empty()) {
        out << "void";
    } else {
        render(out, *n.types.back());
    }
}

void render(std::ostringstream& out, const TypeSyntax& n) {
    switch (n.kind) {
        case TypeSyntaxKind::Keyword:
        case TypeSyntaxKind::NumberLiteral:
        case TypeSyntaxKind::BooleanLiteral:
        case TypeSyntaxKind::UniqueSymbol:
            out << n.text;
            break;
        case TypeSyntaxKind::BigIntLiteral:
            out << n.text << 'n';
            break;
        case TypeSyntaxKind::StringLiteral:
            renderQuoted(out, n.text);
            break;
        case TypeSyntaxKind::TypeLiteral:
            if (n.members.empty()) { out << "{}"; break; }
            out << "{ ";
            for (std::size_t i = 0; i < n.members.size(); ++i) {
                const auto& m = n.members[i];
                if (i != 0) out << "; ";
                out << m.name << (m.optional ? "?: " : ": ");
                render(out, *m.type);
            }
            out << " }";
            break;
        case TypeSyntaxKind::Function:
        case TypeSyntaxKind::Constructor:
            renderSignature(out, n);
            break;
        case TypeSyntaxKind::Reference:
            out << n.text;
            if (!n.types.empty()) {
                out << '<';
                renderJoined(out, n, ", ");
                out << '>';
            }
            break;
        case TypeSyntaxKind::Intersection:
            renderJoined(out, n, " & ");
            break;
        case TypeSyntaxKind::Union:
            if (n.types.empty()) { out << "never"; break; }
            renderJoined(out, n, " | ");
            break;
    }
}

} // namespace

std::string renderTypeSyntax(const TypeSyntax& node) {
    std::ostringstream out;
    render(out, node);
    return out.str();
}

} // namespace tyflow::ty
