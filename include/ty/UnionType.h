/***
 * Name: tyflow::ty::UnionType
 * Purpose: Canonical, kind-partitioned member storage for a flattened union.
 * Inputs:
 *   - add(ty) for every member that survived UnionTypeBuilder filtering
 * Outputs:
 *   - forEach()/members(): the enumerated members in canonical order
 * Theory of Operation:
 *   Primitive kinds become flags or widen their LiteralAble slot; literals go
 *   into the slot; true/false fill the two halves of the boolean pair; shapes
 *   are deduplicated structurally; unresolved placeholders are appended as-is
 *   because two of them may still resolve to different types.
 *   A UnionType never holds another union. Any kind the builder should have
 *   filtered raises InvariantError.
 */
#pragma once

#include "ty/LiteralAble.h"
#include "ty/Ty.h"
#include "ty/TypeNode.h"

#include <cstddef>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tyflow::ty {

    class UnionType final : public TypeNode {
    public:
        UnionType() : TypeNode(TyKind::Union) {}

        void add(const Ty& ty);

        /***
         * Name: UnionType::forEach
         * Purpose: Visit every member once, in canonical order.
         * Theory of Operation:
         *   string, number, bigint, symbol slots; object, void, null, undefined
         *   flags; the boolean pair; the complex set; unresolved members in
         *   insertion order.
         */
        template <typename Visit>
        void forEach(Visit&& visit) const {
            string_.forEach(Ty::of(TyKind::String), [](std::string_view s) { return Ty::stringLiteral(s); }, visit);
            number_.forEach(Ty::of(TyKind::Number), [](const NumberValue& n) { return Ty::numericLiteral(n.value); }, visit);
            bigint_.forEach(Ty::of(TyKind::BigInt), [](std::string_view b) { return Ty::bigintLiteral(b); }, visit);
            symbol_.forEach(Ty::of(TyKind::Symbol), [](SymbolId s) { return Ty::uniqueSymbol(s); }, visit);

            if (object_) visit(Ty::of(TyKind::Object));
            if (void_) visit(Ty::of(TyKind::Void));
            if (null_) visit(Ty::of(TyKind::Null));
            if (undefined_) visit(Ty::of(TyKind::Undefined));

            if (boolean_.first && boolean_.second) {
                visit(Ty::of(TyKind::Boolean));
            } else if (boolean_.first) {
                visit(Ty::booleanLiteral(true));
            } else if (boolean_.second) {
                visit(Ty::booleanLiteral(false));
            }

            for (const auto& c : complex_) visit(c);
            for (const auto& u : unresolved_) visit(u);
        }

        // Materialised forEach; restartable.
        std::vector<Ty> members() const;

        // Membership equality; complex order is not compared.
        bool sameMembers(const UnionType& other) const;

        // (has_true, has_false)
        std::pair<bool, bool> booleanPair() const { return boolean_; }
        const LiteralAble<std::string_view>& strings() const { return string_; }
        const LiteralAble<NumberValue>& numbers() const { return number_; }
        std::size_t complexCount() const { return complex_.size(); }
        std::size_t unresolvedCount() const { return unresolved_.size(); }

        std::size_t hashShape(detail::HashWalk& walk) const override;
        bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const override;

    private:
        LiteralAble<std::string_view> string_;
        LiteralAble<NumberValue> number_;
        LiteralAble<std::string_view> bigint_;
        LiteralAble<SymbolId> symbol_;

        bool object_{false};
        bool void_{false};
        bool null_{false};
        bool undefined_{false};
        std::pair<bool, bool> boolean_{false, false};

        std::unordered_set<Ty> complexIndex_;
        std::vector<Ty> complex_;
        std::vector<Ty> unresolved_;
    };

} // namespace tyflow::ty
