/***
 * Name: tyflow::ty::TypeArena
 * Purpose: Pass-lifetime owner of every TypeNode, interned string and unique symbol.
 * Inputs:
 *   - alloc<T>(...) / adopt(unique_ptr<T>) for shapes, intern() for atoms.
 * Outputs:
 *   - Stable pointers and views valid until the arena is destroyed.
 * Theory of Operation:
 *   Nodes are never freed individually; the whole region goes away with the
 *   arena at the end of an analysis pass. Ids are dense and start at 1.
 */
#pragma once

#include "ty/Ty.h"
#include "ty/TypeNode.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tyflow::ty {

    class TypeArena {
    public:
        TypeArena() = default;
        TypeArena(const TypeArena&) = delete;
        TypeArena& operator=(const TypeArena&) = delete;

        template <typename T, typename... Args>
        T* alloc(Args&&... args) {
            return adopt(std::make_unique<T>(std::forward<Args>(args)...));
        }

        template <typename T>
        T* adopt(std::unique_ptr<T> node) {
            T* raw = node.get();
            raw->id_ = static_cast<std::uint32_t>(nodes_.size() + 1U);
            nodes_.push_back(std::move(node));
            return raw;
        }

        std::string_view intern(std::string_view text);

        SymbolId newSymbol() { return SymbolId{nextSymbol_++}; }

        std::size_t size() const { return nodes_.size(); }

    private:
        std::vector<std::unique_ptr<TypeNode>> nodes_;
        // Node-based set: element addresses survive rehashing.
        std::unordered_set<std::string> atoms_;
        std::uint32_t nextSymbol_{1};
    };

} // namespace tyflow::ty
