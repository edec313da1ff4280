/***
 * Name: tyflow::analyzer::ScopeStack (definitions)
 * Purpose: Frame bookkeeping and pop-time merging.
 */
#include "analyzer/ScopeStack.h"

#include "tyflow/exceptions/invariant_error.h"

namespace tyflow::analyzer {

    /*** Name: ScopeStack::ScopeStack */
    ScopeStack::ScopeStack() { frames_.push_back(Scope{ScopeKind::Normal, {}, {}}); }

    /*** Name: ScopeStack::push */
    void ScopeStack::push(ScopeKind kind) { frames_.push_back(Scope{kind, {}, {}}); }

    /*** Name: ScopeStack::pop */
    std::size_t ScopeStack::pop(ty::TypeContext& types) {
        if (frames_.size() <= 1U) { throw exceptions::InvariantError("scope stack underflow: the root scope cannot be popped"); }
        Scope child = std::move(frames_.back());
        frames_.pop_back();
        Scope& parent = frames_.back();
        std::size_t merged = 0;
        for (const auto& [name, after] : child.bindings) {
            if (child.declared.contains(name)) continue; // block-local, dies with the frame
            const std::optional<ty::Ty> before = lookupBelow(frames_.size(), name);
            parent.bindings[name] = mergeBinding(child.kind, types, before, after);
            ++merged;
        }
        return merged;
    }

    /*** Name: ScopeStack::discard */
    void ScopeStack::discard() {
        if (frames_.size() <= 1U) { throw exceptions::InvariantError("scope stack underflow: the root scope cannot be discarded"); }
        frames_.pop_back();
    }

    /*** Name: ScopeStack::declare */
    void ScopeStack::declare(const std::string& name, const ty::Ty& ty) {
        Scope& top = frames_.back();
        top.declared.insert(name);
        top.bindings[name] = ty;
    }

    /*** Name: ScopeStack::assign */
    bool ScopeStack::assign(const std::string& name, const ty::Ty& ty) {
        if (!isDeclared(name)) return false;
        frames_.back().bindings[name] = ty;
        return true;
    }

    /*** Name: ScopeStack::lookup */
    std::optional<ty::Ty> ScopeStack::lookup(const std::string& name) const { return lookupBelow(frames_.size(), name); }

    /*** Name: ScopeStack::lookupBelow */
    std::optional<ty::Ty> ScopeStack::lookupBelow(std::size_t frameCount, const std::string& name) const {
        for (std::size_t i = frameCount; i > 0; --i) {
            const auto& bindings = frames_[i - 1].bindings;
            const auto it = bindings.find(name);
            if (it != bindings.end()) return it->second;
        }
        return std::nullopt;
    }

    /*** Name: ScopeStack::isDeclared */
    bool ScopeStack::isDeclared(const std::string& name) const {
        for (const auto& f : frames_) {
            if (f.declared.contains(name)) return true;
        }
        return false;
    }

} // namespace tyflow::analyzer
