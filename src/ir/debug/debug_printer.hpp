#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "ir/ir.hpp"

namespace ir::debug {

/**
 * @brief Renders IR terms in their canonical one-line debug form.
 *
 * Item ids are resolved through the program installed on the calling thread
 * (see ProgramContext); without one they print as `ItemId { index: N }`.
 * Rendering never fails on its own and writes nothing but the given stream.
 * Stream failures surface the way the stream is configured to report them.
 */
class IrDebugPrinter {
public:
    explicit IrDebugPrinter(std::ostream& out) : out_(out) {}

    // Names and atoms
    void print(ItemId id);
    void print(UniverseIndex universe);
    void print(QuantifierKind kind);
    void print(const TypeName& name);
    void print(const AssociatedType& assoc_ty);

    // Types and lifetimes
    void print(const Parameter& parameter);
    void print(const Ty& ty);
    void print(const QuantifiedTy& quantified_ty);
    void print(const Lifetime& lifetime);
    void print(const ApplicationTy& apply);
    void print(const TraitRef& trait_ref);
    void print(const ProjectionTy& projection);

    // Clauses and goals
    void print(const Normalize& normalize);
    void print(const WhereClause& clause);
    void print(const WhereClauseGoal& clause);
    void print(const Unify<Ty>& unify);
    void print(const Unify<Lifetime>& unify);
    void print(const Goal& goal);

private:
    // `Self as Trait<args...>`, shared by TraitRef and the Implemented clauses
    void print_implemented(const TraitRef& trait_ref);
    template<typename T>
    void print_unify(const Unify<T>& unify);
    void print_angle(std::vector<Parameter>::const_iterator first,
                     std::vector<Parameter>::const_iterator last);

    std::ostream& out_;
};

template<typename T>
std::string to_debug_string(const T& term) {
    std::ostringstream oss;
    IrDebugPrinter(oss).print(term);
    return oss.str();
}

} // namespace ir::debug

namespace ir {

// Streaming a term writes its debug form.
std::ostream& operator<<(std::ostream& out, ItemId id);
std::ostream& operator<<(std::ostream& out, UniverseIndex universe);
std::ostream& operator<<(std::ostream& out, QuantifierKind kind);
std::ostream& operator<<(std::ostream& out, const TypeName& name);
std::ostream& operator<<(std::ostream& out, const AssociatedType& assoc_ty);
std::ostream& operator<<(std::ostream& out, const Parameter& parameter);
std::ostream& operator<<(std::ostream& out, const Ty& ty);
std::ostream& operator<<(std::ostream& out, const QuantifiedTy& quantified_ty);
std::ostream& operator<<(std::ostream& out, const Lifetime& lifetime);
std::ostream& operator<<(std::ostream& out, const ApplicationTy& apply);
std::ostream& operator<<(std::ostream& out, const TraitRef& trait_ref);
std::ostream& operator<<(std::ostream& out, const ProjectionTy& projection);
std::ostream& operator<<(std::ostream& out, const Normalize& normalize);
std::ostream& operator<<(std::ostream& out, const WhereClause& clause);
std::ostream& operator<<(std::ostream& out, const WhereClauseGoal& clause);
std::ostream& operator<<(std::ostream& out, const Unify<Ty>& unify);
std::ostream& operator<<(std::ostream& out, const Unify<Lifetime>& unify);
std::ostream& operator<<(std::ostream& out, const Goal& goal);

} // namespace ir
