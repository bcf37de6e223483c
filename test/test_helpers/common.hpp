#pragma once

#include "gtest/gtest.h"
#include "ir/debug/debug_printer.hpp"
#include "ir/ir.hpp"
#include "ir/program.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace test::helpers {

/**
 * @brief Builders for IR terms.
 *
 * Terms are move-only, so argument lists are assembled from rvalues instead
 * of initializer lists.
 */

inline ir::Ty ty_var(std::uint32_t depth) {
    return ir::Ty{ir::TyVar{depth}};
}

inline ir::Lifetime lifetime_var(std::uint32_t depth) {
    return ir::Lifetime{ir::LifetimeVar{depth}};
}

inline ir::Lifetime lifetime_for_all(std::uint32_t counter) {
    return ir::Lifetime{ir::UniverseIndex{counter}};
}

inline ir::Parameter param(ir::Ty ty) {
    return ir::Parameter::ty(std::move(ty));
}

inline ir::Parameter param(ir::Lifetime lifetime) {
    return ir::Parameter::lifetime(std::move(lifetime));
}

template<typename... Args>
std::vector<ir::Parameter> params(Args&&... args) {
    std::vector<ir::Parameter> result;
    result.reserve(sizeof...(Args));
    (result.push_back(param(std::forward<Args>(args))), ...);
    return result;
}

inline ir::Ty apply(ir::TypeName name, std::vector<ir::Parameter> parameters = {}) {
    return ir::Ty{ir::ApplicationTy{std::move(name), std::move(parameters)}};
}

inline ir::Ty apply(ir::ItemId id, std::vector<ir::Parameter> parameters = {}) {
    return apply(ir::TypeName{id}, std::move(parameters));
}

inline ir::TraitRef trait_ref(ir::ItemId trait_id, std::vector<ir::Parameter> parameters) {
    return ir::TraitRef{trait_id, std::move(parameters)};
}

inline ir::ProjectionTy projection(ir::TraitRef trait_ref, std::string name) {
    return ir::ProjectionTy{std::move(trait_ref), std::move(name)};
}

inline ir::Ty for_all(std::uint32_t num_binders, ir::Ty ty) {
    return ir::Ty{ir::QuantifiedTy{num_binders, std::make_unique<ir::Ty>(std::move(ty))}};
}

inline ir::Normalize normalize(ir::ProjectionTy projection, ir::Ty ty) {
    return ir::Normalize{std::move(projection), std::move(ty)};
}

inline ir::Goal leaf(ir::WhereClauseGoal clause) {
    return ir::Goal{std::move(clause)};
}

inline ir::Goal implemented(ir::TraitRef trait_ref) {
    return leaf(ir::WhereClauseGoal{std::move(trait_ref)});
}

inline ir::Goal unify(ir::Ty a, ir::Ty b) {
    return leaf(ir::WhereClauseGoal{ir::Unify<ir::Ty>{std::move(a), std::move(b)}});
}

inline ir::Goal both(ir::Goal left, ir::Goal right) {
    return ir::Goal{ir::AndGoal{std::make_unique<ir::Goal>(std::move(left)),
                                std::make_unique<ir::Goal>(std::move(right))}};
}

inline ir::Goal implies(ir::WhereClause clause, ir::Goal goal) {
    return ir::Goal{ir::ImpliesGoal{std::move(clause), std::make_unique<ir::Goal>(std::move(goal))}};
}

inline ir::Goal quantified(ir::QuantifierKind kind, ir::BinderKind binder, ir::Goal goal) {
    return ir::Goal{ir::QuantifiedGoal{kind, binder, std::make_unique<ir::Goal>(std::move(goal))}};
}

/**
 * @brief Base fixture owning a small program: Vec, Clone, Iterator, PartialEq.
 */
class ProgramTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        vec_id = program.register_type({ir::TypeSort::Struct, "Vec", 1});
        clone_id = program.register_type({ir::TypeSort::Trait, "Clone", 0});
        iterator_id = program.register_type({ir::TypeSort::Trait, "Iterator", 0});
        partial_eq_id = program.register_type({ir::TypeSort::Trait, "PartialEq", 1});
    }

    ir::Program program;
    ir::ItemId vec_id;
    ir::ItemId clone_id;
    ir::ItemId iterator_id;
    ir::ItemId partial_eq_id;
};

} // namespace test::helpers
