#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ir {

using Identifier = std::string;

struct ItemId {
    std::uint32_t index = 0;

    bool operator==(const ItemId& other) const { return index == other.index; }
    bool operator!=(const ItemId& other) const { return index != other.index; }
};

struct ItemIdHash {
    size_t operator()(const ItemId& id) const { return std::hash<std::uint32_t>()(id.index); }
};

struct UniverseIndex {
    std::uint32_t counter = 0;

    static UniverseIndex root() { return UniverseIndex{0}; }
    UniverseIndex next() const { return UniverseIndex{counter + 1}; }

    bool operator==(const UniverseIndex& other) const { return counter == other.counter; }
};

struct AssociatedType {
    ItemId trait_id;
    Identifier name;
};

// ItemId: declared item, UniverseIndex: skolemized `!n`, AssociatedType: `(Trait::Name)`
struct TypeName {
    std::variant<ItemId, UniverseIndex, AssociatedType> value;
};

/**
 * @brief Tags a slot as type-valued or lifetime-valued.
 *
 * Alternatives are selected by index so that T and L may be the same type
 * (see BinderKind).
 */
template<typename T, typename L>
struct ParameterKind {
    std::variant<T, L> value;

    static ParameterKind ty(T t) {
        return ParameterKind{std::variant<T, L>(std::in_place_index<0>, std::move(t))};
    }
    static ParameterKind lifetime(L l) {
        return ParameterKind{std::variant<T, L>(std::in_place_index<1>, std::move(l))};
    }

    bool is_ty() const { return value.index() == 0; }
    bool is_lifetime() const { return value.index() == 1; }

    const T& as_ty() const { return std::get<0>(value); }
    const L& as_lifetime() const { return std::get<1>(value); }
};

using BinderKind = ParameterKind<std::monostate, std::monostate>;

struct LifetimeVar {
    std::uint32_t depth = 0;
};

struct Lifetime {
    std::variant<LifetimeVar, UniverseIndex> value;
};

struct Ty;

using Parameter = ParameterKind<Ty, Lifetime>;

struct TyVar {
    std::uint32_t depth = 0;
};

struct ApplicationTy {
    TypeName name;
    std::vector<Parameter> parameters;
};

// parameters[0] is the Self type; never empty.
struct TraitRef {
    ItemId trait_id;
    std::vector<Parameter> parameters;
};

struct ProjectionTy {
    TraitRef trait_ref;
    Identifier name;
};

struct QuantifiedTy {
    std::uint32_t num_binders = 0;
    std::unique_ptr<Ty> ty;
};

struct Ty {
    std::variant<TyVar, ApplicationTy, ProjectionTy, QuantifiedTy> value;
};

template<typename T>
struct Unify {
    T a;
    T b;
};

struct Normalize {
    ProjectionTy projection;
    Ty ty;
};

// TraitRef alternative is `Implemented`.
struct WhereClause {
    std::variant<Normalize, TraitRef> value;
};

struct WhereClauseGoal {
    std::variant<Normalize, TraitRef, Unify<Ty>> value;
};

enum class QuantifierKind {
    ForAll,
    Exists,
};

struct Goal;

struct QuantifiedGoal {
    QuantifierKind kind = QuantifierKind::ForAll;
    BinderKind binder = BinderKind::ty({});
    std::unique_ptr<Goal> goal;
};

struct ImpliesGoal {
    WhereClause clause;
    std::unique_ptr<Goal> goal;
};

struct AndGoal {
    std::unique_ptr<Goal> left;
    std::unique_ptr<Goal> right;
};

struct Goal {
    std::variant<QuantifiedGoal, ImpliesGoal, AndGoal, WhereClauseGoal> value;
};

} // namespace ir
