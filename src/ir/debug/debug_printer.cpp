#include "ir/debug/debug_printer.hpp"

#include <optional>
#include <variant>

#include "ir/debug/angle.hpp"
#include "ir/program.hpp"
#include "utils/error.hpp"
#include "utils/overloaded.hpp"

namespace ir::debug {

namespace {

void require_self_parameter(const TraitRef& trait_ref) {
    if (trait_ref.parameters.empty()) {
        error_helper::report_contract_violation("TraitRef has no Self parameter");
    }
}

} // namespace

void IrDebugPrinter::print(ItemId id) {
    auto name = with_current_program([id](const Program* program) -> std::optional<Identifier> {
        if (!program) return std::nullopt;
        return program->name_of(id);
    });
    if (name) {
        out_ << *name;
        return;
    }
    out_ << "ItemId { index: " << id.index << " }";
}

void IrDebugPrinter::print(UniverseIndex universe) {
    out_ << "U" << universe.counter;
}

void IrDebugPrinter::print(QuantifierKind kind) {
    switch (kind) {
    case QuantifierKind::ForAll:
        out_ << "ForAll";
        return;
    case QuantifierKind::Exists:
        out_ << "Exists";
        return;
    }
    error_helper::report_contract_violation("Unknown quantifier kind");
}

void IrDebugPrinter::print(const TypeName& name) {
    std::visit(Overloaded{
        [this](ItemId id) { print(id); },
        [this](UniverseIndex universe) { out_ << "!" << universe.counter; },
        [this](const AssociatedType& assoc_ty) { print(assoc_ty); }
    }, name.value);
}

void IrDebugPrinter::print(const AssociatedType& assoc_ty) {
    out_ << "(";
    print(assoc_ty.trait_id);
    out_ << "::" << assoc_ty.name << ")";
}

void IrDebugPrinter::print(const Parameter& parameter) {
    if (parameter.is_ty()) {
        print(parameter.as_ty());
    } else {
        print(parameter.as_lifetime());
    }
}

void IrDebugPrinter::print(const Ty& ty) {
    std::visit(Overloaded{
        [this](const TyVar& var) { out_ << "?" << var.depth; },
        [this](const ApplicationTy& apply) { print(apply); },
        [this](const ProjectionTy& projection) { print(projection); },
        [this](const QuantifiedTy& quantified_ty) { print(quantified_ty); }
    }, ty.value);
}

void IrDebugPrinter::print(const QuantifiedTy& quantified_ty) {
    if (!quantified_ty.ty) {
        error_helper::report_missing_child("QuantifiedTy", "ty");
    }
    out_ << "for<" << quantified_ty.num_binders << "> ";
    print(*quantified_ty.ty);
}

void IrDebugPrinter::print(const Lifetime& lifetime) {
    std::visit(Overloaded{
        [this](const LifetimeVar& var) { out_ << "'?" << var.depth; },
        [this](UniverseIndex universe) { out_ << "'!" << universe.counter; }
    }, lifetime.value);
}

void IrDebugPrinter::print(const ApplicationTy& apply) {
    print(apply.name);
    print_angle(apply.parameters.begin(), apply.parameters.end());
}

void IrDebugPrinter::print(const TraitRef& trait_ref) {
    print_implemented(trait_ref);
}

void IrDebugPrinter::print(const ProjectionTy& projection) {
    out_ << "<";
    print(projection.trait_ref);
    out_ << ">::" << projection.name;
}

void IrDebugPrinter::print(const Normalize& normalize) {
    const TraitRef& trait_ref = normalize.projection.trait_ref;
    require_self_parameter(trait_ref);
    print(trait_ref.parameters.front());
    out_ << " as ";
    print(trait_ref.trait_id);

    // The projected name and its value go last, like `Iterator<Item = T>`.
    AngleList args(out_);
    for (auto it = trait_ref.parameters.begin() + 1; it != trait_ref.parameters.end(); ++it) {
        args.item([this, it]() { print(*it); });
    }
    args.item([this, &normalize]() {
        out_ << normalize.projection.name << " = ";
        print(normalize.ty);
    });
    args.finish();
}

void IrDebugPrinter::print(const WhereClause& clause) {
    std::visit(Overloaded{
        [this](const Normalize& normalize) { print(normalize); },
        [this](const TraitRef& implemented) { print_implemented(implemented); }
    }, clause.value);
}

void IrDebugPrinter::print(const WhereClauseGoal& clause) {
    std::visit(Overloaded{
        [this](const Normalize& normalize) { print(normalize); },
        [this](const TraitRef& implemented) { print_implemented(implemented); },
        [this](const Unify<Ty>& unify) { print(unify); }
    }, clause.value);
}

void IrDebugPrinter::print(const Unify<Ty>& unify) {
    print_unify(unify);
}

void IrDebugPrinter::print(const Unify<Lifetime>& unify) {
    print_unify(unify);
}

void IrDebugPrinter::print(const Goal& goal) {
    std::visit(Overloaded{
        [this](const QuantifiedGoal& quantified) {
            if (!quantified.goal) {
                error_helper::report_missing_child("QuantifiedGoal", "goal");
            }
            print(quantified.kind);
            out_ << (quantified.binder.is_ty() ? "<type>" : "<lifetime>") << " { ";
            print(*quantified.goal);
            out_ << " }";
        },
        [this](const ImpliesGoal& implies) {
            if (!implies.goal) {
                error_helper::report_missing_child("ImpliesGoal", "goal");
            }
            out_ << "if (";
            print(implies.clause);
            out_ << ") { ";
            print(*implies.goal);
            out_ << " }";
        },
        [this](const AndGoal& conjunction) {
            if (!conjunction.left || !conjunction.right) {
                error_helper::report_missing_child("AndGoal", conjunction.left ? "right" : "left");
            }
            out_ << "(";
            print(*conjunction.left);
            out_ << ", ";
            print(*conjunction.right);
            out_ << ")";
        },
        [this](const WhereClauseGoal& leaf) { print(leaf); }
    }, goal.value);
}

template<typename T>
void IrDebugPrinter::print_unify(const Unify<T>& unify) {
    out_ << "(";
    print(unify.a);
    out_ << " = ";
    print(unify.b);
    out_ << ")";
}

void IrDebugPrinter::print_implemented(const TraitRef& trait_ref) {
    require_self_parameter(trait_ref);
    print(trait_ref.parameters.front());
    out_ << " as ";
    print(trait_ref.trait_id);
    print_angle(trait_ref.parameters.begin() + 1, trait_ref.parameters.end());
}

void IrDebugPrinter::print_angle(std::vector<Parameter>::const_iterator first,
                                 std::vector<Parameter>::const_iterator last) {
    write_angle(out_, first, last, [this](const Parameter& parameter) { print(parameter); });
}

} // namespace ir::debug

namespace ir {

namespace {

template<typename T>
std::ostream& stream_term(std::ostream& out, const T& term) {
    debug::IrDebugPrinter(out).print(term);
    return out;
}

} // namespace

std::ostream& operator<<(std::ostream& out, ItemId id) { return stream_term(out, id); }
std::ostream& operator<<(std::ostream& out, UniverseIndex universe) { return stream_term(out, universe); }
std::ostream& operator<<(std::ostream& out, QuantifierKind kind) { return stream_term(out, kind); }
std::ostream& operator<<(std::ostream& out, const TypeName& name) { return stream_term(out, name); }
std::ostream& operator<<(std::ostream& out, const AssociatedType& assoc_ty) { return stream_term(out, assoc_ty); }
std::ostream& operator<<(std::ostream& out, const Parameter& parameter) { return stream_term(out, parameter); }
std::ostream& operator<<(std::ostream& out, const Ty& ty) { return stream_term(out, ty); }
std::ostream& operator<<(std::ostream& out, const QuantifiedTy& quantified_ty) { return stream_term(out, quantified_ty); }
std::ostream& operator<<(std::ostream& out, const Lifetime& lifetime) { return stream_term(out, lifetime); }
std::ostream& operator<<(std::ostream& out, const ApplicationTy& apply) { return stream_term(out, apply); }
std::ostream& operator<<(std::ostream& out, const TraitRef& trait_ref) { return stream_term(out, trait_ref); }
std::ostream& operator<<(std::ostream& out, const ProjectionTy& projection) { return stream_term(out, projection); }
std::ostream& operator<<(std::ostream& out, const Normalize& normalize) { return stream_term(out, normalize); }
std::ostream& operator<<(std::ostream& out, const WhereClause& clause) { return stream_term(out, clause); }
std::ostream& operator<<(std::ostream& out, const WhereClauseGoal& clause) { return stream_term(out, clause); }
std::ostream& operator<<(std::ostream& out, const Unify<Ty>& unify) { return stream_term(out, unify); }
std::ostream& operator<<(std::ostream& out, const Unify<Lifetime>& unify) { return stream_term(out, unify); }
std::ostream& operator<<(std::ostream& out, const Goal& goal) { return stream_term(out, goal); }

} // namespace ir
