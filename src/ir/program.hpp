#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ir/ir.hpp"

namespace ir {

enum class TypeSort {
    Struct,
    Trait,
};

struct TypeKind {
    TypeSort sort = TypeSort::Struct;
    Identifier name;
    std::uint32_t num_parameters = 0;
};

/**
 * @brief Maps item ids back to the names they were declared with.
 */
class Program {
public:
    ItemId register_type(TypeKind kind) {
        ItemId id{static_cast<std::uint32_t>(type_kinds.size())};
        type_ids.try_emplace(kind.name, id);
        type_kinds.emplace(id, std::move(kind));
        return id;
    }

    std::optional<ItemId> lookup(std::string_view name) const {
        auto it = type_ids.find(std::string(name));
        if (it != type_ids.end()) return it->second;
        return std::nullopt;
    }

    // nullptr if the id was never registered here
    const TypeKind* type_kind(ItemId id) const {
        auto it = type_kinds.find(id);
        return it != type_kinds.end() ? &it->second : nullptr;
    }

    std::optional<Identifier> name_of(ItemId id) const {
        if (const TypeKind* kind = type_kind(id)) {
            return kind->name;
        }
        return std::nullopt;
    }

    size_t size() const { return type_kinds.size(); }

private:
    std::unordered_map<Identifier, ItemId> type_ids;
    std::unordered_map<ItemId, TypeKind, ItemIdHash> type_kinds;
};

/**
 * @brief Per-thread stack of installed programs.
 *
 * The innermost installation still alive is the current program. A Guard
 * owns exactly the entry it pushed: releasing guards out of order removes
 * that entry from the middle of the stack and leaves the inner ones current.
 */
class ProgramContext {
public:
    class Guard {
    public:
        Guard(ProgramContext& ctx, const Program& program)
            : ctx_(&ctx), program_(&program) {
            ctx_->push_program(program);
        }

        Guard(Guard&& other) noexcept
            : ctx_(other.ctx_), program_(other.program_) {
            other.program_ = nullptr;
        }

        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        ~Guard() {
            if (program_) {
                ctx_->remove_program(*program_);
            }
        }

        const Program& program() const { return *program_; }

    private:
        ProgramContext* ctx_;
        const Program* program_;  // null once moved from
    };

    static ProgramContext& instance() {
        static ProgramContext ctx;
        return ctx;
    }

    [[nodiscard]] Guard install(const Program& program) {
        return Guard(*this, program);
    }

    const Program* current() const {
        return stack_.empty() ? nullptr : stack_.back();
    }

    size_t depth() const { return stack_.size(); }

private:
    void push_program(const Program& program);
    // Removes the innermost entry for `program`.
    void remove_program(const Program& program);

    inline static thread_local std::vector<const Program*> stack_{};
};

[[nodiscard]] inline ProgramContext::Guard install_program(const Program& program) {
    return ProgramContext::instance().install(program);
}

inline const Program* current_program() {
    return ProgramContext::instance().current();
}

// Calls f with the current program, or nullptr when none is installed.
template<typename F>
decltype(auto) with_current_program(F&& f) {
    return std::forward<F>(f)(current_program());
}

// Runs f with `program` installed; the previous binding is back once f exits.
template<typename F>
decltype(auto) with_program(const Program& program, F&& f) {
    auto guard = install_program(program);
    return std::forward<F>(f)();
}

} // namespace ir
