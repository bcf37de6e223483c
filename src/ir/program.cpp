#include "ir/program.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <iterator>

namespace ir {

void ProgramContext::push_program(const Program& program) {
    stack_.push_back(&program);
    if (std::getenv("DEBUG_IR_PROGRAM")) {
        std::cerr << "[IR DEBUG] installed program with " << program.size()
                  << " types (depth " << stack_.size() << ")\n";
    }
}

void ProgramContext::remove_program(const Program& program) {
    auto it = std::find(stack_.rbegin(), stack_.rend(), &program);
    if (it == stack_.rend()) {
        return;
    }
    bool was_current = it == stack_.rbegin();
    stack_.erase(std::next(it).base());
    if (std::getenv("DEBUG_IR_PROGRAM")) {
        std::cerr << "[IR DEBUG] " << (was_current ? "restored program binding" : "released outer program")
                  << " (depth " << stack_.size() << ")\n";
    }
}

} // namespace ir
