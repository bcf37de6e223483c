#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

namespace ir {

/**
 * @brief A term handed to the library breaks one of its structural invariants.
 *
 * This is a bug in whoever built the term. Nothing in the library catches it.
 */
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& message)
        : std::logic_error(message) {}
};

namespace error_helper {

[[noreturn]] inline void report_contract_violation(const std::string& message) {
    throw ContractViolation(message);
}

[[noreturn]] inline void report_missing_child(const char* owner, const char* field) {
    std::ostringstream oss;
    oss << owner << "::" << field << " is null";
    report_contract_violation(oss.str());
}

} // namespace error_helper

} // namespace ir
