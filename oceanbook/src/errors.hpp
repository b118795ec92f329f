#pragma once

#include <stdexcept>
#include <string>

namespace oceanbook {

// A caller broke a matching-core precondition (same-side match, cross-side comparison,
// overfill). Never recoverable: the book that raised it stops accepting work.
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what) : std::logic_error("contract violation: " + what) {}
};

// Raised by every operation on a book after a contract violation corrupted it
class BookHalted : public std::runtime_error {
public:
    explicit BookHalted(const std::string& symbol) : std::runtime_error("order book halted: " + symbol) {}
};

} // namespace oceanbook
