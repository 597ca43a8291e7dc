#pragma once

#include "Definitions.h"

#include <string>
#include <utility>
#include <variant>

// ============================================================================
// Operand: what a user may pass to an operator constructor. Numbers are
// converted to Scalar leaves at the single entry point (toNode()).
// ============================================================================
class Operand {
public:
    Operand(NodePtr node) : value_(std::move(node)) {}
    Operand(double number) : value_(number) {}
    Operand(int number) : value_(static_cast<double>(number)) {}

    bool isNumber() const noexcept {
        return std::holds_alternative<double>(value_);
    }
    double number() const { return std::get<double>(value_); }

    // Scalar leaf for numbers; the handle itself (possibly null) otherwise
    NodePtr toNode() const;

    // Short description used in TypeError messages
    std::string typeName() const;

private:
    std::variant<NodePtr, double> value_;
};
