#pragma once

#include <stdexcept>

// An operand is neither a number nor a live node
struct TypeError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Children live on non-empty, unequal and non-broadcastable domains
struct DomainError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Numeric operands cannot be combined with the requested shapes
struct ShapeError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// The operation has no definition for this node (e.g. d/dx of A @ x, or
// evaluating a symbol that only makes sense after discretisation)
struct UnsupportedOperation : std::logic_error {
    using std::logic_error::logic_error;
};
