#pragma once

#include "Errors.h"

#include <string>

// -----------------------------------------------------------------------------
// Smoothing of non-smooth operators (min / max / heaviside)
// -----------------------------------------------------------------------------
struct Smoothing {
    bool exact = true;
    double k = 10.0; // only used when !exact

    static Smoothing Exact() { return Smoothing{}; }
    static Smoothing Soft(double k) {
        if (!(k > 0.0))
            throw std::invalid_argument(
                "smoothing coefficient must be strictly positive");
        return Smoothing{false, k};
    }
};

// -----------------------------------------------------------------------------
// Settings threaded explicitly into the factories that need them
// -----------------------------------------------------------------------------
struct Settings {
    Smoothing min_smoothing{};
    Smoothing max_smoothing{};
    Smoothing heaviside_smoothing{};
    bool verbose = false;
};
