#ifndef RETIRECALC_NUMERIC_HPP
#define RETIRECALC_NUMERIC_HPP

#include <functional>

namespace retirecalc {

// Outcome of an iterative search. When converged is false, x is the best
// estimate available after max_iterations.
struct SearchResult {
    double x;
    double value;           // f(x)
    int iterations;
    bool converged;
};

struct BisectionOptions {
    double tolerance;       // Stop when |f(x) - target| < tolerance
    int max_iterations;

    BisectionOptions();
    BisectionOptions(double tol, int max_iter);
};

// Bisection for x in [lo, hi] with f(x) ~= target, assuming f is
// non-decreasing on the interval. Each iteration evaluates the midpoint and
// keeps the half that still brackets the target.
SearchResult bisect_increasing(
    const std::function<double(double)>& f,
    double target,
    double lo,
    double hi,
    const BisectionOptions& options = BisectionOptions()
);

// Ternary search for the minimum of a unimodal f on [lo, hi].
// Runs exactly `iterations` narrowing steps; returns the midpoint of the final
// interval. converged reports whether the final interval is below tolerance.
SearchResult ternary_minimize(
    const std::function<double(double)>& f,
    double lo,
    double hi,
    int iterations = 15,
    double tolerance = 1.0
);

} // namespace retirecalc

#endif // RETIRECALC_NUMERIC_HPP
