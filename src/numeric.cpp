#include "numeric.hpp"
#include <cmath>
#include <stdexcept>

namespace retirecalc {

BisectionOptions::BisectionOptions()
    : tolerance(1.0), max_iterations(20) {}

BisectionOptions::BisectionOptions(double tol, int max_iter)
    : tolerance(tol), max_iterations(max_iter) {}

SearchResult bisect_increasing(
    const std::function<double(double)>& f,
    double target,
    double lo,
    double hi,
    const BisectionOptions& options)
{
    if (hi < lo) {
        throw std::invalid_argument("bisect_increasing: hi must not be below lo");
    }

    SearchResult result;
    result.x = 0.5 * (lo + hi);
    result.value = f(result.x);
    result.iterations = 0;
    result.converged = false;

    for (int i = 0; i < options.max_iterations; ++i) {
        const double mid = 0.5 * (lo + hi);
        const double value = f(mid);

        result.x = mid;
        result.value = value;
        result.iterations = i + 1;

        if (std::abs(value - target) < options.tolerance) {
            result.converged = true;
            break;
        }

        if (value < target) {
            lo = mid;
        } else {
            hi = mid;
        }
    }

    return result;
}

SearchResult ternary_minimize(
    const std::function<double(double)>& f,
    double lo,
    double hi,
    int iterations,
    double tolerance)
{
    if (hi < lo) {
        throw std::invalid_argument("ternary_minimize: hi must not be below lo");
    }

    for (int i = 0; i < iterations; ++i) {
        const double third = (hi - lo) / 3.0;
        const double m1 = lo + third;
        const double m2 = hi - third;

        if (f(m1) < f(m2)) {
            hi = m2;
        } else {
            lo = m1;
        }
    }

    SearchResult result;
    result.x = 0.5 * (lo + hi);
    result.value = f(result.x);
    result.iterations = iterations;
    result.converged = (hi - lo) < tolerance;
    return result;
}

} // namespace retirecalc
