#ifndef HASHCALC_FORECAST_OPTIMIZER_HPP
#define HASHCALC_FORECAST_OPTIMIZER_HPP

#include <functional>
#include <vector>

namespace hashcalc {
namespace forecast {

using Objective = std::function<double(const std::vector<double>&)>;

struct OptimizeResult {
    std::vector<double> x;
    double value;
    int iterations;
    bool converged;
};

// Derivative-free Nelder-Mead simplex minimizer.
// Converges when the spread of objective values across the simplex falls
// below tolerance relative to the best value. A zero-dimensional start point
// is evaluated once and reported as converged.
OptimizeResult nelder_mead(const Objective& objective,
                           const std::vector<double>& x0,
                           double initial_step = 0.1,
                           int max_iterations = 5000,
                           double tolerance = 1e-9);

} // namespace forecast
} // namespace hashcalc

#endif // HASHCALC_FORECAST_OPTIMIZER_HPP
