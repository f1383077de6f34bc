#include "optimizer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace hashcalc {
namespace forecast {

namespace {

constexpr double REFLECT = 1.0;
constexpr double EXPAND = 2.0;
constexpr double CONTRACT = 0.5;
constexpr double SHRINK = 0.5;

double safe_eval(const Objective& objective, const std::vector<double>& x) {
    double v = objective(x);
    return std::isfinite(v) ? v : std::numeric_limits<double>::max();
}

} // anonymous namespace

OptimizeResult nelder_mead(const Objective& objective,
                           const std::vector<double>& x0,
                           double initial_step,
                           int max_iterations,
                           double tolerance) {
    const size_t n = x0.size();
    OptimizeResult result;

    if (n == 0) {
        result.x = x0;
        result.value = objective(x0);
        result.iterations = 0;
        result.converged = std::isfinite(result.value);
        return result;
    }

    std::vector<std::vector<double>> simplex(n + 1, x0);
    for (size_t i = 0; i < n; ++i) {
        double step = (x0[i] != 0.0) ? initial_step * std::max(1.0, std::fabs(x0[i])) : initial_step;
        simplex[i + 1][i] += step;
    }

    std::vector<double> values(n + 1);
    for (size_t i = 0; i <= n; ++i) {
        values[i] = safe_eval(objective, simplex[i]);
    }

    std::vector<size_t> order(n + 1);
    int iteration = 0;
    bool converged = false;

    while (iteration < max_iterations) {
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(),
                  [&values](size_t a, size_t b) { return values[a] < values[b]; });

        const size_t best = order.front();
        const size_t worst = order.back();
        const size_t second_worst = order[n - 1];

        double spread = std::fabs(values[worst] - values[best]);
        if (spread <= tolerance * (std::fabs(values[best]) + tolerance)) {
            converged = true;
            break;
        }
        ++iteration;

        // Centroid of all points except the worst
        std::vector<double> centroid(n, 0.0);
        for (size_t i = 0; i <= n; ++i) {
            if (i == worst) continue;
            for (size_t j = 0; j < n; ++j) {
                centroid[j] += simplex[i][j];
            }
        }
        for (double& c : centroid) c /= static_cast<double>(n);

        auto along = [&](double coefficient) {
            std::vector<double> p(n);
            for (size_t j = 0; j < n; ++j) {
                p[j] = centroid[j] + coefficient * (simplex[worst][j] - centroid[j]);
            }
            return p;
        };

        std::vector<double> reflected = along(-REFLECT);
        double f_reflected = safe_eval(objective, reflected);

        if (f_reflected < values[best]) {
            std::vector<double> expanded = along(-EXPAND);
            double f_expanded = safe_eval(objective, expanded);
            if (f_expanded < f_reflected) {
                simplex[worst] = expanded;
                values[worst] = f_expanded;
            } else {
                simplex[worst] = reflected;
                values[worst] = f_reflected;
            }
            continue;
        }

        if (f_reflected < values[second_worst]) {
            simplex[worst] = reflected;
            values[worst] = f_reflected;
            continue;
        }

        bool outside = f_reflected < values[worst];
        std::vector<double> contracted = along(outside ? -CONTRACT : CONTRACT);
        double f_contracted = safe_eval(objective, contracted);
        if (f_contracted < (outside ? f_reflected : values[worst])) {
            simplex[worst] = contracted;
            values[worst] = f_contracted;
            continue;
        }

        for (size_t i = 0; i <= n; ++i) {
            if (i == best) continue;
            for (size_t j = 0; j < n; ++j) {
                simplex[i][j] = simplex[best][j] + SHRINK * (simplex[i][j] - simplex[best][j]);
            }
            values[i] = safe_eval(objective, simplex[i]);
        }
    }

    size_t best = static_cast<size_t>(
        std::min_element(values.begin(), values.end()) - values.begin());
    result.x = simplex[best];
    result.value = values[best];
    result.iterations = iteration;
    result.converged = converged && values[best] < std::numeric_limits<double>::max();
    return result;
}

} // namespace forecast
} // namespace hashcalc
