#include "holt_winters.hpp"
#include "optimizer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace hashcalc {
namespace forecast {

namespace {

double logistic(double x) { return 1.0 / (1.0 + std::exp(-x)); }
double logit(double p) { return std::log(p / (1.0 - p)); }

double mean_of(const std::vector<double>& y, size_t begin, size_t end) {
    double s = 0.0;
    for (size_t i = begin; i < end; ++i) s += y[i];
    return s / static_cast<double>(end - begin);
}

constexpr double MIN_SSE = 1e-12;

} // anonymous namespace

HoltWinters::HoltWinters(bool seasonal, int period)
    : seasonal_(seasonal), period_(period),
      alpha_(0.0), beta_(0.0), gamma_(0.0),
      level_(0.0), trend_(0.0), nobs_(0),
      residual_std_(0.0),
      aic_(std::numeric_limits<double>::infinity()),
      bic_(std::numeric_limits<double>::infinity()),
      init_level_(0.0), init_trend_(0.0) {}

void HoltWinters::initialize(const std::vector<double>& y) {
    if (seasonal_) {
        const size_t m = static_cast<size_t>(period_);
        double first = mean_of(y, 0, m);
        double second = mean_of(y, m, 2 * m);
        init_level_ = first;
        init_trend_ = (second - first) / static_cast<double>(m);
        init_season_.assign(m, 0.0);
        for (size_t i = 0; i < m; ++i) {
            init_season_[i] = y[i] - first;
        }
    } else {
        init_level_ = y[0];
        init_trend_ = y[1] - y[0];
        init_season_.clear();
    }
}

double HoltWinters::run(const std::vector<double>& y, double alpha, double beta, double gamma,
                        std::vector<double>* residuals) {
    double level = init_level_;
    double trend = init_trend_;
    std::vector<double> season = init_season_;
    double sse = 0.0;

    if (residuals) residuals->clear();

    for (size_t t = 0; t < y.size(); ++t) {
        double s = seasonal_ ? season[t % period_] : 0.0;
        double predicted = level + trend + s;
        double error = y[t] - predicted;
        sse += error * error;
        if (residuals) residuals->push_back(error);

        double new_level = alpha * (y[t] - s) + (1.0 - alpha) * (level + trend);
        trend = beta * (new_level - level) + (1.0 - beta) * trend;
        level = new_level;
        if (seasonal_) {
            season[t % period_] = gamma * (y[t] - level) + (1.0 - gamma) * s;
        }
    }

    level_ = level;
    trend_ = trend;
    season_ = season;
    return sse;
}

bool HoltWinters::fit(const std::vector<double>& y) {
    const size_t min_points = seasonal_ ? static_cast<size_t>(2 * period_) : 3;
    if (y.size() < min_points) {
        return false;
    }
    nobs_ = y.size();
    initialize(y);

    Objective objective = [this, &y](const std::vector<double>& x) {
        double g = seasonal_ ? logistic(x[2]) : 0.0;
        return run(y, logistic(x[0]), logistic(x[1]), g, nullptr);
    };

    std::vector<double> x0 = {logit(0.3), logit(0.1)};
    if (seasonal_) x0.push_back(logit(0.1));

    OptimizeResult opt = nelder_mead(objective, x0, 0.5);
    if (!std::isfinite(opt.value)) {
        return false;
    }

    alpha_ = logistic(opt.x[0]);
    beta_ = logistic(opt.x[1]);
    gamma_ = seasonal_ ? logistic(opt.x[2]) : 0.0;

    std::vector<double> residuals;
    double sse = std::max(run(y, alpha_, beta_, gamma_, &residuals), MIN_SSE);

    double mean_resid = mean_of(residuals, 0, residuals.size());
    double var = 0.0;
    for (double r : residuals) var += (r - mean_resid) * (r - mean_resid);
    residual_std_ = std::sqrt(var / static_cast<double>(residuals.size() - 1));

    // Smoothing weights plus initial level, trend and seasonal states
    const double n = static_cast<double>(nobs_);
    const double k = static_cast<double>(x0.size() + 2 + (seasonal_ ? period_ : 0));
    aic_ = n * std::log(sse / n) + 2.0 * k;
    bic_ = n * std::log(sse / n) + k * std::log(n);

    return std::isfinite(aic_) && std::isfinite(residual_std_);
}

std::vector<double> HoltWinters::forecast(int horizon) const {
    std::vector<double> out;
    out.reserve(horizon);
    for (int h = 1; h <= horizon; ++h) {
        double s = seasonal_ ? season_[(nobs_ + h - 1) % period_] : 0.0;
        out.push_back(level_ + h * trend_ + s);
    }
    return out;
}

} // namespace forecast
} // namespace hashcalc
