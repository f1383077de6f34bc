#include "arima.hpp"
#include "optimizer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace hashcalc {
namespace forecast {

namespace {

constexpr double TWO_PI = 6.283185307179586;
constexpr double MIN_SIGMA2 = 1e-12;

// (1 + sign*c1 B + sign*c2 B^2 ...) with coefficients spaced by `spacing`
std::vector<double> lag_polynomial(const std::vector<double>& coeffs, int spacing, double sign) {
    std::vector<double> poly(coeffs.size() * spacing + 1, 0.0);
    poly[0] = 1.0;
    for (size_t i = 0; i < coeffs.size(); ++i) {
        poly[(i + 1) * spacing] = sign * coeffs[i];
    }
    return poly;
}

std::vector<double> multiply(const std::vector<double>& a, const std::vector<double>& b) {
    std::vector<double> out(a.size() + b.size() - 1, 0.0);
    for (size_t i = 0; i < a.size(); ++i) {
        for (size_t j = 0; j < b.size(); ++j) {
            out[i + j] += a[i] * b[j];
        }
    }
    return out;
}

std::vector<double> difference(const std::vector<double>& x, int lag) {
    std::vector<double> out;
    for (size_t t = static_cast<size_t>(lag); t < x.size(); ++t) {
        out.push_back(x[t] - x[t - lag]);
    }
    return out;
}

} // anonymous namespace

std::string format_order(const ArimaOrder& order) {
    std::ostringstream oss;
    oss << "(" << order.p << "," << order.d << "," << order.q << ")";
    return oss.str();
}

std::string format_seasonal_order(const SeasonalOrder& order) {
    std::ostringstream oss;
    oss << "(" << order.P << "," << order.D << "," << order.Q << "," << order.period << ")";
    return oss.str();
}

bool is_stationary_ar(const std::vector<double>& phi) {
    std::vector<double> a = phi;
    for (size_t k = a.size(); k > 0; --k) {
        double r = a[k - 1];
        if (!std::isfinite(r) || std::fabs(r) >= 1.0) {
            return false;
        }
        std::vector<double> lower(k - 1);
        for (size_t j = 0; j + 1 < k; ++j) {
            lower[j] = (a[j] + r * a[k - 2 - j]) / (1.0 - r * r);
        }
        a = std::move(lower);
    }
    return true;
}

SarimaModel::SarimaModel(const ArimaOrder& order, const SeasonalOrder& seasonal)
    : order_(order), seasonal_(seasonal), fitted_(false),
      has_mean_(order.d == 0 && seasonal.D == 0), mean_(0.0),
      sigma2_(0.0), aic_(std::numeric_limits<double>::infinity()),
      bic_(std::numeric_limits<double>::infinity()), nobs_(0) {}

size_t SarimaModel::num_params() const {
    return static_cast<size_t>(order_.p + order_.q + seasonal_.P + seasonal_.Q) +
           (has_mean_ ? 1 : 0);
}

bool SarimaModel::is_stationary() const {
    return fitted_ && is_stationary_ar(phi_) && is_stationary_ar(seasonal_phi_);
}

std::string SarimaModel::name() const {
    return "SARIMA" + format_order(order_) + format_seasonal_order(seasonal_);
}

void SarimaModel::build_polynomials(const std::vector<double>& params) {
    size_t idx = has_mean_ ? 1 : 0;
    auto take = [&params, &idx](int count) {
        std::vector<double> v(params.begin() + idx, params.begin() + idx + count);
        idx += count;
        return v;
    };
    phi_ = take(order_.p);
    std::vector<double> theta = take(order_.q);
    seasonal_phi_ = take(seasonal_.P);
    std::vector<double> seasonal_theta = take(seasonal_.Q);

    ar_ = multiply(lag_polynomial(phi_, 1, -1.0),
                   lag_polynomial(seasonal_phi_, seasonal_.period, -1.0));
    ma_ = multiply(lag_polynomial(theta, 1, 1.0),
                   lag_polynomial(seasonal_theta, seasonal_.period, 1.0));
}

double SarimaModel::conditional_sse(const std::vector<double>& w,
                                    std::vector<double>* residuals) const {
    std::vector<double> e(w.size(), 0.0);
    double sse = 0.0;

    for (size_t t = 0; t < w.size(); ++t) {
        double pred = mean_;
        for (size_t k = 1; k < ar_.size() && k <= t; ++k) {
            pred -= ar_[k] * (w[t - k] - mean_);
        }
        for (size_t k = 1; k < ma_.size() && k <= t; ++k) {
            pred += ma_[k] * e[t - k];
        }
        e[t] = w[t] - pred;
        sse += e[t] * e[t];
        if (!std::isfinite(sse)) {
            return std::numeric_limits<double>::infinity();
        }
    }

    if (residuals) {
        *residuals = std::move(e);
    }
    return sse;
}

bool SarimaModel::fit(const std::vector<double>& y) {
    fitted_ = false;

    stages_.clear();
    stage_lags_.clear();
    stages_.push_back(y);
    for (int i = 0; i < order_.d; ++i) {
        stages_.push_back(difference(stages_.back(), 1));
        stage_lags_.push_back(1);
    }
    for (int i = 0; i < seasonal_.D; ++i) {
        stages_.push_back(difference(stages_.back(), seasonal_.period));
        stage_lags_.push_back(seasonal_.period);
    }
    const std::vector<double>& w = stages_.back();

    const size_t k = num_params() + 1;  // + innovation variance
    if (w.size() <= k + 1) {
        return false;
    }

    double w_mean = 0.0;
    for (double v : w) w_mean += v;
    w_mean /= static_cast<double>(w.size());

    std::vector<double> x0(num_params(), 0.0);
    if (has_mean_) {
        x0[0] = w_mean;
    } else {
        mean_ = 0.0;
    }

    Objective objective = [this, &w](const std::vector<double>& params) {
        if (has_mean_) mean_ = params[0];
        build_polynomials(params);
        return conditional_sse(w, nullptr);
    };

    OptimizeResult opt = nelder_mead(objective, x0);
    if (!opt.converged || !std::isfinite(opt.value)) {
        return false;
    }

    if (has_mean_) mean_ = opt.x[0];
    build_polynomials(opt.x);
    double sse = conditional_sse(w, &residuals_);

    nobs_ = w.size();
    const double n = static_cast<double>(nobs_);
    sigma2_ = std::max(sse / n, MIN_SIGMA2);
    double loglik = -0.5 * n * (std::log(TWO_PI * sigma2_) + 1.0);
    aic_ = -2.0 * loglik + 2.0 * static_cast<double>(k);
    bic_ = -2.0 * loglik + static_cast<double>(k) * std::log(n);

    fitted_ = std::isfinite(aic_);
    return fitted_;
}

void SarimaModel::forecast(int horizon,
                           std::vector<double>& mean,
                           std::vector<double>& std_error) const {
    mean.assign(horizon, 0.0);
    std_error.assign(horizon, 0.0);
    if (!fitted_ || horizon <= 0) {
        return;
    }

    // Forecast the differenced series with future innovations at zero
    std::vector<double> w = stages_.back();
    std::vector<double> e = residuals_;
    const size_t n = w.size();
    for (int h = 0; h < horizon; ++h) {
        size_t t = n + h;
        double pred = mean_;
        for (size_t k = 1; k < ar_.size() && k <= t; ++k) {
            pred -= ar_[k] * (w[t - k] - mean_);
        }
        for (size_t k = 1; k < ma_.size() && k <= t; ++k) {
            pred += ma_[k] * e[t - k];
        }
        w.push_back(pred);
        e.push_back(0.0);
    }

    // Undo differencing stage by stage
    std::vector<std::vector<double>> stages = stages_;
    stages.back() = w;
    for (size_t s = stages.size() - 1; s-- > 0;) {
        int lag = stage_lags_[s];
        std::vector<double>& lower = stages[s];
        const std::vector<double>& upper = stages[s + 1];
        size_t upper_offset = upper.size() - static_cast<size_t>(horizon);
        for (int h = 0; h < horizon; ++h) {
            size_t t = lower.size();
            lower.push_back(upper[upper_offset + h] + lower[t - lag]);
        }
    }
    const std::vector<double>& y = stages.front();
    for (int h = 0; h < horizon; ++h) {
        mean[h] = y[y.size() - horizon + h];
    }

    // Psi weights of the integrated process give the forecast error variance
    std::vector<double> integrated = ar_;
    for (int i = 0; i < order_.d; ++i) {
        integrated = multiply(integrated, {1.0, -1.0});
    }
    for (int i = 0; i < seasonal_.D; ++i) {
        std::vector<double> seasonal_diff(seasonal_.period + 1, 0.0);
        seasonal_diff[0] = 1.0;
        seasonal_diff[seasonal_.period] = -1.0;
        integrated = multiply(integrated, seasonal_diff);
    }

    std::vector<double> psi(horizon, 0.0);
    psi[0] = 1.0;
    for (int j = 1; j < horizon; ++j) {
        double v = (static_cast<size_t>(j) < ma_.size()) ? ma_[j] : 0.0;
        for (int k = 1; k <= j && static_cast<size_t>(k) < integrated.size(); ++k) {
            v -= integrated[k] * psi[j - k];
        }
        psi[j] = v;
    }

    double cumulative = 0.0;
    for (int h = 0; h < horizon; ++h) {
        cumulative += psi[h] * psi[h];
        std_error[h] = std::sqrt(sigma2_ * cumulative);
    }
}

} // namespace forecast
} // namespace hashcalc
