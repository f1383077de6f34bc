#ifndef HASHCALC_FORECAST_HOLT_WINTERS_HPP
#define HASHCALC_FORECAST_HOLT_WINTERS_HPP

#include <cstddef>
#include <vector>

namespace hashcalc {
namespace forecast {

// Additive-trend exponential smoothing, optionally with additive seasonality.
// Smoothing weights are chosen by minimizing one-step-ahead squared error.
class HoltWinters {
public:
    explicit HoltWinters(bool seasonal, int period = 12);

    bool fit(const std::vector<double>& y);
    std::vector<double> forecast(int horizon) const;

    // Sample standard deviation of the in-sample one-step residuals
    double residual_std() const { return residual_std_; }

    bool seasonal() const { return seasonal_; }
    double aic() const { return aic_; }
    double bic() const { return bic_; }
    double alpha() const { return alpha_; }
    double beta() const { return beta_; }
    double gamma() const { return gamma_; }

private:
    bool seasonal_;
    int period_;

    double alpha_;
    double beta_;
    double gamma_;
    double level_;
    double trend_;
    std::vector<double> season_;
    size_t nobs_;

    double residual_std_;
    double aic_;
    double bic_;

    double run(const std::vector<double>& y, double alpha, double beta, double gamma,
               std::vector<double>* residuals);
    void initialize(const std::vector<double>& y);

    double init_level_;
    double init_trend_;
    std::vector<double> init_season_;
};

} // namespace forecast
} // namespace hashcalc

#endif // HASHCALC_FORECAST_HOLT_WINTERS_HPP
