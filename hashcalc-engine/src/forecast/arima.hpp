#ifndef HASHCALC_FORECAST_ARIMA_HPP
#define HASHCALC_FORECAST_ARIMA_HPP

#include <string>
#include <vector>

namespace hashcalc {
namespace forecast {

struct ArimaOrder {
    int p;
    int d;
    int q;
};

struct SeasonalOrder {
    int P;
    int D;
    int Q;
    int period;
};

std::string format_order(const ArimaOrder& order);
std::string format_seasonal_order(const SeasonalOrder& order);

// True when 1 - phi_1 z - ... - phi_p z^p has every root outside the unit circle.
// Steps the coefficients down to partial autocorrelations, which must all lie in (-1, 1).
bool is_stationary_ar(const std::vector<double>& phi);

// Multiplicative seasonal ARIMA fitted by conditional sum of squares.
//
// The differenced series w = (1-B)^d (1-B^s)^D y is modelled as
//   phi(B) Phi(B^s) (w_t - mu) = theta(B) Theta(B^s) e_t
// with mu estimated only when no differencing is applied. Pre-sample values
// of w are taken at the mean and pre-sample innovations at zero.
class SarimaModel {
public:
    SarimaModel(const ArimaOrder& order, const SeasonalOrder& seasonal);

    // Returns false when the series is too short for the parameter count or
    // the optimizer fails to converge.
    bool fit(const std::vector<double>& y);

    // Point forecasts and their standard errors for steps 1..horizon
    void forecast(int horizon,
                  std::vector<double>& mean,
                  std::vector<double>& std_error) const;

    bool fitted() const { return fitted_; }
    // Both the regular and the seasonal AR factor are stationary
    bool is_stationary() const;
    double aic() const { return aic_; }
    double bic() const { return bic_; }
    double sigma2() const { return sigma2_; }
    size_t nobs() const { return nobs_; }
    size_t num_params() const;
    std::string name() const;

    const ArimaOrder& order() const { return order_; }
    const SeasonalOrder& seasonal_order() const { return seasonal_; }

private:
    ArimaOrder order_;
    SeasonalOrder seasonal_;

    bool fitted_;
    bool has_mean_;
    double mean_;
    std::vector<double> phi_;
    std::vector<double> seasonal_phi_;
    std::vector<double> ar_;   // full AR polynomial, ar_[0] == 1
    std::vector<double> ma_;   // full MA polynomial, ma_[0] == 1
    double sigma2_;
    double aic_;
    double bic_;
    size_t nobs_;

    std::vector<std::vector<double>> stages_;  // y, partially differenced, ..., w
    std::vector<int> stage_lags_;
    std::vector<double> residuals_;

    void build_polynomials(const std::vector<double>& params);
    double conditional_sse(const std::vector<double>& w,
                           std::vector<double>* residuals) const;
};

} // namespace forecast
} // namespace hashcalc

#endif // HASHCALC_FORECAST_ARIMA_HPP
