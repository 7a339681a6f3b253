#pragma once
#include <cstddef>
#include <vector>

/**
 * @brief Fixed-order ARIMA(1,1,1) without constant.
 * @details Estimated with Hannan-Rissanen two-stage least squares on the first difference:
 *          a long autoregression supplies innovation estimates, then d_t is regressed on
 *          d_{t-1} and e_{t-1}. Residuals are rebuilt by conditional sum of squares.
 *          Constant increments fit as pure drift (phi = 1, theta = 0). When the innovations
 *          vanish or the two-regressor design is singular, phi is fitted alone with theta = 0.
 */
class ArimaModel {
public:
    static constexpr size_t kMinObservations = 8;
    static constexpr double kCoefficientBound = 0.99;
    static constexpr double kDriftTolerance = 1e-9;

    /**
     * @brief Fits the model to an ordered series.
     * @pre series values are finite.
     * @throws Nika::ModelingException on fewer than kMinObservations points, non-finite input,
     *         or when neither the ARMA(1,1) nor the AR(1) regression on the differences is solvable.
     */
    void fit(const std::vector<double>& series);

    /**
     * @brief Projects the level forward.
     * @throws Nika::ModelingException when called before fit() or when the projection is non-finite.
     */
    std::vector<double> forecast(size_t horizon) const;

    bool fitted() const noexcept { return fitted_; }
    double phi() const noexcept { return phi_; }
    double theta() const noexcept { return theta_; }
    double sigma2() const noexcept { return sigma2_; }

private:
    bool fitted_ = false;
    double phi_ = 0.0;
    double theta_ = 0.0;
    double sigma2_ = 0.0;
    double lastLevel_ = 0.0;
    double lastDiff_ = 0.0;
    double lastResidual_ = 0.0;
};
