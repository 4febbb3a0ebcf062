#pragma once
/**
 * @file DampingAnalyzer.hpp
 * @brief Linear damping/growth rate and frequency from a field amplitude
 *        time series.
 *
 * @details
 * The field norm of a linear Langmuir wave oscillates as |cos(ωt)|·e^{γt}.
 * Its local maxima are spaced by π/ω and lie on e^{γt}, so a straight-line
 * fit of ln(peak) against peak time gives γ, and the mean peak spacing
 * gives ω. For Landau damping with k = 0.5 linear theory predicts
 * γ ≈ −0.1533, ω ≈ 1.4156.
 */

#include "common.hpp"

/**
 * @struct DampingFit
 * @brief Result of a damping-rate fit.
 */
struct DampingFit
{
    real_t GrowthRate;   ///< γ (negative for damping).
    real_t Intercept;    ///< ln amplitude at t = 0 of the fitted envelope.
    real_t Frequency;    ///< ω estimated from the peak spacing.
    vec_real PeakTimes;  ///< Times of the detected maxima.
    vec_real PeakValues; ///< Amplitudes at the detected maxima.

    json toJson() const;
};

/**
 * @class DampingAnalyzer
 * @brief Peak detection and LAPACK least-squares envelope fit.
 */
class DampingAnalyzer
{
  public:
    /**
     * @brief Indices i with a[i-1] < a[i] >= a[i+1] and a[i] > 0.
     */
    static std::vector<size_t> findPeaks(const vec_real& amplitude);

    /**
     * @brief Fit the exponential envelope of `amplitude` over [tMin, tMax].
     * @param times     Sample times.
     * @param amplitude Field amplitude (e.g. Diagnostics field norm).
     * @param tMin      Start of the fit window.
     * @param tMax      End of the fit window.
     *
     * @throws std::invalid_argument if the series lengths differ.
     * @throws std::runtime_error if fewer than two peaks lie in the window.
     */
    static DampingFit fit(const vec_real& times, const vec_real& amplitude,
                          real_t tMin=0.0, real_t tMax=std::numeric_limits<real_t>::max());
};
