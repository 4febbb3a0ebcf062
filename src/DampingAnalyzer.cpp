//==============================================================================
// DampingAnalyzer.cpp
// Envelope fit of an oscillating, exponentially damped/growing amplitude:
// local maxima → ln(peak) vs. t → linear least squares (LAPACKE_dgels).
//==============================================================================

#include "DampingAnalyzer.hpp"

json DampingFit::toJson() const
{
    json out;
    out["GrowthRate"] = GrowthRate;
    out["Intercept"]  = Intercept;
    out["Frequency"]  = Frequency;
    out["PeakTimes"]  = PeakTimes;
    out["PeakValues"] = PeakValues;
    return out;
}

std::vector<size_t> DampingAnalyzer::findPeaks(const vec_real& amplitude)
{
    std::vector<size_t> peaks;
    for (size_t i=1; i+1<amplitude.size(); ++i)
    {
        if (amplitude[i] > amplitude[i-1] && amplitude[i] >= amplitude[i+1] && amplitude[i] > 0.0)
        {
            peaks.push_back(i);
        }
    }
    return peaks;
}

//------------------------------------------------------------------------------
// fit: γ is the slope of ln(peak) over t; ω = π / mean(Δt_peak) because the
// norm of cos(ωt) peaks twice per period.
//------------------------------------------------------------------------------
DampingFit DampingAnalyzer::fit(const vec_real& times, const vec_real& amplitude, real_t tMin, real_t tMax)
{
    if (times.size() != amplitude.size())
    {
        throw std::invalid_argument("DampingAnalyzer::fit: time and amplitude series differ in length!");
    }

    DampingFit result{};
    vec_real logPeaks;

    for (size_t i : findPeaks(amplitude))
    {
        if (times[i] < tMin || times[i] > tMax) continue;

        result.PeakTimes.push_back(times[i]);
        result.PeakValues.push_back(amplitude[i]);
        logPeaks.push_back(std::log(amplitude[i]));
    }

    if (result.PeakTimes.size() < 2)
    {
        throw std::runtime_error("DampingAnalyzer::fit: fewer than two peaks in the fit window!");
    }

    vec_real coeffs = fit_linear_least_squares(result.PeakTimes, logPeaks);
    result.Intercept  = coeffs[0];
    result.GrowthRate = coeffs[1];

    real_t spacing = (result.PeakTimes.back() - result.PeakTimes.front())
                     / static_cast<real_t>(result.PeakTimes.size() - 1);
    result.Frequency = M_PI / spacing;

    return result;
}
