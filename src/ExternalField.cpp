//==============================================================================
// ExternalField.cpp
// External field generators plugged into the TimeStepper.
//==============================================================================

#include "ExternalField.hpp"

namespace ExternalField
{

real_t rampFactor(const DriveParameters& params, real_t t)
{
    auto g = [&params](real_t s)
    {
        return 0.5*(std::tanh((s - params.RampOn)/params.RampWidth)
                  - std::tanh((s - params.RampOff)/params.RampWidth));
    };

    const real_t g0 = g(0.0);
    return (g(t) - g0) / (1.0 - g0);
}

ExternalFieldGenerator none()
{
    return [](const vec_real& x, size_t, real_t)
    {
        return vec_complex(x.size(), complex_t(0.0));
    };
}

//------------------------------------------------------------------------------
// drive: E_ext(x, t) = a(t) E0 cos(kx − ωt), t = step·dt.
//------------------------------------------------------------------------------
ExternalFieldGenerator drive(const DriveParameters& params)
{
    if (!(params.RampWidth > 0.0))
    {
        throw std::invalid_argument("Drive ramp width must be positive!");
    }
    if (!(params.RampOff > params.RampOn))
    {
        throw std::invalid_argument("Drive RampOff must be later than RampOn!");
    }

    // a(t) divides by 1 − g(0); a drive already switched on at t = 0 has no ramp
    const real_t g0 = 0.5*(std::tanh(-params.RampOn/params.RampWidth)
                         - std::tanh(-params.RampOff/params.RampWidth));
    if (!(1.0 - g0 > 1e-6))
    {
        throw std::invalid_argument("Drive is already switched on at t = 0, move RampOn later!");
    }

    return [params](const vec_real& x, size_t step, real_t dt)
    {
        const real_t t = static_cast<real_t>(step)*dt;
        const real_t amplitude = rampFactor(params, t) * params.Amplitude;

        vec_complex e(x.size());
        for (size_t i=0; i<x.size(); ++i)
        {
            e[i] = complex_t(amplitude*std::cos(params.Wavenumber*x[i] - params.Frequency*t), 0.0);
        }
        return e;
    };
}

ExternalFieldGenerator fromName(const std::string& type, const DriveParameters& params)
{
    if (type == "None")  return none();
    if (type == "Drive") return drive(params);

    throw std::invalid_argument("Unknown external field type '" + type + "'!");
}

}
