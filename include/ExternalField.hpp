#pragma once
/**
 * @file ExternalField.hpp
 * @brief Prescribed external driving fields for the TimeStepper.
 *
 * @details
 * A drive is a travelling wave E0·cos(kx − ωt) switched on and off by a
 * smooth tanh ramp (KEEN-wave drive):
 *   g(t) = ½ [tanh((t − tL)/tw) − tanh((t − tR)/tw)]
 *   a(t) = (g(t) − g(0)) / (1 − g(0))
 * so that a(0) = 0 and a ≈ 1 between tL and tR.
 */

#include "common.hpp"
#include "TimeStepper.hpp"

/**
 * @struct DriveParameters
 * @brief Waveform and ramp of the travelling-wave drive.
 */
struct DriveParameters
{
    real_t Amplitude {0.0};   ///< Peak field E0.
    real_t Wavenumber {0.0};  ///< k.
    real_t Frequency {0.0};   ///< ω.
    real_t RampOn {0.0};      ///< tL, centre of the switch-on.
    real_t RampOff {0.0};     ///< tR, centre of the switch-off.
    real_t RampWidth {1.0};   ///< tw, width of both ramps.
};

namespace ExternalField
{
    /// Ramp factor a(t) of the drive, a(0) = 0.
    real_t rampFactor(const DriveParameters& params, real_t t);

    /// Generator returning zeros of the mesh length.
    ExternalFieldGenerator none();

    /**
     * @brief Travelling-wave drive evaluated at t = step·dt.
     * @throws std::invalid_argument unless RampWidth > 0, RampOff > RampOn and
     *         the drive is still off at t = 0.
     */
    ExternalFieldGenerator drive(const DriveParameters& params);

    /**
     * @brief Build a generator by type name ("None", "Drive").
     * @throws std::invalid_argument for unknown names.
     */
    ExternalFieldGenerator fromName(const std::string& type, const DriveParameters& params);
}
