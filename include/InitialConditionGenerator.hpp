#pragma once
/**
 * @file InitialConditionGenerator.hpp
 * @brief Construction of the initial distribution f(x,v,0) on the phase-space
 *        meshes.
 *
 * @details
 * Supported profiles, with perturbation ε and wavenumber k:
 *  - Landau   : (1 + ε cos(kx)) · exp(−v²/2)/√(2π)
 *  - TwoStream: (1 + ε cos(kx)) · [exp(−(v−v0)²/2) + exp(−(v+v0)²/2)]/(2√(2π))
 *
 * Output layout is f[ix][iv] (velocity lines), as consumed by
 * TimeStepper::initialize.
 */

#include "common.hpp"
#include "PeriodicMesh.hpp"

/**
 * @enum Profile
 * @brief Available initial distribution profiles.
 */
enum class Profile { Landau, TwoStream };

/**
 * @class InitialConditionGenerator
 * @brief Samples an initial profile on the meshes.
 */
class InitialConditionGenerator
{
  private:
    Profile profile;   ///< Selected profile.
    real_t epsilon;    ///< Perturbation amplitude ε.
    real_t kx;         ///< Perturbation wavenumber k.
    real_t v0;         ///< Beam velocity (TwoStream only).

  public:
    /**
     * @brief Construct a generator.
     * @param profile Profile to sample.
     * @param epsilon Perturbation amplitude.
     * @param kx      Perturbation wavenumber.
     * @param v0      Beam drift velocity for TwoStream (ignored for Landau).
     */
    InitialConditionGenerator(Profile profile, real_t epsilon, real_t kx, real_t v0=0.0);

    /**
     * @brief Parse a profile name ("Landau", "TwoStream").
     * @throws std::invalid_argument for unknown names.
     */
    static Profile parseProfile(const std::string& name);

    /// Evaluate the profile at a single phase-space point.
    real_t evaluate(real_t x, real_t v) const;

    /**
     * @brief Sample the profile on the meshes.
     * @return f0[ix][iv] with zero imaginary part.
     */
    mat_complex generate(const PeriodicMesh& xMesh, const PeriodicMesh& vMesh) const;
};
