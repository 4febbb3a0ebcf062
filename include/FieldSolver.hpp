#pragma once
/**
 * @file FieldSolver.hpp
 * @brief Charge density and self-consistent electric field on the periodic
 *        spatial mesh.
 *
 * @details
 * The density is the velocity integral of Re f, mean-subtracted so that the
 * global charge offset (mode 0) never enters the field. The field solves
 * dE/dx = ρ mode by mode in Fourier space: Ê_k = −i ρ̂_k / k for k ≠ 0 and
 * Ê_0 = 0.
 */

#include "common.hpp"
#include "PeriodicMesh.hpp"
#include "SpectralTransformer.hpp"

/**
 * @class FieldSolver
 * @brief Density reduction and spectral Poisson/Gauss solve.
 *
 * @section usage Usage
 * - Construct with the spatial and velocity meshes.
 * - computeDensity(f, layout) reduces a phase-space array to ρ(x).
 * - computeField(ρ) returns E(x).
 */
class FieldSolver
{
  private:
    const PeriodicMesh& xMesh;   ///< Spatial mesh (periodic).
    const PeriodicMesh& vMesh;   ///< Velocity mesh.
    SpectralTransformer fft;     ///< Transforms along x.

  public:
    /**
     * @brief Construct a field solver on the given meshes.
     * @param xMesh Spatial mesh; must outlive the solver.
     * @param vMesh Velocity mesh; must outlive the solver.
     */
    FieldSolver(const PeriodicMesh& xMesh, const PeriodicMesh& vMesh);

    /**
     * @brief Velocity integral of Re f, mean-subtracted.
     * @param f      Phase-space array in the given layout.
     * @param layout VelocityLines: f[ix][iv]; SpatialLines: f[iv][ix].
     * @return ρ(x) of length Nx with zero mean.
     *
     * @throws std::invalid_argument if the shape does not match the meshes.
     */
    vec_real computeDensity(const mat_complex& f, Layout layout=Layout::VelocityLines) const;

    /**
     * @brief Solve dE/dx = ρ on the periodic spatial mesh.
     * @param density Mean-free charge density of length Nx.
     * @return Electric field E(x) with zero mean.
     *
     * @throws std::invalid_argument if density.size() != Nx.
     */
    vec_real computeField(const vec_real& density);
};
