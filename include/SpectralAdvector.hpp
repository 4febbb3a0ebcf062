#pragma once
/**
 * @file SpectralAdvector.hpp
 * @brief Exact periodic linear advection along one phase-space axis by
 *        phase shift in Fourier space.
 *
 * @details
 * A Fourier mode e^{ikx} is an eigenfunction of translation, so the free
 * streaming equation ∂f/∂t + a ∂f/∂x = 0 is solved exactly by
 * f̂_k(t+dt) = e^{−i k a dt} f̂_k(t). The advector holds the wavenumbers of
 * its own axis and applies this shift row by row to a 2D array whose rows
 * are lines along that axis.
 *
 * The x-axis advector additionally provides the coupled kernel that, while
 * the distribution is still in Fourier space, integrates it over v to obtain
 * the new density coefficients and solves for the self-consistent field.
 */

#include "common.hpp"
#include "PeriodicMesh.hpp"
#include "SpectralTransformer.hpp"

/**
 * @class SpectralAdvector
 * @brief Stateful advection operator built on one mesh.
 *
 * @section usage Usage
 * - Construct with the mesh of the axis to advect along.
 * - transportHalfStep(f, drift, dt): f[r][j] is shifted along j with speed drift[r].
 * - coupledAdvectAndUpdateField(...): x-advection plus field update (x-mesh advector).
 */
class SpectralAdvector
{
  private:
    const PeriodicMesh& mesh;   ///< Mesh of the advected axis.
    SpectralTransformer fft;    ///< Transforms along the advected axis.
    const vec_real k;           ///< Wavenumbers, computed once.

    /// Throw unless f has `rows` rows of mesh length.
    void checkShape(const mat_complex& f, size_t rows, const char* where) const;

  public:
    /**
     * @brief Construct an advector along the given mesh.
     * @param mesh Mesh of the advected axis; must outlive the advector.
     */
    explicit SpectralAdvector(const PeriodicMesh& mesh);

    /// Wavenumber vector of the advected axis.
    const vec_real& wavenumbers() const { return k; }

    /**
     * @brief Free streaming along the advector's axis.
     * @param[in,out] f     2D array, f.size() == drift.size(), rows of mesh length.
     * @param[in]     drift Transport speed of each row (the other axis' coordinate
     *                      or field value, held fixed along the row).
     * @param[in]     dt    Time step (typically half a full step).
     *
     * @details
     * Per row r: f̂ = FFT(f[r]); f̂_j *= exp(−i dt k_j drift[r]); f[r] = IFFT(f̂).
     *
     * @throws std::invalid_argument on shape mismatch.
     */
    void transportHalfStep(mat_complex& f, const vec_real& drift, real_t dt) const;

    /**
     * @brief x-advection for a full step with self-consistent field update.
     * @param[in,out] f     Spatial-line layout f[iv][ix] (this advector is on x).
     * @param[out]    e     Total electric field E(x, t+dt), length Nx.
     * @param[in]     vMesh Velocity mesh; its points are the per-row speeds and
     *                      its step weights the velocity integral.
     * @param[in]     dt    Full time step.
     * @param[in]     eExt  External field for this step, length Nx.
     *
     * @details
     * 1. f̂[iv] = FFT_x(f[iv]) · exp(−i dt k_x v_iv).
     * 2. ρ̂_j = Σ_iv f̂[iv][j] Δv.
     * 3. Ê_j = −i ρ̂_j / k_j (j ≠ 0), Ê_0 = 0.
     * 4. f[iv] = IFFT_x(f̂[iv]), E_self = IFFT(Ê).
     * 5. e = Re E_self + Re eExt.
     *
     * @throws std::invalid_argument on shape mismatch.
     */
    void coupledAdvectAndUpdateField(mat_complex& f, vec_real& e, const PeriodicMesh& vMesh,
                                     real_t dt, const vec_complex& eExt) const;
};
