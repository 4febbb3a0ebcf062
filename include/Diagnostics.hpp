#pragma once
/**
 * @file Diagnostics.hpp
 * @brief Scalar time series accumulated along a Vlasov–Ampère run.
 *
 * @details
 * The driver owns a Diagnostics object and passes it by reference into the
 * TimeStepper observer. Every call to record() appends one entry per series;
 * entries are never modified afterwards.
 *
 * Quantities (Δx, Δv mesh steps, f taken as Re f):
 *  - field energy   ½ Σ E² Δx
 *  - field norm     √(Σ E² Δx)
 *  - kinetic energy ½ Σ Σ f v² Δx Δv
 *  - total energy   field + kinetic
 *  - mass           Σ Σ f Δx Δv
 *  - L2 norm        √(Σ Σ f² Δx Δv)
 *  - entropy        −Σ Σ f ln f Δx Δv over f > 0
 */

#include "common.hpp"
#include "PeriodicMesh.hpp"

/**
 * @class Diagnostics
 * @brief Append-only record of per-step scalars.
 */
class Diagnostics
{
  private:
    const PeriodicMesh& xMesh;
    const PeriodicMesh& vMesh;

    std::vector<size_t> steps;
    vec_real times, fieldEnergy, fieldNorm, kineticEnergy, totalEnergy, mass, l2Norm, entropy;

  public:
    Diagnostics(const PeriodicMesh& xMesh, const PeriodicMesh& vMesh);

    /**
     * @brief Append the diagnostics of one state.
     * @param step Step index (0 for the initial state).
     * @param time Simulated time.
     * @param e    Electric field, length Nx.
     * @param f    Distribution f[ix][iv].
     */
    void record(size_t step, real_t time, const vec_real& e, const mat_complex& f);

    size_t size() const { return times.size(); }

    const std::vector<size_t>& stepSeries() const { return steps; }
    const vec_real& timeSeries() const { return times; }
    const vec_real& fieldEnergySeries() const { return fieldEnergy; }
    const vec_real& fieldNormSeries() const { return fieldNorm; }
    const vec_real& kineticEnergySeries() const { return kineticEnergy; }
    const vec_real& totalEnergySeries() const { return totalEnergy; }
    const vec_real& massSeries() const { return mass; }
    const vec_real& l2NormSeries() const { return l2Norm; }
    const vec_real& entropySeries() const { return entropy; }

    /// All series as a JSON object keyed by quantity name.
    json toJson() const;
};
