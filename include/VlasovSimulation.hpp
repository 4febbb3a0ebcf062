#pragma once
/**
 * @file VlasovSimulation.hpp
 * @brief Driver for one Vlasov–Ampère run configured by a SimulationConfig.
 *
 * @details
 * Builds the meshes and the initial distribution, hands them to a
 * TimeStepper together with the configured external field, and collects
 * diagnostics after every step through the stepper observer.
 *
 * Responsibilities:
 *  - Translate the configuration into meshes, f(x,v,0) and E_ext.
 *  - Record the Diagnostics time series (including t = 0).
 *  - Optionally write E and f snapshots.
 *  - Fit the damping rate of the field norm.
 *  - Return results (and timings in benchmark mode) as JSON.
 */

#include "common.hpp"
#include "SimulationConfig.hpp"
#include "PeriodicMesh.hpp"
#include "TimeStepper.hpp"
#include "Diagnostics.hpp"
#include "DampingAnalyzer.hpp"
#include "OutputWriter.hpp"

/**
 * @class VlasovSimulation
 * @brief Owns one stepper run and its diagnostics.
 */
class VlasovSimulation
{
  private:
    SimulationConfig config;          ///< Simulation parameters.
    PeriodicMesh xMesh;               ///< Spatial mesh.
    PeriodicMesh vMesh;               ///< Velocity mesh.
    std::filesystem::path baseFolder; ///< Where outputs are written.
    bool benchmark;                   ///< If true, time the run and skip file output.

    /// Write E and f of the given step to the output folder.
    void writeSnapshot(size_t step, const vec_real& e, const mat_complex& f) const;

  public:
    /**
     * @brief Construct from a configuration and an output folder.
     * @param configIn    Simulation parameters.
     * @param dataPathIn  Base path for output files.
     * @param benchmarkIn If true, enable benchmark mode.
     */
    VlasovSimulation(SimulationConfig configIn, std::filesystem::path dataPathIn, bool benchmarkIn=false);

    /**
     * @brief Run all steps.
     * @param diagnostics      Time series to append to (owned by the caller).
     * @param benchmark_result Optional JSON to collect timings.
     * @return JSON with the configuration summary, the diagnostics and, when
     *         enough field peaks exist, the damping fit.
     */
    json run(Diagnostics& diagnostics, json* benchmark_result=nullptr);

    const PeriodicMesh& spatialMesh() const { return xMesh; }
    const PeriodicMesh& velocityMesh() const { return vMesh; }
};
