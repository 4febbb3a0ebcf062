#pragma once
/**
 * @file TimeStepper.hpp
 * @brief Strang-split time integration of the 1D1V Vlasov–Ampère system.
 *
 * @details
 * Each step advances the distribution by
 *   v-advection (dt/2, field frozen) → x-advection + field update (dt)
 *   → v-advection (dt/2, updated field),
 * which is second order in time. The distribution is held in two layouts:
 *  - f_v[ix][iv] (velocity lines), transformed along v by the v-advector;
 *  - f_x[iv][ix] (spatial lines),  transformed along x by the x-advector.
 * The two are synchronized only by explicit transposes inside step().
 *
 * Responsibilities:
 *  - Own the meshes, advectors and field solver.
 *  - Build the initial self-consistent field from f(x,v,0).
 *  - Run a fixed number of steps and hand each new state to an observer.
 */

#include "common.hpp"
#include "PeriodicMesh.hpp"
#include "FieldSolver.hpp"
#include "SpectralAdvector.hpp"

/**
 * @enum StepperState
 * @brief Life cycle of a TimeStepper run.
 */
enum class StepperState { Idle, Stepping, Done };

/// External field E_ext(x, t_step) for step index `step` (t = step·dt).
using ExternalFieldGenerator = std::function<vec_complex(const vec_real& x, size_t step, real_t dt)>;

/// Receives the state after each completed step.
using StepObserver = std::function<void(size_t step, real_t time, const vec_real& e,
                                        const mat_complex& f, const vec_complex& eExt)>;

/**
 * @class TimeStepper
 * @brief Owns the phase-space state and applies the split-step scheme.
 *
 * @section usage Usage
 * - Construct with meshes, final time, step count and optional external field.
 * - initialize(f0) with f0[ix][iv].
 * - run(observer), or start() followed by step() until state() == Done.
 */
class TimeStepper
{
  private:
    PeriodicMesh xMesh;             ///< Spatial mesh.
    PeriodicMesh vMesh;             ///< Velocity mesh.
    size_t nSteps;                  ///< Number of steps to run.
    real_t dt;                      ///< Time step FinalTime/nSteps.

    SpectralAdvector advectX;       ///< Advector along x.
    SpectralAdvector advectV;       ///< Advector along v.
    FieldSolver solver;             ///< Initial density/field solve.
    ExternalFieldGenerator externalField; ///< Empty means zero external field.

    mat_complex f_v;                ///< Distribution, velocity lines f[ix][iv].
    mat_complex f_x;                ///< Distribution, spatial lines f[iv][ix].
    vec_real e;                     ///< Total electric field.
    vec_complex eExt;               ///< External field of the last step.

    size_t stepIndex {0};           ///< Number of completed steps.
    bool initialized {false};       ///< True after initialize().
    StepperState currentState {StepperState::Idle};

  public:
    /**
     * @brief Construct a stepper.
     * @param xMesh         Spatial mesh.
     * @param vMesh         Velocity mesh.
     * @param finalTime     Total simulated time (> 0).
     * @param nSteps        Number of steps (≥ 1); dt = finalTime/nSteps.
     * @param externalField Optional external field generator.
     *
     * @throws std::invalid_argument on non-positive finalTime or nSteps.
     */
    TimeStepper(const PeriodicMesh& xMesh, const PeriodicMesh& vMesh,
                real_t finalTime, size_t nSteps,
                ExternalFieldGenerator externalField=nullptr);

    /**
     * @brief Load f(x,v,0) and compute the initial self-consistent field.
     * @param f0 Distribution in velocity-line layout f0[ix][iv].
     * @throws std::invalid_argument on shape mismatch.
     * @throws std::logic_error if the run has already started.
     */
    void initialize(const mat_complex& f0);

    /// Idle → Stepping. @throws std::logic_error if not initialized or not Idle.
    void start();

    /**
     * @brief Advance one Strang step.
     * @throws std::logic_error unless the stepper is in Stepping state.
     */
    void step();

    /**
     * @brief Start if idle and step until Done.
     * @param observer Called after every step with (step, time, e, f, eExt).
     */
    void run(const StepObserver& observer=nullptr);

    StepperState state() const { return currentState; }
    size_t completedSteps() const { return stepIndex; }
    size_t totalSteps() const { return nSteps; }
    real_t timeStep() const { return dt; }
    real_t time() const { return static_cast<real_t>(stepIndex)*dt; }

    const PeriodicMesh& spatialMesh() const { return xMesh; }
    const PeriodicMesh& velocityMesh() const { return vMesh; }

    /// Distribution f[ix][iv].
    const mat_complex& distribution() const { return f_v; }
    /// Distribution f[iv][ix]; equals the transpose of distribution() between steps.
    const mat_complex& distributionTransposed() const { return f_x; }
    const vec_real& field() const { return e; }
    const vec_complex& externalFieldValues() const { return eExt; }
};
