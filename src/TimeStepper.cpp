//==============================================================================
// TimeStepper.cpp
// Strang splitting for Vlasov–Ampère:
//   1) v-advection of f[ix][iv], speed E(x), dt/2
//   2) transpose f[ix][iv] → f[iv][ix]
//   3) x-advection of f[iv][ix], speed v, dt, field update + E_ext(t_i)
//   4) transpose back
//   5) v-advection with the updated field, dt/2
//   6) hand (E, f, E_ext) to the observer
// State machine: Idle → Stepping → … → Done.
//==============================================================================

#include "TimeStepper.hpp"

TimeStepper::TimeStepper(const PeriodicMesh& xMesh_, const PeriodicMesh& vMesh_,
                         real_t finalTime_, size_t nSteps_,
                         ExternalFieldGenerator externalField_)
    : xMesh(xMesh_), vMesh(vMesh_), nSteps(nSteps_),
      dt(finalTime_ / static_cast<real_t>(nSteps_)),
      advectX(xMesh), advectV(vMesh), solver(xMesh, vMesh),
      externalField(std::move(externalField_)),
      e(xMesh_.length, 0.0), eExt(xMesh_.length, complex_t(0.0))
{
    if (nSteps_ < 1)
    {
        throw std::invalid_argument("TimeStepper needs at least one step!");
    }
    if (!(finalTime_ > 0.0))
    {
        throw std::invalid_argument("TimeStepper needs a positive final time!");
    }
}

//------------------------------------------------------------------------------
// initialize: copy f0, build the transposed layout and E(x,0) from ρ(x,0).
//------------------------------------------------------------------------------
void TimeStepper::initialize(const mat_complex& f0)
{
    if (currentState != StepperState::Idle)
    {
        throw std::logic_error("TimeStepper::initialize called after the run has started!");
    }

    // computeDensity validates the shape against both meshes
    vec_real rho = solver.computeDensity(f0, Layout::VelocityLines);

    f_v = f0;
    transpose(f_v, f_x);
    e = solver.computeField(rho);
    std::fill(eExt.begin(), eExt.end(), complex_t(0.0));

    initialized = true;
}

void TimeStepper::start()
{
    if (!initialized)
    {
        throw std::logic_error("TimeStepper::start called before initialize!");
    }
    if (currentState != StepperState::Idle)
    {
        throw std::logic_error("TimeStepper::start called twice!");
    }

    currentState = StepperState::Stepping;
}

//------------------------------------------------------------------------------
// step: one full Strang step; the external field is evaluated at t_i = i·dt
// with i the index of the step being taken.
//------------------------------------------------------------------------------
void TimeStepper::step()
{
    if (currentState != StepperState::Stepping)
    {
        throw std::logic_error("TimeStepper::step called outside of a running simulation!");
    }

    advectV.transportHalfStep(f_v, e, 0.5*dt);

    transpose(f_v, f_x);

    if (externalField)
    {
        eExt = externalField(xMesh.points, stepIndex, dt);
    }
    else
    {
        std::fill(eExt.begin(), eExt.end(), complex_t(0.0));
    }

    advectX.coupledAdvectAndUpdateField(f_x, e, vMesh, dt, eExt);

    transpose(f_x, f_v);

    advectV.transportHalfStep(f_v, e, 0.5*dt);

    // Keep the spatial-line layout in sync for readers between steps
    transpose(f_v, f_x);

    ++stepIndex;
    if (stepIndex == nSteps)
    {
        currentState = StepperState::Done;
    }
}

void TimeStepper::run(const StepObserver& observer)
{
    if (currentState == StepperState::Idle)
    {
        start();
    }

    while (currentState == StepperState::Stepping)
    {
        step();
        if (observer)
        {
            observer(stepIndex, time(), e, f_v, eExt);
        }
    }
}
