//==============================================================================
// test_time_stepper.cpp
// TimeStepper checks:
//   1) State machine: Idle → Stepping → Done, misuse raises logic_error.
//   2) Uniform Maxwellian (ε = 0) on 32×32, dt = 0.2, 10 steps: field stays
//      at round-off level.
//   3) Mass is conserved over many steps; both layouts stay transposes.
//   4) External field is generated at t_i = i·dt and added to the field.
//   5) Invalid step count / final time are rejected.
//==============================================================================

#include "common.hpp"
#include "PeriodicMesh.hpp"
#include "TimeStepper.hpp"
#include "InitialConditionGenerator.hpp"

namespace
{
real_t totalMass(const mat_complex& f, const PeriodicMesh& xMesh, const PeriodicMesh& vMesh)
{
    real_t sum = 0.0;
    for (const auto& row : f)
        for (const auto& val : row)
            sum += val.real();
    return sum*xMesh.step*vMesh.step;
}

real_t maxAbs(const vec_real& e)
{
    real_t m = 0.0;
    for (auto val : e) m = std::max(m, std::abs(val));
    return m;
}
}

int main()
{
    PeriodicMesh xMesh(0.0, 4*M_PI, 32);
    PeriodicMesh vMesh(-6.0, 6.0, 32);

    // -------------------------------------------------------------------------
    // 1) State machine
    // -------------------------------------------------------------------------
    {
        TimeStepper stepper(xMesh, vMesh, 0.4, 2);
        assert(stepper.state() == StepperState::Idle);
        assert(almost_equal(stepper.timeStep(), 0.2));
        assert(stepper.totalSteps() == 2);
        assert(stepper.spatialMesh().length == xMesh.length);
        assert(almost_equal(stepper.spatialMesh().period(), 4*M_PI, 1e-14));
        assert(stepper.velocityMesh().length == vMesh.length);
        assert(almost_equal(stepper.velocityMesh().start, -6.0));

        bool thrown = false;
        try { stepper.start(); } catch (const std::logic_error&) { thrown = true; }
        assert(thrown);

        InitialConditionGenerator initGen(Profile::Landau, 0.01, 0.5);
        stepper.initialize(initGen.generate(xMesh, vMesh));

        thrown = false;
        try { stepper.step(); } catch (const std::logic_error&) { thrown = true; }
        assert(thrown);

        stepper.start();
        assert(stepper.state() == StepperState::Stepping);
        stepper.step();
        assert(stepper.state() == StepperState::Stepping);
        assert(stepper.completedSteps() == 1);
        stepper.step();
        assert(stepper.state() == StepperState::Done);
        assert(almost_equal(stepper.time(), 0.4, 1e-14));

        thrown = false;
        try { stepper.step(); } catch (const std::logic_error&) { thrown = true; }
        assert(thrown);

        thrown = false;
        try { stepper.initialize(initGen.generate(xMesh, vMesh)); } catch (const std::logic_error&) { thrown = true; }
        assert(thrown);
    }

    // -------------------------------------------------------------------------
    // 2) ε = 0: charge-neutral uniform plasma, no field growth
    // -------------------------------------------------------------------------
    {
        TimeStepper stepper(xMesh, vMesh, 2.0, 10);
        InitialConditionGenerator initGen(Profile::Landau, 0.0, 0.5);
        stepper.initialize(initGen.generate(xMesh, vMesh));
        assert(maxAbs(stepper.field()) < 1e-14);
        assert(stepper.externalFieldValues().size() == xMesh.length);
        for (auto val : stepper.externalFieldValues()) assert(val == complex_t(0.0));

        vec_real fieldHistory;
        size_t calls = 0;
        stepper.run([&](size_t step, real_t time, const vec_real& e, const mat_complex&, const vec_complex&)
        {
            ++calls;
            assert(step == calls);
            assert(almost_equal(time, 0.2*step, 1e-13));
            fieldHistory.push_back(maxAbs(e));
        });

        assert(calls == 10);
        assert(stepper.state() == StepperState::Done);
        for (auto val : fieldHistory)
        {
            assert(val < 1e-12);
        }
    }

    // -------------------------------------------------------------------------
    // 3) Mass conservation and layout consistency
    // -------------------------------------------------------------------------
    {
        TimeStepper stepper(xMesh, vMesh, 20.0, 100);
        InitialConditionGenerator initGen(Profile::Landau, 0.05, 0.5);
        stepper.initialize(initGen.generate(xMesh, vMesh));

        const real_t mass0 = totalMass(stepper.distribution(), xMesh, vMesh);
        stepper.run([&](size_t, real_t, const vec_real& e, const mat_complex& f, const vec_complex&)
        {
            assert(std::abs(totalMass(f, xMesh, vMesh) - mass0) < 1e-11*mass0);
            assert(e.size() == xMesh.length);
        });

        mat_complex f_t;
        transpose(stepper.distribution(), f_t);
        const mat_complex& fx = stepper.distributionTransposed();
        assert(fx.size() == vMesh.length);
        for (size_t iv=0; iv<vMesh.length; ++iv)
        {
            for (size_t ix=0; ix<xMesh.length; ++ix)
            {
                assert(fx[iv][ix] == f_t[iv][ix]);
            }
        }
    }

    // -------------------------------------------------------------------------
    // 4) External field: generated at t_i = i·dt, added to the total field
    // -------------------------------------------------------------------------
    {
        std::vector<size_t> requested;
        ExternalFieldGenerator constantField = [&requested](const vec_real& x, size_t step, real_t dt)
        {
            requested.push_back(step);
            assert(almost_equal(dt, 0.1));
            return vec_complex(x.size(), complex_t(0.25, 0.0));
        };

        TimeStepper stepper(xMesh, vMesh, 0.3, 3, constantField);
        InitialConditionGenerator initGen(Profile::Landau, 0.0, 0.5);
        stepper.initialize(initGen.generate(xMesh, vMesh));

        stepper.run([&](size_t, real_t, const vec_real& e, const mat_complex&, const vec_complex& eExt)
        {
            // Uniform plasma: the self-consistent part is zero, only E_ext remains
            for (size_t i=0; i<e.size(); ++i)
            {
                assert(almost_equal(eExt[i], complex_t(0.25, 0.0)));
                assert(almost_equal(e[i], 0.25, 1e-12));
            }
        });

        assert((requested == std::vector<size_t>{0, 1, 2}));
        for (auto val : stepper.externalFieldValues())
        {
            assert(almost_equal(val, complex_t(0.25, 0.0)));
        }
    }

    // -------------------------------------------------------------------------
    // 5) Invalid configuration
    // -------------------------------------------------------------------------
    bool thrownSteps = false, thrownTime = false, thrownShape = false;
    try { TimeStepper bad(xMesh, vMesh, 1.0, 0); } catch (const std::invalid_argument&) { thrownSteps = true; }
    try { TimeStepper bad(xMesh, vMesh, 0.0, 10); } catch (const std::invalid_argument&) { thrownTime = true; }
    try
    {
        TimeStepper stepper(xMesh, vMesh, 1.0, 10);
        stepper.initialize(mat_complex(vMesh.length+1, vec_complex(xMesh.length)));
    }
    catch (const std::invalid_argument&) { thrownShape = true; }
    assert(thrownSteps);
    assert(thrownTime);
    assert(thrownShape);

    return 0;
}
