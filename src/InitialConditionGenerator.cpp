//==============================================================================
// InitialConditionGenerator.cpp
// Initial phase-space profiles: perturbed Maxwellian (Landau damping) and a
// symmetric pair of drifting Maxwellians (two-stream instability).
//==============================================================================

#include "InitialConditionGenerator.hpp"

InitialConditionGenerator::InitialConditionGenerator(Profile profile_, real_t epsilon_, real_t kx_, real_t v0_)
    : profile(profile_), epsilon(epsilon_), kx(kx_), v0(v0_)
{
}

Profile InitialConditionGenerator::parseProfile(const std::string& name)
{
    if (name == "Landau")    return Profile::Landau;
    if (name == "TwoStream") return Profile::TwoStream;

    throw std::invalid_argument("Unknown initial condition profile '" + name + "'!");
}

real_t InitialConditionGenerator::evaluate(real_t x, real_t v) const
{
    const real_t norm = 1.0 / std::sqrt(2.0*M_PI);
    const real_t perturbation = 1.0 + epsilon*std::cos(kx*x);

    switch (profile)
    {
        case Profile::Landau:
            return perturbation * norm * std::exp(-0.5*v*v);

        case Profile::TwoStream:
            return perturbation * 0.5 * norm
                   * (std::exp(-0.5*(v-v0)*(v-v0)) + std::exp(-0.5*(v+v0)*(v+v0)));
    }

    throw std::invalid_argument("Unhandled initial condition profile!");
}

//------------------------------------------------------------------------------
// generate: f0[ix][iv] = profile(x_ix, v_iv).
//------------------------------------------------------------------------------
mat_complex InitialConditionGenerator::generate(const PeriodicMesh& xMesh, const PeriodicMesh& vMesh) const
{
    mat_complex f0(xMesh.length, vec_complex(vMesh.length));

    for (size_t ix=0; ix<xMesh.length; ++ix)
    {
        for (size_t iv=0; iv<vMesh.length; ++iv)
        {
            f0[ix][iv] = complex_t(evaluate(xMesh.points[ix], vMesh.points[iv]), 0.0);
        }
    }

    return f0;
}
