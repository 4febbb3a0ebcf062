//==============================================================================
// Diagnostics.cpp
// Energy, mass, norm and entropy of the phase-space state.
//==============================================================================

#include "Diagnostics.hpp"

Diagnostics::Diagnostics(const PeriodicMesh& xMesh_, const PeriodicMesh& vMesh_)
    : xMesh(xMesh_), vMesh(vMesh_)
{
}

void Diagnostics::record(size_t step, real_t time, const vec_real& e, const mat_complex& f)
{
    if (e.size() != xMesh.length || f.size() != xMesh.length)
    {
        throw std::invalid_argument("Diagnostics::record: state does not match the spatial mesh!");
    }

    const real_t dx = xMesh.step;
    const real_t dv = vMesh.step;
    const vec_real& v = vMesh.points;

    real_t e2 = 0.0;
    for (auto val : e) e2 += val*val;

    real_t kin = 0.0, m = 0.0, l2 = 0.0, s = 0.0;
    for (size_t ix=0; ix<f.size(); ++ix)
    {
        if (f[ix].size() != vMesh.length)
        {
            throw std::invalid_argument("Diagnostics::record: state does not match the velocity mesh!");
        }

        for (size_t iv=0; iv<f[ix].size(); ++iv)
        {
            real_t fr = f[ix][iv].real();
            kin += fr*v[iv]*v[iv];
            m   += fr;
            l2  += fr*fr;
            if (fr > 0.0) s -= fr*std::log(fr);
        }
    }

    steps.push_back(step);
    times.push_back(time);
    fieldEnergy.push_back(0.5*e2*dx);
    fieldNorm.push_back(std::sqrt(e2*dx));
    kineticEnergy.push_back(0.5*kin*dx*dv);
    totalEnergy.push_back(fieldEnergy.back() + kineticEnergy.back());
    mass.push_back(m*dx*dv);
    l2Norm.push_back(std::sqrt(l2*dx*dv));
    entropy.push_back(s*dx*dv);
}

json Diagnostics::toJson() const
{
    json out;
    out["Step"]          = steps;
    out["Time"]          = times;
    out["FieldEnergy"]   = fieldEnergy;
    out["FieldNorm"]     = fieldNorm;
    out["KineticEnergy"] = kineticEnergy;
    out["TotalEnergy"]   = totalEnergy;
    out["Mass"]          = mass;
    out["L2Norm"]        = l2Norm;
    out["Entropy"]       = entropy;
    return out;
}
