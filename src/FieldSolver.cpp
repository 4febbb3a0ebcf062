//==============================================================================
// FieldSolver.cpp
// Charge density reduction and spectral field solve.
//   • computeDensity: ρ(x) = Σ_v Re f(x,v) Δv − mean.
//   • computeField  : Ê_k = −i ρ̂_k / k, Ê_0 forced to 0, back to x-space.
//==============================================================================

#include "FieldSolver.hpp"

FieldSolver::FieldSolver(const PeriodicMesh& xMesh_, const PeriodicMesh& vMesh_)
    : xMesh(xMesh_), vMesh(vMesh_), fft(xMesh_.length, xMesh_.period())
{
}

//------------------------------------------------------------------------------
// computeDensity: sum the real part over the velocity axis of either layout,
// scale by Δv and remove the mean.
//------------------------------------------------------------------------------
vec_real FieldSolver::computeDensity(const mat_complex& f, Layout layout) const
{
    const size_t Nx = xMesh.length;
    const size_t Nv = vMesh.length;

    const size_t rows = (layout == Layout::VelocityLines) ? Nx : Nv;
    const size_t cols = (layout == Layout::VelocityLines) ? Nv : Nx;

    if (f.size() != rows)
    {
        throw std::invalid_argument("computeDensity: phase-space array has "
                                    + std::to_string(f.size()) + " rows, expected "
                                    + std::to_string(rows) + "!");
    }
    for (const auto& row : f)
    {
        if (row.size() != cols)
        {
            throw std::invalid_argument("computeDensity: phase-space row length mismatch!");
        }
    }

    vec_real rho(Nx, 0.0);

    if (layout == Layout::VelocityLines)
    {
        for (size_t ix=0; ix<Nx; ++ix)
        {
            for (size_t iv=0; iv<Nv; ++iv)
            {
                rho[ix] += f[ix][iv].real();
            }
        }
    }
    else
    {
        for (size_t iv=0; iv<Nv; ++iv)
        {
            for (size_t ix=0; ix<Nx; ++ix)
            {
                rho[ix] += f[iv][ix].real();
            }
        }
    }

    real_t mean = 0.0;
    for (auto& r : rho)
    {
        r *= vMesh.step;
        mean += r;
    }
    mean /= static_cast<real_t>(Nx);

    std::for_each(rho.begin(), rho.end(), [mean](auto& r){ r -= mean; });

    return rho;
}

//------------------------------------------------------------------------------
// computeField: spectral Gauss solve. Mode 0 divides by the placeholder 1.0
// and is then set to exactly zero.
//------------------------------------------------------------------------------
vec_real FieldSolver::computeField(const vec_real& density)
{
    if (density.size() != xMesh.length)
    {
        throw std::invalid_argument("computeField: density length does not match the spatial mesh!");
    }

    vec_complex rho_hat;
    fft.forwardFFT(density, rho_hat);

    const vec_real& k = fft.wavenumbers();
    const complex_t minus_i(0.0, -1.0);

    vec_complex e_hat(rho_hat.size());
    for (size_t j=0; j<rho_hat.size(); ++j)
    {
        real_t modulus = (j == 0) ? 1.0 : k[j];
        e_hat[j] = minus_i * rho_hat[j] / modulus;
    }
    e_hat[0] = complex_t(0.0);

    vec_real e;
    fft.backwardFFT(e_hat, e);

    return e;
}
